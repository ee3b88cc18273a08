#ifndef HOLD_MOD_JSONIFY_HPP
#define HOLD_MOD_JSONIFY_HPP

namespace Hold { struct Invoice; }
namespace Hold { struct Transition; }
namespace Json { class Out; }

namespace Hold { namespace Mod {

/* One event of `trackallholdinvoices` and of the
 * `holdinvoice_update` notification.  */
Json::Out jsonify(Hold::Transition const&);

/* One entry of `listholdinvoices`.  The preimage is
 * only shown once paid.  */
Json::Out jsonify(Hold::Invoice const&);

}}

#endif /* !defined(HOLD_MOD_JSONIFY_HPP) */
