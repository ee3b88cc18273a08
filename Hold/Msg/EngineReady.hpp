#ifndef HOLD_MSG_ENGINEREADY_HPP
#define HOLD_MSG_ENGINEREADY_HPP

namespace Hold { class Engine; }
namespace Hold { class Journal; }

namespace Hold { namespace Msg {

/** struct Hold::Msg::EngineReady
 *
 * @brief raised once the invoice engine has opened
 * its tables.
 *
 * @desc Both objects live until the plugin exits.
 * Commands arriving before this are answered with an
 * error.
 */
struct EngineReady {
	Hold::Engine& engine;
	Hold::Journal& journal;
};

}}

#endif /* !defined(HOLD_MSG_ENGINEREADY_HPP) */
