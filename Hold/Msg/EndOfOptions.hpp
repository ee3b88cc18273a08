#ifndef HOLD_MSG_ENDOFOPTIONS_HPP
#define HOLD_MSG_ENDOFOPTIONS_HPP

namespace Hold { namespace Msg {

/** struct Hold::Msg::EndOfOptions
 *
 * @brief raised at initialization, after all
 * `Hold::Msg::Option` messages have been sent.
 */
struct EndOfOptions { };

}}

#endif /* !defined(HOLD_MSG_ENDOFOPTIONS_HPP) */
