#ifndef HOLD_MSG_MANIFESTATION_HPP
#define HOLD_MSG_MANIFESTATION_HPP

namespace Hold { namespace Msg {

/** struct Hold::Msg::Manifestation
 *
 * @brief emitted during `getmanifest`.
 * Modules triggering on this message should emit
 * `Hold::Msg::Manifest*` messages.
 */
struct Manifestation {};

}}

#endif /* !defined(HOLD_MSG_MANIFESTATION_HPP) */
