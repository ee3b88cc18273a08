#ifndef HOLD_MSG_MANIFESTNOTIFICATION_HPP
#define HOLD_MSG_MANIFESTNOTIFICATION_HPP

#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::ManifestNotification
 *
 * @brief emitted in response to `Hold::Msg::Manifestation`
 * to subscribe to a notification, or, with `emit` set,
 * to declare a custom notification we send.
 */
struct ManifestNotification {
	std::string name;
	bool emit;
};

}}

#endif /* !defined(HOLD_MSG_MANIFESTNOTIFICATION_HPP) */
