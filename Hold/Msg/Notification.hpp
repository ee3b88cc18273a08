#ifndef HOLD_MSG_NOTIFICATION_HPP
#define HOLD_MSG_NOTIFICATION_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::Notification
 *
 * @brief emitted whenever a notification is
 * received on stdin.
 */
struct Notification {
	std::string notification;
	Jsmn::Object params;
};

}}

#endif /* !defined(HOLD_MSG_NOTIFICATION_HPP) */
