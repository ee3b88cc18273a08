#ifndef HOLD_MSG_COMMANDREQUEST_HPP
#define HOLD_MSG_COMMANDREQUEST_HPP

#include"Jsmn/Object.hpp"
#include"Ln/CommandId.hpp"
#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::CommandRequest
 *
 * @brief emitted whenever a command or hook is
 * received on stdin.
 * Respond with `Hold::Msg::CommandResponse` or
 * `Hold::Msg::CommandFail`.
 */
struct CommandRequest {
	std::string command;
	Jsmn::Object params;
	Ln::CommandId id;
};

}}

#endif /* !defined(HOLD_MSG_COMMANDREQUEST_HPP) */
