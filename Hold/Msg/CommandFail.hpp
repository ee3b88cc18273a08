#ifndef HOLD_MSG_COMMANDFAIL_HPP
#define HOLD_MSG_COMMANDFAIL_HPP

#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"
#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::CommandFail
 *
 * @brief emit in response to a `Hold::Msg::CommandRequest`,
 * to indicate that the command failed.
 */
struct CommandFail {
	Ln::CommandId id;
	int code;
	std::string message;
	Json::Out data;
};

}}

#endif /* !defined(HOLD_MSG_COMMANDFAIL_HPP) */
