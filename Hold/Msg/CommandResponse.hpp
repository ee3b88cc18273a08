#ifndef HOLD_MSG_COMMANDRESPONSE_HPP
#define HOLD_MSG_COMMANDRESPONSE_HPP

#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"

namespace Hold { namespace Msg {

/** struct Hold::Msg::CommandResponse
 *
 * @brief emit in response to a `Hold::Msg::CommandRequest`.
 * Extra responses to the same id, or responses to an
 * unknown id, are silently ignored.
 */
struct CommandResponse {
	Ln::CommandId id;
	Json::Out response;
};

}}

#endif /* !defined(HOLD_MSG_COMMANDRESPONSE_HPP) */
