#ifndef HOLD_MSG_OPTION_HPP
#define HOLD_MSG_OPTION_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::Option
 *
 * @brief emitted during `init` handling, with the value
 * of an option that we registered.
 */
struct Option {
	std::string name;
	Jsmn::Object value;
};

}}

#endif /* !defined(HOLD_MSG_OPTION_HPP) */
