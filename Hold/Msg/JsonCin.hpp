#ifndef HOLD_MSG_JSONCIN_HPP
#define HOLD_MSG_JSONCIN_HPP

#include"Jsmn/Object.hpp"

namespace Hold { namespace Msg {

/** struct Hold::Msg::JsonCin
 *
 * @brief one JSON object read from lightningd.
 */
struct JsonCin {
	Jsmn::Object obj;
};

}}

#endif /* !defined(HOLD_MSG_JSONCIN_HPP) */
