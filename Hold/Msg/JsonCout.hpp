#ifndef HOLD_MSG_JSONCOUT_HPP
#define HOLD_MSG_JSONCOUT_HPP

#include"Json/Out.hpp"

namespace Hold { namespace Msg {

/** struct Hold::Msg::JsonCout
 *
 * @brief a JSON object to be written to lightningd,
 * one per line.
 */
struct JsonCout {
	Json::Out obj;
};

}}

#endif /* !defined(HOLD_MSG_JSONCOUT_HPP) */
