#ifndef HOLD_MSG_MANIFESTOPTION_HPP
#define HOLD_MSG_MANIFESTOPTION_HPP

#include"Hold/Msg/OptionType.hpp"
#include"Json/Out.hpp"
#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::ManifestOption
 *
 * @brief emit in response to `Hold::Msg::Manifestation`
 * to register an option.
 */
struct ManifestOption {
	std::string name;
	OptionType type;
	Json::Out default_value;
	std::string description;
};

}}

#endif /* !defined(HOLD_MSG_MANIFESTOPTION_HPP) */
