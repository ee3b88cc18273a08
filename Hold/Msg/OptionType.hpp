#ifndef HOLD_MSG_OPTIONTYPE_HPP
#define HOLD_MSG_OPTIONTYPE_HPP

namespace Hold { namespace Msg {

/** enum Hold::Msg::OptionType
 *
 * @brief the types that a `lightningd` option can have.
 */
enum OptionType {
	OptionType_String,
	OptionType_Bool,
	OptionType_Int,
	OptionType_Flag
};

}}

#endif /* !defined(HOLD_MSG_OPTIONTYPE_HPP) */
