#ifndef HOLD_MOD_PARAMERROR_HPP
#define HOLD_MOD_PARAMERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Hold { namespace Mod {

/** struct Hold::Mod::ParamError
 *
 * @brief a command was given missing, extra or
 * malformed parameters.
 */
struct ParamError : public Util::BacktraceException<std::invalid_argument> {
	explicit
	ParamError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};

}}

#endif /* !defined(HOLD_MOD_PARAMERROR_HPP) */
