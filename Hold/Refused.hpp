#ifndef HOLD_REFUSED_HPP
#define HOLD_REFUSED_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Hold {

/** struct Hold::Refused
 *
 * @brief a refused operation on a hold invoice,
 * such as settling one that has nothing to settle.
 *
 * @desc The message is meant for the operator and
 * is final: repeating the same call gives the same
 * error.
 */
struct Refused : public Util::BacktraceException<std::runtime_error> {
	explicit
	Refused(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

}

#endif /* !defined(HOLD_REFUSED_HPP) */
