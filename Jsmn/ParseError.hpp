#ifndef JSMN_PARSEERROR_HPP
#define JSMN_PARSEERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>
#include<utility>

namespace Jsmn {

/** class Jsmn::ParseError
 *
 * @brief thrown when lightningd, or the RPC socket,
 * hands us text that is not JSON.
 *
 * @desc The message shows the text around the
 * offending character.
 */
class ParseError : public Util::BacktraceException<std::runtime_error> {
private:
	std::string input;
	unsigned int pos;

	static
	std::string enmessage(std::string const& input, unsigned int i);

public:
	ParseError() =delete;
	ParseError( std::string const& input_
		  , unsigned int pos_
		  ) : Util::BacktraceException<std::runtime_error>(enmessage(input_, pos_))
		    , input(input_)
		    , pos(pos_)
		    { }

	std::string const& text() const { return input; }
	unsigned int position() const { return pos; }
};

}

#endif /* !defined(JSMN_PARSEERROR_HPP) */
