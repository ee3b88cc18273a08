#include"Jsmn/ParseError.hpp"
#include"Jsmn/Detail/Str.hpp"
#include<algorithm>

namespace {

/* Characters of input shown on each side of the error.  */
auto const context = std::size_t(16);

}

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, unsigned int i) {
	auto pos = std::min(std::size_t(i), input.size());
	auto start = pos > context ? pos - context : std::size_t(0);
	auto end = std::min(input.size(), pos + context);
	return std::string("Parse error at character ")
	     + std::to_string(pos)
	     + " near \""
	     + Jsmn::Detail::Str::to_escaped(input.substr(start, end - start))
	     + "\""
	     ;
}

}
