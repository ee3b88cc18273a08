#ifndef HOLD_MOD_JSONOUTPUTTER_HPP
#define HOLD_MOD_JSONOUTPUTTER_HPP

#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::JsonOutputter
 *
 * @brief writes each `Hold::Msg::JsonCout` to stdout
 * as a single line, in the order raised.
 */
class JsonOutputter {
private:
	std::ostream& cout;
	std::queue<std::string> lines;

	Ev::Io<void> drain();

public:
	JsonOutputter( std::ostream& cout
		     , S::Bus& bus
		     );
};

}}

#endif /* !defined(HOLD_MOD_JSONOUTPUTTER_HPP) */
