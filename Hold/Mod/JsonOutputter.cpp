#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Hold/Mod/JsonOutputter.hpp"
#include"Hold/Msg/JsonCout.hpp"
#include"Hold/concurrent.hpp"
#include"S/Bus.hpp"

namespace Hold { namespace Mod {

JsonOutputter::JsonOutputter( std::ostream& cout_
			    , S::Bus& bus
			    ) : cout(cout_) {
	bus.subscribe<Msg::JsonCout>([this](Msg::JsonCout const& m) {
		auto idle = lines.empty();
		lines.push(m.obj.output());
		/* A drain is already scheduled.  */
		if (!idle)
			return Ev::lift();
		return Hold::concurrent(drain());
	});
}

Ev::Io<void> JsonOutputter::drain() {
	return Ev::yield().then([this]() {
		if (lines.empty())
			return Ev::lift();
		/* lightningd reads one object per line; the
		 * blank line after terminates it.  */
		cout << lines.front() << "\n" << std::endl;
		lines.pop();
		return drain();
	});
}

}}
