#ifndef HOLD_JSONINPUT_HPP
#define HOLD_JSONINPUT_HPP

#include<istream>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace S { class Bus; }

namespace Hold {

/** class Hold::JsonInput
 *
 * @brief reads JSON-RPC messages from lightningd on
 * the plugin stdin, raising a `Hold::Msg::JsonCin`
 * for each.
 *
 * @desc The `run` action completes once stdin hits
 * end-of-file, which is how lightningd tells a
 * plugin to exit.
 */
class JsonInput {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	JsonInput( Ev::ThreadPool& threadpool
		 , std::istream& cin
		 , S::Bus& bus
		 );
	JsonInput(JsonInput&&);
	~JsonInput();

	Ev::Io<void> run();
};

}

#endif /* !defined(HOLD_JSONINPUT_HPP) */
