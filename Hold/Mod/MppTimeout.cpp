#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Mod/MppTimeout.hpp"
#include"Hold/Mod/Waiter.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/concurrent.hpp"
#include"Hold/log.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"

namespace Hold { namespace Mod {

class MppTimeout::Impl {
private:
	S::Bus& bus;
	Waiter& waiter;
	Hold::Engine* engine;

	/* Parts time out between `mpp_timeout` and
	 * `mpp_timeout + period` after the last one came.  */
	double period() const {
		auto p = engine->policy().mpp_timeout / 4;
		if (p < 1)
			p = 1;
		return p;
	}

	Ev::Io<void> loop() {
		return waiter.wait(period()).then([this]() {
			return engine->sweep_mpp(Ev::now());
		}).catching<std::exception>([this](std::exception const& e) {
			return Hold::log( bus, Error
					, "MppTimeout: %s"
					, e.what()
					);
		}).then([this]() {
			return loop();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Waiter& waiter_
	    ) : bus(bus_), waiter(waiter_), engine(nullptr) {
		bus.subscribe<Msg::EngineReady>([this](Msg::EngineReady const& m) {
			engine = &m.engine;
			return Hold::concurrent(loop());
		});
	}
};

MppTimeout::MppTimeout(S::Bus& bus, Waiter& waiter)
	: pimpl(Util::make_unique<Impl>(bus, waiter)) { }
MppTimeout::MppTimeout(MppTimeout&&) =default;
MppTimeout::~MppTimeout() =default;

}}
