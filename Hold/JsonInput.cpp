#include"Ev/ThreadPool.hpp"
#include"Hold/JsonInput.hpp"
#include"Hold/Msg/JsonCin.hpp"
#include"Jsmn/Object.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>

namespace Hold {

class JsonInput::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::istream& cin;
	S::Bus& bus;

	/* Blocking, so only call from the threadpool.
	 * Null at end-of-file.  */
	std::shared_ptr<Jsmn::Object> read_one() {
		cin >> std::ws;
		if (!cin || cin.eof())
			return nullptr;
		auto obj = std::make_shared<Jsmn::Object>();
		cin >> *obj;
		if (!cin)
			return nullptr;
		return obj;
	}

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::istream& cin_
	    , S::Bus& bus_
	    ) : threadpool(threadpool_)
	      , cin(cin_)
	      , bus(bus_)
	      { }

	Ev::Io<void> run() {
		return threadpool.background<std::shared_ptr<Jsmn::Object>>([this]() {
			return read_one();
		}).then([this](std::shared_ptr<Jsmn::Object> pobj) {
			if (!pobj)
				return Ev::lift();
			return bus.raise(Hold::Msg::JsonCin{std::move(*pobj)})
			     + run()
			     ;
		});
	}
};

JsonInput::JsonInput( Ev::ThreadPool& threadpool
		    , std::istream& cin
		    , S::Bus& bus
		    ) : pimpl(Util::make_unique<Impl>(threadpool, cin, bus)) { }
JsonInput::JsonInput(JsonInput&&) =default;
JsonInput::~JsonInput() =default;

Ev::Io<void> JsonInput::run() {
	assert(pimpl);
	return pimpl->run();
}

}
