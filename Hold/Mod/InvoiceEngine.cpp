#include"Ev/Io.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Journal.hpp"
#include"Hold/Mod/InvoiceEngine.hpp"
#include"Hold/Msg/Block.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/Msg/Init.hpp"
#include"Hold/Msg/PolicyResource.hpp"
#include"Hold/Msg/ReleaseHtlc.hpp"
#include"Hold/ResolverIF.hpp"
#include"Hold/Shutdown.hpp"
#include"Hold/log.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"

namespace Hold { namespace Mod {

class InvoiceEngine::Impl : public ResolverIF {
private:
	S::Bus& bus;
	Hold::Policy policy;
	Hold::Journal journal;
	std::unique_ptr<Hold::Engine> engine;

	void start() {
		bus.subscribe<Msg::PolicyResource>([this](Msg::PolicyResource const& m) {
			policy = m.policy;
			return Ev::lift();
		});
		bus.subscribe<Msg::Init>([this](Msg::Init const& init) {
			engine = Util::make_unique<Hold::Engine>(
				bus, init.db, journal, *this, policy
			);
			auto height = init.blockheight;
			return engine->init().then([this, height]() {
				if (height == 0)
					return Ev::lift();
				return engine->block(height);
			}).then([this]() {
				return Hold::log( bus, Debug
						, "InvoiceEngine: ready at "
						  "height %u."
						, (unsigned) engine->height()
						);
			}).then([this]() {
				return bus.raise(Msg::EngineReady{
					*engine, journal
				});
			});
		});
		bus.subscribe<Msg::Block>([this](Msg::Block const& b) {
			if (!engine)
				return Ev::lift();
			return engine->block(b.height);
		});
		bus.subscribe<Hold::Shutdown>([this](Hold::Shutdown const&) {
			journal.shutdown();
			return Ev::lift();
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_) { start(); }

	Ev::Io<void> resolve( HtlcKey const& key
			    , Decision const& decision
			    ) override {
		return bus.raise(Msg::ReleaseHtlc{key, decision});
	}
};

InvoiceEngine::InvoiceEngine(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
InvoiceEngine::InvoiceEngine(InvoiceEngine&&) =default;
InvoiceEngine::~InvoiceEngine() =default;

}}
