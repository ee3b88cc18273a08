#include"Ev/Io.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Mod/Params.hpp"
#include"Hold/Mod/ResolveCommand.hpp"
#include"Hold/Mod/respond.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/Msg/ManifestCommand.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"

namespace Hold { namespace Mod {

class ResolveCommand::Impl {
private:
	S::Bus& bus;
	Hold::Engine* engine;

	Hold::Engine& get_engine() {
		if (!engine)
			throw std::runtime_error("hold invoice engine not ready");
		return *engine;
	}

	Ev::Io<Json::Out> settle(Jsmn::Object const& params) {
		auto p = Params(params, {"preimage"});
		return get_engine().settle(p.preimage("preimage")).then([]() {
			return Ev::lift(Json::Out::empty_object());
		});
	}
	Ev::Io<Json::Out> cancel(Jsmn::Object const& params) {
		auto p = Params(params, {"payment_hash"});
		return get_engine().cancel(p.hash("payment_hash")).then([]() {
			return Ev::lift(Json::Out::empty_object());
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), engine(nullptr) {
		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestCommand{
				"settleholdinvoice", "preimage",
				"Settle the held payment whose payment hash "
				"is the SHA256 of {preimage}.",
				false
			}) + bus.raise(Msg::ManifestCommand{
				"cancelholdinvoice", "payment_hash",
				"Cancel the hold invoice of {payment_hash}, "
				"failing any held payment.",
				false
			});
		});
		bus.subscribe<Msg::EngineReady>([this](Msg::EngineReady const& m) {
			engine = &m.engine;
			return Ev::lift();
		});
		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& r) {
			auto params = r.params;
			if (r.command == "settleholdinvoice")
				return respond( bus, r.id
					      , "could not settle invoice: "
					      , Ev::lift().then([this, params]() {
					return settle(params);
				}));
			if (r.command == "cancelholdinvoice")
				return respond( bus, r.id
					      , "could not cancel invoice: "
					      , Ev::lift().then([this, params]() {
					return cancel(params);
				}));
			return Ev::lift();
		});
	}
};

ResolveCommand::ResolveCommand(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
ResolveCommand::ResolveCommand(ResolveCommand&&) =default;
ResolveCommand::~ResolveCommand() =default;

}}
