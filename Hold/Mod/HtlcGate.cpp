#include"Ev/Io.hpp"
#include"Hold/Decision.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Mod/HtlcGate.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/CommandResponse.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/Msg/ManifestHook.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Hold/Msg/ReleaseHtlc.hpp"
#include"Hold/ResolverIF.hpp"
#include"Hold/log.hpp"
#include"Json/Out.hpp"
#include"Ln/HtlcAccepted.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<sstream>
#include<unordered_map>

namespace Hold { namespace Mod {

class HtlcGate::Impl {
private:
	S::Bus& bus;
	Hold::Engine* engine;

	/* Hook calls we have not answered yet.  */
	std::unordered_map<HtlcKey, Ln::CommandId> held;
	/* Releases that overtook the hold decision of
	 * their HTLC.  */
	std::unordered_map<HtlcKey, Decision> early;

	Ev::Io<void> answer(Ln::CommandId const& id, Decision const& d) {
		return bus.raise(Msg::CommandResponse{id, d.to_json()});
	}
	Ev::Io<void> answer_continue(Ln::CommandId const& id) {
		return answer(id, Decision::cont());
	}

	Ev::Io<void> decided( Ln::CommandId id
			    , HtlcKey key
			    , Decision d
			    ) {
		auto it = early.find(key);
		if (it != early.end()) {
			auto released = it->second;
			early.erase(it);
			if (d.kind() == Decision::Kind_Hold)
				return answer(id, released);
		}
		if (d.kind() == Decision::Kind_Hold) {
			held.insert(std::make_pair(key, id));
			return Ev::lift();
		}
		return answer(id, d);
	}

	Ev::Io<void> on_htlc(Ln::CommandId id, Jsmn::Object params) {
		auto req = Ln::HtlcAccepted::Request();
		try {
			req = Ln::HtlcAccepted::Request::parse(id, params);
		} catch (std::exception const& e) {
			auto os = std::ostringstream();
			os << params;
			return Hold::log( bus, Error
					, "HtlcGate: bad htlc_accepted "
					  "payload (%s): %s"
					, e.what()
					, os.str().c_str()
					)
			     + answer_continue(id)
			     ;
		}
		if (req.is_forward || !engine)
			return answer_continue(id);

		auto key = HtlcKey{req.scid, req.htlc_id, req.payment_hash};
		return engine->htlc(req).then([this, id, key](Decision d) {
			return decided(id, key, std::move(d));
		}).catching<std::exception>([this, id](std::exception const& e) {
			return Hold::log( bus, Error
					, "HtlcGate: %s"
					, e.what()
					)
			     + answer_continue(id)
			     ;
		});
	}

	void start() {
		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestHook{"htlc_accepted"});
		});
		bus.subscribe<Msg::EngineReady>([this](Msg::EngineReady const& m) {
			engine = &m.engine;
			return Ev::lift();
		});
		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& r) {
			if (r.command != "htlc_accepted")
				return Ev::lift();
			return on_htlc(r.id, r.params);
		});
		bus.subscribe<Msg::ReleaseHtlc>([this](Msg::ReleaseHtlc const& r) {
			auto it = held.find(r.key);
			if (it == held.end()) {
				early.erase(r.key);
				early.insert(std::make_pair(r.key, r.decision));
				return Ev::lift();
			}
			auto id = it->second;
			held.erase(it);
			return answer(id, r.decision);
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), engine(nullptr) { start(); }
};

HtlcGate::HtlcGate(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
HtlcGate::HtlcGate(HtlcGate&&) =default;
HtlcGate::~HtlcGate() =default;

}}
