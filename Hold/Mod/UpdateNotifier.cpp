#include"Ev/Io.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Journal.hpp"
#include"Hold/Mod/UpdateNotifier.hpp"
#include"Hold/Mod/jsonify.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/Msg/JsonCout.hpp"
#include"Hold/Msg/ManifestNotification.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Hold/concurrent.hpp"
#include"Hold/log.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"

namespace Hold { namespace Mod {

class UpdateNotifier::Impl {
private:
	S::Bus& bus;
	Hold::Journal* journal;
	Hold::Journal::Filter filter;
	std::shared_ptr<Hold::Journal::Subscription> sub;
	/* Last sequence number sent.  */
	std::uint64_t sent;

	Ev::Io<void> emit(Hold::Transition const& t) {
		sent = t.seq;
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("method", std::string("holdinvoice_update"))
				.start_object("params")
					.field("holdinvoice_update", jsonify(t))
				.end_object()
			.end_object()
			;
		return bus.raise(Msg::JsonCout{std::move(js)});
	}

	Ev::Io<void> loop() {
		return step().then([this](bool more) {
			if (!more)
				return Ev::lift();
			return loop();
		});
	}
	/* False once cancelled.  */
	Ev::Io<bool> step() {
		auto s = sub;
		return s->next().then([this, s](std::shared_ptr<Hold::Transition> t) {
			if (!t)
				return Ev::lift(false);
			return emit(*t).then([]() {
				return Ev::lift(true);
			});
		}).catching<Hold::Lagged>([this](Hold::Lagged const&) {
			return recover().then([]() {
				return Ev::lift(true);
			});
		});
	}

	/* Catch up from history and subscribe again, in
	 * one go so nothing is appended in between.  */
	Ev::Io<void> recover() {
		auto retained = journal->since(sent);
		auto first = retained.empty() ? journal->last_seq() + 1
					      : retained.front().seq
					      ;
		sub = journal->subscribe(filter);

		auto act = Ev::lift();
		if (first > sent + 1)
			act += Hold::log( bus, Warn
					, "UpdateNotifier: lagged, updates "
					  "%llu to %llu are lost."
					, (unsigned long long) (sent + 1)
					, (unsigned long long) (first - 1)
					);
		for (auto const& t : retained)
			if (filter(t))
				act += emit(t);
		return act;
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), journal(nullptr), sent(0) {
		filter = Hold::Engine::transition_filter(nullptr, false);

		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestNotification{
				"holdinvoice_update", true
			});
		});
		bus.subscribe<Msg::EngineReady>([this](Msg::EngineReady const& m) {
			journal = &m.journal;
			sent = journal->last_seq();
			sub = journal->subscribe(filter);
			return Hold::concurrent(loop());
		});
	}
};

UpdateNotifier::UpdateNotifier(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
UpdateNotifier::UpdateNotifier(UpdateNotifier&&) =default;
UpdateNotifier::~UpdateNotifier() =default;

}}
