#include"Ev/Io.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Journal.hpp"
#include"Hold/Mod/ParamError.hpp"
#include"Hold/Mod/Params.hpp"
#include"Hold/Mod/TrackCommand.hpp"
#include"Hold/Mod/Waiter.hpp"
#include"Hold/Mod/jsonify.hpp"
#include"Hold/Mod/respond.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/Msg/ManifestCommand.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>

namespace {

/* State of one `trackholdinvoice` call.  */
struct Tracking {
	Sha256::Hash payment_hash;
	std::vector<Hold::State> states;
	std::unique_ptr<Hold::Journal::Subscription> sub;
};

/* State of one `trackallholdinvoices` call.  */
struct Polling {
	std::vector<Hold::Transition> events;
	/* Cursor to report as `next`.  */
	std::uint64_t next;
	Hold::Journal::Filter filter;
	std::unique_ptr<Hold::Journal::Subscription> sub;
};

}

namespace Hold { namespace Mod {

class TrackCommand::Impl {
private:
	S::Bus& bus;
	Waiter& waiter;
	Hold::Engine* engine;
	Hold::Journal* journal;

	Hold::Engine& get_engine() {
		if (!engine)
			throw std::runtime_error("hold invoice engine not ready");
		return *engine;
	}

	/* trackholdinvoice.  */

	Ev::Io<Json::Out> track(Jsmn::Object const& params) {
		auto p = Params(params, {"payment_hash"});
		auto hash = p.hash("payment_hash");
		return get_engine().track(hash).then([this, hash](std::shared_ptr<Engine::TrackStart> start) {
			auto tr = std::make_shared<Tracking>();
			tr->payment_hash = hash;
			tr->states = std::move(start->states);
			tr->sub = std::move(start->sub);
			return track_loop(tr).then([tr]() {
				auto rv = Json::Out();
				auto arr = rv.start_object()
					.field( "payment_hash"
					      , std::string(tr->payment_hash)
					      )
					.start_array("states")
					;
				for (auto s : tr->states)
					arr.entry(to_string(s));
				arr.end_array().end_object();
				return Ev::lift(std::move(rv));
			});
		});
	}
	Ev::Io<void> track_loop(std::shared_ptr<Tracking> tr) {
		return track_step(tr).then([this, tr](bool more) {
			if (!more)
				return Ev::lift();
			return track_loop(tr);
		});
	}
	/* False once the invoice is final.  */
	Ev::Io<bool> track_step(std::shared_ptr<Tracking> tr) {
		if (is_final(tr->states.back()))
			return Ev::lift(false);
		return tr->sub->next().then([tr](std::shared_ptr<Transition> t) {
			if (!t)
				return Ev::lift(false);
			if (t->state != tr->states.back())
				tr->states.push_back(t->state);
			return Ev::lift(true);
		}).catching<Hold::Lagged>([this, tr](Hold::Lagged const&) {
			/* Start over from the stored state.  */
			return get_engine().track(tr->payment_hash).then([tr](std::shared_ptr<Engine::TrackStart> start) {
				if (start->states.back() != tr->states.back())
					tr->states.push_back(start->states.back());
				tr->sub = std::move(start->sub);
				return Ev::lift(true);
			});
		});
	}

	/* trackallholdinvoices.  */

	static
	std::shared_ptr<std::vector<Sha256::Hash>>
	parse_hashes(Params const& p) {
		if (!p.has("payment_hashes"))
			return nullptr;
		auto js = p.get("payment_hashes");
		if (!js.is_array())
			throw ParamError("payment_hashes must be an array");
		auto rv = std::make_shared<std::vector<Sha256::Hash>>();
		for (auto h : js) {
			if (!h.is_string() || !Sha256::Hash::valid_string(std::string(h)))
				throw ParamError( "payment_hashes entries must "
						  "be 64 hex digits"
						);
			rv->push_back(Sha256::Hash(std::string(h)));
		}
		return rv;
	}

	Ev::Io<Json::Out> track_all(Jsmn::Object const& params) {
		auto p = Params(params, { "payment_hashes"
					, "since"
					, "timeout"
					});
		auto hashes = parse_hashes(p);
		auto timeout = p.has("timeout") ? p.u64("timeout")
						: std::uint64_t(0)
						;
		auto& eng = get_engine();

		auto pl = std::make_shared<Polling>();
		pl->filter = Engine::transition_filter(hashes, true);

		if (p.has("since")) {
			auto since = p.u64("since");
			pl->events = journal->since(since, pl->filter);
			pl->next = std::max(since, journal->last_seq());
			if (!pl->events.empty() || timeout == 0)
				return Ev::lift(result(pl));
			/* Nothing can be appended between the
			 * query and the subscription.  */
			pl->sub = journal->subscribe(pl->filter);
			return wait_events(pl, timeout).then([pl]() {
				return Ev::lift(result(pl));
			});
		}

		return eng.track_all(hashes, true).then([ this
							, pl
							, timeout
							](std::shared_ptr<Engine::TrackAllStart> start) {
			pl->events = std::move(start->catchup);
			pl->next = start->seq;
			pl->sub = std::move(start->sub);
			auto act = (pl->events.empty() && timeout != 0)
				 ? wait_events(pl, timeout)
				 : drain(pl)
				 ;
			return act.then([pl]() {
				return Ev::lift(result(pl));
			});
		});
	}

	static
	void take(std::shared_ptr<Polling> const& pl, Transition t) {
		pl->next = std::max(pl->next, t.seq);
		pl->events.push_back(std::move(t));
	}

	/* Wait for the first live transition, then take
	 * whatever else is already queued.  */
	Ev::Io<void> wait_events( std::shared_ptr<Polling> pl
				, std::uint64_t timeout
				) {
		auto first = waiter.timed( double(timeout)
					 , pl->sub->next()
					 );
		return first.then([this, pl](std::shared_ptr<Transition> t) {
			if (!t)
				return Ev::lift();
			take(pl, std::move(*t));
			return drain(pl);
		}).catching<Waiter::TimedOut>([](Waiter::TimedOut const&) {
			return Ev::lift();
		}).catching<Hold::Lagged>([this, pl](Hold::Lagged const&) {
			lagged(pl);
			return Ev::lift();
		});
	}

	/* Take everything queued, without waiting.  */
	Ev::Io<void> drain(std::shared_ptr<Polling> pl) {
		if (pl->sub->pending() == 0)
			return Ev::lift();
		return pl->sub->next().then([this, pl](std::shared_ptr<Transition> t) {
			if (!t)
				return Ev::lift();
			take(pl, std::move(*t));
			return drain(pl);
		}).catching<Hold::Lagged>([this, pl](Hold::Lagged const&) {
			lagged(pl);
			return Ev::lift();
		});
	}

	/* The queue overflowed; what it dropped may still
	 * be in the journal history.  */
	void lagged(std::shared_ptr<Polling> const& pl) {
		for (auto& t : journal->since(pl->next, pl->filter))
			take(pl, std::move(t));
		pl->next = std::max(pl->next, journal->last_seq());
	}

	static
	Json::Out result(std::shared_ptr<Polling> const& pl) {
		/* Unsubscribe.  */
		pl->sub = nullptr;

		auto rv = Json::Out();
		auto arr = rv.start_object().start_array("events");
		for (auto const& t : pl->events)
			arr.entry(jsonify(t));
		arr.end_array()
			.field("next", pl->next)
		.end_object();
		return rv;
	}

public:
	Impl(S::Bus& bus_, Waiter& waiter_)
		: bus(bus_), waiter(waiter_)
		, engine(nullptr), journal(nullptr) {
		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestCommand{
				"trackholdinvoice",
				"payment_hash",
				"Wait until the hold invoice of {payment_hash} "
				"is paid or cancelled, and list the states it "
				"went through.",
				false
			}) + bus.raise(Msg::ManifestCommand{
				"trackallholdinvoices",
				"[payment_hashes] [since] [timeout]",
				"Get hold invoice transitions after the "
				"cursor {since}, waiting up to {timeout} "
				"seconds for one.",
				false
			});
		});
		bus.subscribe<Msg::EngineReady>([this](Msg::EngineReady const& m) {
			engine = &m.engine;
			journal = &m.journal;
			return Ev::lift();
		});
		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& r) {
			auto params = r.params;
			if (r.command == "trackholdinvoice")
				return respond( bus, r.id
					      , "could not track invoice: "
					      , Ev::lift().then([this, params]() {
					return track(params);
				}));
			if (r.command == "trackallholdinvoices")
				return respond( bus, r.id
					      , "could not track invoices: "
					      , Ev::lift().then([this, params]() {
					return track_all(params);
				}));
			return Ev::lift();
		});
	}
};

TrackCommand::TrackCommand(S::Bus& bus, Waiter& waiter)
	: pimpl(Util::make_unique<Impl>(bus, waiter)) { }
TrackCommand::TrackCommand(TrackCommand&&) =default;
TrackCommand::~TrackCommand() =default;

}}
