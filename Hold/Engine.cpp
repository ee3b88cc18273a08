#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Hold/Engine.hpp"
#include"Hold/LockTable.hpp"
#include"Hold/Refused.hpp"
#include"Hold/ResolverIF.hpp"
#include"Hold/log.hpp"
#include"Ln/Bolt11.hpp"
#include"Ln/FailureMessage.hpp"
#include"Ln/HtlcAccepted.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<memory>
#include<unordered_map>
#include<unordered_set>
#include<utility>

namespace {

std::uint64_t now_secs() {
	return std::uint64_t(Ev::now());
}

/* Each invoice in turn, so that their log lines and
 * journal entries come out in order.  */
Ev::Io<void> in_turn( std::function<Ev::Io<void>(Sha256::Hash)> f
		    , std::shared_ptr<std::vector<Sha256::Hash>> hashes
		    , std::size_t i = 0
		    ) {
	if (i >= hashes->size())
		return Ev::lift();
	return f((*hashes)[i]).then([f, hashes, i]() {
		return in_turn(f, hashes, i + 1);
	});
}

/* What a change does once it is committed.  */
struct Effects {
	std::vector<Hold::Transition> events;
	std::vector<std::pair<Hold::HtlcKey, Hold::Decision>> resolutions;
	std::vector<std::pair<Hold::LogLevel, std::string>> logs;

	void log(Hold::LogLevel l, std::string msg) {
		logs.emplace_back(l, std::move(msg));
	}
};

Hold::Transition invoice_event(Hold::Invoice const& inv) {
	auto t = Hold::Transition();
	t.payment_hash = inv.payment_hash;
	t.bolt11 = inv.bolt11;
	t.state = inv.state;
	return t;
}
Hold::Transition htlc_event( Hold::Invoice const& inv
			   , Hold::Htlc const& h
			   ) {
	auto t = invoice_event(inv);
	t.state = h.state;
	t.is_htlc = true;
	t.scid = h.scid;
	t.htlc_id = h.htlc_id;
	t.msat = h.msat;
	return t;
}

Hold::HtlcKey key_of(Hold::Invoice const& inv, Hold::Htlc const& h) {
	return Hold::HtlcKey{h.scid, h.htlc_id, inv.payment_hash};
}

std::string describe(Hold::Invoice const& inv, Hold::Htlc const& h) {
	return std::string(h.scid) + "/" + std::to_string(h.htlc_id)
	     + " of " + std::string(inv.payment_hash)
	     ;
}

/* Final CLTV delta the invoice asks for.  */
std::uint32_t min_cltv_of(Hold::Invoice const& inv) {
	if (inv.min_cltv != 0)
		return inv.min_cltv;
	return Ln::Bolt11::decode(inv.bolt11).min_final_cltv_expiry;
}

/* Largest accepted total, saturating.  */
std::uint64_t bound_of(Hold::Invoice const& inv, std::uint64_t factor) {
	auto a = inv.amount.to_msat();
	if (factor != 0 && a > UINT64_MAX / factor)
		return UINT64_MAX;
	return a * factor;
}

}

namespace Hold {

class Engine::Impl {
public:
	S::Bus& bus;
	Sqlite3::Db db;
	Journal& journal;
	ResolverIF& resolver;
	Policy policy;

	LockTable locks;
	std::uint32_t height;
	/* Arrival time of the latest part of each unpaid
	 * invoice with live parts.  */
	std::unordered_map<Sha256::Hash, double> partials;

	Impl( S::Bus& bus_
	    , Sqlite3::Db db_
	    , Journal& journal_
	    , ResolverIF& resolver_
	    , Policy policy_
	    ) : bus(bus_)
	      , db(std::move(db_))
	      , journal(journal_)
	      , resolver(resolver_)
	      , policy(std::move(policy_))
	      , height(0)
	      { }

	/* Must be called right after the commit.  */
	Ev::Io<void> publish(std::shared_ptr<Effects> fx) {
		for (auto const& t : fx->events)
			journal.append(t);
		auto act = Ev::lift();
		for (auto const& l : fx->logs)
			act += Hold::log(bus, l.first, "%s", l.second.c_str());
		for (auto const& r : fx->resolutions)
			act += resolver.resolve(r.first, r.second);
		return act;
	}

	Decision incorrect(Ln::Amount msat) const {
		return Decision::fail(
			Ln::FailureMessage::incorrect_or_unknown_payment_details(
				msat, height
			)
		);
	}

	void fail_htlc( Sqlite3::Tx& tx
		      , Invoice const& inv
		      , Htlc& h
		      , Decision d
		      , Effects& fx
		      ) {
		h.state = State_Cancelled;
		Store::set_htlc_state(tx, h.id, h.state);
		fx.events.push_back(htlc_event(inv, h));
		fx.resolutions.emplace_back(key_of(inv, h), std::move(d));
	}
	/* Fail every live HTLC with `incorrect` and cancel
	 * the invoice.  */
	void cancel_invoice(Sqlite3::Tx& tx, Invoice& inv, Effects& fx) {
		for (auto& h : inv.htlcs) {
			if (h.state != State_Accepted)
				continue;
			fail_htlc(tx, inv, h, incorrect(h.msat), fx);
		}
		inv.state = State_Cancelled;
		Store::update_invoice(tx, inv);
		fx.events.push_back(invoice_event(inv));
		partials.erase(inv.payment_hash);
	}

	Decision gate( Sqlite3::Tx& tx
		     , Ln::HtlcAccepted::Request const& req
		     , Effects& fx
		     ) {
		auto inv = Store::get_invoice(tx, req.payment_hash);
		if (!inv)
			return Decision::cont();

		/* lightningd replays hooks it did not get an
		 * answer to before a restart.  */
		for (auto const& h : inv->htlcs) {
			if (h.scid != req.scid || h.htlc_id != req.htlc_id)
				continue;
			switch (h.state) {
			case State_Accepted:
				if (inv->state == State_Unpaid)
					partials[inv->payment_hash] = Ev::now();
				return Decision::hold();
			case State_Paid:
				return Decision::resolve(inv->preimage);
			default:
				return incorrect(req.amount);
			}
		}

		auto h = Htlc();
		h.scid = req.scid;
		h.htlc_id = req.htlc_id;
		h.msat = req.amount;
		h.cltv_expiry = req.cltv_expiry;
		h.created_at = now_secs();

		auto reject = [&](Decision d, std::string const& why) {
			h.state = State_Cancelled;
			h.id = Store::add_htlc(tx, inv->id, h);
			fx.events.push_back(htlc_event(*inv, h));
			fx.log(Warn, "Rejected HTLC " + describe(*inv, h)
				   + ": " + why);
			return d;
		};

		if (is_final(inv->state))
			return reject( incorrect(req.amount)
				     , "invoice is " + to_string(inv->state)
				     );
		if ( inv->payment_secret
		  && inv->payment_secret != req.payment_secret
		   )
			return reject( incorrect(req.amount)
				     , "payment secret mismatch"
				     );
		auto min_cltv = min_cltv_of(*inv);
		auto relative = req.has_cltv_expiry_relative
			      ? req.cltv_expiry_relative
			      : std::int64_t(req.cltv_expiry) - std::int64_t(height)
			      ;
		if (relative < std::int64_t(min_cltv))
			return reject( Decision::fail(
				Ln::FailureMessage::final_incorrect_cltv_expiry(
					req.cltv_expiry
				)
			), Util::Str::fmt( "CLTV delta %lld below minimum %u"
					 , (long long) relative
					 , (unsigned) min_cltv
					 ));
		auto total = inv->sum(State_Accepted) + req.amount;
		if (inv->has_amount) {
			auto bound = bound_of(*inv, policy.overpayment_factor);
			if (total.to_msat() > bound)
				return reject( incorrect(req.amount)
					     , Util::Str::fmt(
					"total %llu msat over bound %llu msat",
					(unsigned long long) total.to_msat(),
					(unsigned long long) bound
				));
		}

		h.state = State_Accepted;
		h.id = Store::add_htlc(tx, inv->id, h);
		inv->htlcs.push_back(h);
		fx.events.push_back(htlc_event(*inv, h));

		if (inv->state == State_Unpaid) {
			if (!inv->has_amount || total >= inv->amount) {
				inv->state = State_Accepted;
				inv->accepted_at = now_secs();
				Store::update_invoice(tx, *inv);
				fx.events.push_back(invoice_event(*inv));
				partials.erase(inv->payment_hash);
				fx.log(Info, "Invoice " + std::string(inv->payment_hash)
					   + " accepted");
			} else {
				partials[inv->payment_hash] = Ev::now();
			}
		}
		return Decision::hold();
	}

	void do_settle( Sqlite3::Tx& tx
		      , Ln::Preimage const& preimage
		      , Sha256::Hash const& hash
		      , Effects& fx
		      ) {
		auto inv = Store::get_invoice(tx, hash);
		if (!inv)
			throw Refused("invoice not found");
		switch (inv->state) {
		case State_Paid:
			return;
		case State_Cancelled:
			throw Refused("state cancelled is final");
		case State_Unpaid:
			throw Refused("no HTLCs to settle");
		case State_Accepted:
			break;
		}
		if (inv->count(State_Accepted) == 0)
			throw Refused("no HTLCs to settle");

		for (auto& h : inv->htlcs) {
			if (h.state != State_Accepted)
				continue;
			h.state = State_Paid;
			Store::set_htlc_state(tx, h.id, h.state);
			fx.events.push_back(htlc_event(*inv, h));
			fx.resolutions.emplace_back( key_of(*inv, h)
						   , Decision::resolve(preimage)
						   );
		}
		inv->state = State_Paid;
		inv->preimage = preimage;
		inv->settled_at = now_secs();
		Store::update_invoice(tx, *inv);
		fx.events.push_back(invoice_event(*inv));
		fx.log(Info, "Invoice " + std::string(hash) + " settled");
	}

	void do_cancel( Sqlite3::Tx& tx
		      , Sha256::Hash const& hash
		      , Effects& fx
		      ) {
		auto inv = Store::get_invoice(tx, hash);
		if (!inv)
			throw Refused("invoice not found");
		switch (inv->state) {
		case State_Cancelled:
			return;
		case State_Paid:
			throw Refused("state paid is final");
		default:
			break;
		}
		cancel_invoice(tx, *inv, fx);
		fx.log(Info, "Invoice " + std::string(hash) + " cancelled");
	}

	void do_expire( Sqlite3::Tx& tx
		      , Invoice& inv
		      , std::uint32_t limit
		      , Effects& fx
		      ) {
		auto expired = std::size_t(0);
		for (auto& h : inv.htlcs) {
			if (h.state != State_Accepted || h.cltv_expiry > limit)
				continue;
			fx.log(Info, Util::Str::fmt(
				"HTLC %s expires at %u, failing at height %u",
				describe(inv, h).c_str(),
				(unsigned) h.cltv_expiry,
				(unsigned) height
			));
			fail_htlc(tx, inv, h, incorrect(h.msat), fx);
			++expired;
		}
		if (expired == 0)
			return;

		auto live = inv.count(State_Accepted);
		if (inv.state == State_Accepted) {
			auto short_paid = inv.has_amount
				       && inv.sum(State_Accepted) < inv.amount
					;
			if (live == 0 || short_paid) {
				cancel_invoice(tx, inv, fx);
				fx.log(Info, "Invoice "
					   + std::string(inv.payment_hash)
					   + " cancelled on HTLC expiry");
			}
		} else if (inv.state == State_Unpaid && live == 0) {
			partials.erase(inv.payment_hash);
		}
	}

	Ev::Io<void> expire(Sha256::Hash h, std::uint32_t limit) {
		return locks.run(h, db.transact().then([this, h, limit
						       ](Sqlite3::Tx tx) {
			auto fx = std::make_shared<Effects>();
			auto inv = Store::get_invoice(tx, h);
			if (inv)
				do_expire(tx, *inv, limit, *fx);
			tx.commit();
			return publish(fx);
		}));
	}

	Ev::Io<void> timeout_parts(Sha256::Hash h, double now) {
		return locks.run(h, db.transact().then([this, h, now
						       ](Sqlite3::Tx tx) {
			auto fx = std::make_shared<Effects>();
			auto it = partials.find(h);
			/* A part may have arrived meanwhile.  */
			if ( it != partials.end()
			  && it->second + policy.mpp_timeout <= now
			   ) {
				partials.erase(it);
				auto inv = Store::get_invoice(tx, h);
				if (inv && inv->state == State_Unpaid) {
					for (auto& htlc : inv->htlcs) {
						if (htlc.state != State_Accepted)
							continue;
						fail_htlc( tx, *inv, htlc
							 , Decision::fail(Ln::FailureMessage::mpp_timeout())
							 , *fx
							 );
					}
					fx->log(Info, "Invoice " + std::string(h)
						    + ": MPP parts timed out");
				}
			}
			tx.commit();
			return publish(fx);
		}));
	}
};

Engine::Engine( S::Bus& bus
	      , Sqlite3::Db db
	      , Journal& journal
	      , ResolverIF& resolver
	      , Policy policy
	      ) : pimpl(Util::make_unique<Impl>( bus
					       , std::move(db)
					       , journal
					       , resolver
					       , std::move(policy)
					       ))
		{
	journal.set_buffer(pimpl->policy.track_buffer);
}
Engine::Engine(Engine&&) =default;
Engine::~Engine() =default;

Ev::Io<void> Engine::init() {
	return pimpl->db.transact().then([](Sqlite3::Tx tx) {
		Store::create_tables(tx);
		tx.commit();
		return Ev::lift();
	});
}

Policy const& Engine::policy() const {
	return pimpl->policy;
}
std::uint32_t Engine::height() const {
	return pimpl->height;
}

Ev::Io<Decision> Engine::htlc(Ln::HtlcAccepted::Request const& req) {
	/* Not the final hop, so not one of ours.  */
	if (req.is_forward)
		return Ev::lift(Decision::cont());

	auto impl = pimpl.get();
	return impl->locks.run(req.payment_hash, impl->db.transact().then([ impl
									    , req
									    ](Sqlite3::Tx tx) {
		auto fx = std::make_shared<Effects>();
		auto rv = impl->gate(tx, req, *fx);
		tx.commit();
		return impl->publish(fx).then([rv]() {
			return Ev::lift(rv);
		});
	}));
}

Ev::Io<std::uint64_t> Engine::add_invoice(Invoice inv_) {
	auto impl = pimpl.get();
	auto inv = std::make_shared<Invoice>(std::move(inv_));
	return impl->locks.run(inv->payment_hash, impl->db.transact().then([ impl
									     , inv
									     ](Sqlite3::Tx tx) {
		if (Store::get_invoice(tx, inv->payment_hash))
			throw Refused("invoice with payment hash already exists");

		inv->state = State_Unpaid;
		inv->accepted_at = 0;
		inv->settled_at = 0;
		inv->htlcs.clear();
		if (inv->created_at == 0)
			inv->created_at = now_secs();
		inv->id = Store::add_invoice(tx, *inv);

		auto fx = std::make_shared<Effects>();
		fx->events.push_back(invoice_event(*inv));
		fx->log(Info, "Invoice " + std::string(inv->payment_hash)
			    + " added");
		tx.commit();

		auto id = inv->id;
		return impl->publish(fx).then([id]() {
			return Ev::lift(id);
		});
	}));
}

Ev::Io<void> Engine::settle(Ln::Preimage preimage) {
	auto impl = pimpl.get();
	auto hash = preimage.sha256();
	return impl->locks.run(hash, impl->db.transact().then([ impl
							      , preimage
							      , hash
							      ](Sqlite3::Tx tx) {
		auto fx = std::make_shared<Effects>();
		impl->do_settle(tx, preimage, hash, *fx);
		tx.commit();
		return impl->publish(fx);
	}));
}

Ev::Io<void> Engine::cancel(Sha256::Hash hash) {
	auto impl = pimpl.get();
	return impl->locks.run(hash, impl->db.transact().then([ impl
							      , hash
							      ](Sqlite3::Tx tx) {
		auto fx = std::make_shared<Effects>();
		impl->do_cancel(tx, hash, *fx);
		tx.commit();
		return impl->publish(fx);
	}));
}

Ev::Io<std::vector<Invoice>> Engine::list(Store::Filter filter) {
	auto pf = std::make_shared<Store::Filter>(std::move(filter));
	return pimpl->db.transact().then([pf](Sqlite3::Tx tx) {
		auto rv = Store::list(tx, *pf);
		tx.commit();
		return Ev::lift(std::move(rv));
	});
}

Ev::Io<std::uint64_t> Engine::clean(std::uint64_t age) {
	auto impl = pimpl.get();
	return impl->db.transact().then([impl, age](Sqlite3::Tx tx) {
		auto now = now_secs();
		auto cutoff = age > now ? 0 : now - age;
		auto count = Store::clean(tx, cutoff);
		tx.commit();
		if (count == 0)
			return Ev::lift(count);
		return Hold::log( impl->bus, Info
				, "Cleaned %llu cancelled invoices"
				, (unsigned long long) count
				).then([count]() {
			return Ev::lift(count);
		});
	});
}

Ev::Io<void> Engine::block(std::uint32_t height) {
	auto impl = pimpl.get();
	return Ev::lift().then([impl, height]() {
		if (height <= impl->height)
			return Hold::log( impl->bus, Warn
					, "Ignoring block %u, not above %u"
					, (unsigned) height
					, (unsigned) impl->height
					);
		impl->height = height;
		auto deadline = impl->policy.expiry_deadline;
		if (deadline == 0)
			return Ev::lift();

		auto limit = height + deadline;
		return impl->db.transact().then([impl, limit](Sqlite3::Tx tx) {
			auto hashes = Store::expiring(tx, limit);
			tx.commit();
			return in_turn([impl, limit](Sha256::Hash h) {
				return impl->expire(std::move(h), limit);
			}, std::make_shared<std::vector<Sha256::Hash>>(
				std::move(hashes)
			));
		});
	});
}

Ev::Io<void> Engine::sweep_mpp(double now) {
	auto impl = pimpl.get();
	return Ev::lift().then([impl, now]() {
		auto stale = std::vector<Sha256::Hash>();
		for (auto const& p : impl->partials)
			if (p.second + impl->policy.mpp_timeout <= now)
				stale.push_back(p.first);
		return in_turn([impl, now](Sha256::Hash h) {
			return impl->timeout_parts(std::move(h), now);
		}, std::make_shared<std::vector<Sha256::Hash>>(
			std::move(stale)
		));
	});
}

Ev::Io<std::shared_ptr<Engine::TrackStart>>
Engine::track(Sha256::Hash hash) {
	auto impl = pimpl.get();
	return impl->db.transact().then([impl, hash](Sqlite3::Tx tx) {
		auto rv = std::make_shared<TrackStart>();
		rv->states.push_back(State_Unpaid);
		auto inv = Store::get_invoice(tx, hash);
		if (inv) {
			if (inv->accepted_at != 0)
				rv->states.push_back(State_Accepted);
			if (inv->state != rv->states.back())
				rv->states.push_back(inv->state);
		}
		/* Subscribe before the read transaction ends.  */
		auto hashes = std::make_shared<std::vector<Sha256::Hash>>();
		hashes->push_back(hash);
		rv->sub = impl->journal.subscribe(
			transition_filter(std::move(hashes), false)
		);
		tx.commit();
		return Ev::lift(rv);
	});
}

Ev::Io<std::shared_ptr<Engine::TrackAllStart>>
Engine::track_all( std::shared_ptr<std::vector<Sha256::Hash>> hashes
		 , bool include_htlcs
		 ) {
	auto impl = pimpl.get();
	return impl->db.transact().then([ impl
					, hashes
					, include_htlcs
					](Sqlite3::Tx tx) {
		auto rv = std::make_shared<TrackAllStart>();
		rv->seq = impl->journal.last_seq();
		if (hashes) {
			auto seen = std::unordered_set<Sha256::Hash>();
			for (auto const& h : *hashes) {
				if (!seen.insert(h).second)
					continue;
				auto inv = Store::get_invoice(tx, h);
				if (!inv)
					continue;
				auto t = invoice_event(*inv);
				t.seq = rv->seq;
				rv->catchup.push_back(std::move(t));
			}
		}
		rv->sub = impl->journal.subscribe(
			transition_filter(hashes, include_htlcs)
		);
		tx.commit();
		return Ev::lift(rv);
	});
}

Journal::Filter
Engine::transition_filter( std::shared_ptr<std::vector<Sha256::Hash>> hashes
			 , bool include_htlcs
			 ) {
	if (!hashes)
		return [include_htlcs](Transition const& t) {
			return include_htlcs || !t.is_htlc;
		};
	auto set = std::make_shared<std::unordered_set<Sha256::Hash>>(
		hashes->begin(), hashes->end()
	);
	return [set, include_htlcs](Transition const& t) {
		if (t.is_htlc && !include_htlcs)
			return false;
		return set->count(t.payment_hash) != 0;
	};
}

}
