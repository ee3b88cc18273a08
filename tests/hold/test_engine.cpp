#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Journal.hpp"
#include"Hold/Refused.hpp"
#include"Hold/ResolverIF.hpp"
#include"Ln/FailureMessage.hpp"
#include"Ln/HtlcAccepted.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<memory>
#include<utility>
#include<vector>

namespace {

class Recorder : public Hold::ResolverIF {
public:
	std::vector<std::pair<Hold::HtlcKey, Hold::Decision>> got;

	Ev::Io<void> resolve( Hold::HtlcKey const& key
			    , Hold::Decision const& decision
			    ) override {
		got.emplace_back(key, decision);
		return Ev::lift();
	}
};

Ln::Preimage preimage_of(char c) {
	return Ln::Preimage(std::string(64, c));
}

Hold::Invoice make_invoice(Ln::Preimage const& p, std::uint64_t msat) {
	auto inv = Hold::Invoice();
	inv.payment_hash = p.sha256();
	inv.bolt11 = "lnbcrt" + std::string(inv.payment_hash).substr(0, 8);
	inv.has_amount = msat != 0;
	inv.amount = Ln::Amount::msat(msat);
	inv.min_cltv = 10;
	return inv;
}

Ln::HtlcAccepted::Request
make_htlc( Sha256::Hash const& hash
	 , std::uint64_t htlc_id
	 , std::uint64_t msat
	 ) {
	auto r = Ln::HtlcAccepted::Request();
	r.scid = Ln::Scid("100x1x0");
	r.htlc_id = htlc_id;
	r.amount = Ln::Amount::msat(msat);
	r.total_msat = r.amount;
	r.cltv_expiry = 200;
	r.has_cltv_expiry_relative = true;
	r.cltv_expiry_relative = 50;
	r.payment_hash = hash;
	r.is_forward = false;
	return r;
}

std::uint16_t code_of(Hold::Decision const& d) {
	return Ln::FailureMessage::code(d.failure_message());
}

typedef std::vector<std::pair<Sha256::Hash, Hold::State>> Seen;

/* Read `n` transitions off the subscription.  */
Ev::Io<void> collect( Hold::Journal::Subscription& sub
		    , std::size_t n
		    , std::shared_ptr<Seen> seen
		    ) {
	if (n == 0)
		return Ev::lift();
	return sub.next().then([&sub, n, seen](std::shared_ptr<Hold::Transition> t) {
		assert(t);
		assert(!t->is_htlc);
		seen->emplace_back(t->payment_hash, t->state);
		return collect(sub, n - 1, seen);
	});
}

}

int main() {
	S::Bus bus;
	auto journal = Hold::Journal();
	auto resolver = Recorder();
	auto engine = Hold::Engine( bus
				  , Sqlite3::Db(":memory:")
				  , journal
				  , resolver
				  );

	/* Separate engine for the ordering of tracked
	 * transitions.  */
	auto journal2 = Hold::Journal();
	auto resolver2 = Recorder();
	auto engine2 = Hold::Engine( bus
				   , Sqlite3::Db(":memory:")
				   , journal2
				   , resolver2
				   );
	auto all = std::shared_ptr<Hold::Engine::TrackAllStart>();
	auto follow = std::shared_ptr<Hold::Engine::TrackStart>();
	auto seen = std::make_shared<Seen>();

	auto a = preimage_of('a');
	auto b = preimage_of('b');
	auto c = preimage_of('c');
	auto d = preimage_of('d');
	auto e = preimage_of('e');
	auto f = preimage_of('f');

	auto get = [&](Sha256::Hash const& h) {
		auto filter = Hold::Store::Filter();
		filter.payment_hash.reset(new Sha256::Hash(h));
		return engine.list(std::move(filter)
		).then([](std::vector<Hold::Invoice> invs) {
			assert(invs.size() == 1);
			return Ev::lift(std::move(invs[0]));
		});
	};
	auto refused = [](Ev::Io<void> act) {
		return act.then([]() {
			return Ev::lift(false);
		}).catching<Hold::Refused>([](Hold::Refused const&) {
			return Ev::lift(true);
		});
	};

	auto code = Ev::lift().then([&]() {
		return engine.init();
	}).then([&]() {
		return engine.block(150);
	}).then([&]() {
		assert(engine.height() == 150);
		return engine.add_invoice(make_invoice(a, 1000));
	}).then([&](std::uint64_t id) {
		assert(id == 1);

		/* Duplicate payment hash.  */
		return refused(engine.add_invoice(make_invoice(a, 5)).then([](std::uint64_t) {
			return Ev::lift();
		}));
	}).then([&](bool flag) {
		assert(flag);

		/* Not ours.  */
		return engine.htlc(make_htlc(preimage_of('9').sha256(), 0, 1000));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Continue);

		/* Forwards are never ours.  */
		auto r = make_htlc(a.sha256(), 0, 1000);
		r.is_forward = true;
		return engine.htlc(r);
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Continue);

		/* First part of a multi-part payment.  */
		return engine.htlc(make_htlc(a.sha256(), 1, 600));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		return get(a.sha256());
	}).then([&](Hold::Invoice inv) {
		assert(inv.state == Hold::State_Unpaid);
		assert(inv.htlcs.size() == 1);
		assert(inv.accepted_at == 0);

		/* Second part completes it.  */
		return engine.htlc(make_htlc(a.sha256(), 2, 400));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		return get(a.sha256());
	}).then([&](Hold::Invoice inv) {
		assert(inv.state == Hold::State_Accepted);
		assert(inv.accepted_at != 0);
		assert(inv.sum(Hold::State_Accepted) == Ln::Amount::msat(1000));
		/* Nothing resolved yet.  */
		assert(resolver.got.empty());

		/* A replayed hook for a held HTLC stays held.  */
		return engine.htlc(make_htlc(a.sha256(), 1, 600));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		return get(a.sha256());
	}).then([&](Hold::Invoice inv) {
		assert(inv.htlcs.size() == 2);

		/* A preimage of no invoice settles nothing.  */
		return refused(engine.settle(preimage_of('0')));
	}).then([&](bool flag) {
		assert(flag);

		return engine.settle(a);
	}).then([&]() {
		assert(resolver.got.size() == 2);
		for (auto const& r : resolver.got) {
			assert(r.first.payment_hash == a.sha256());
			assert(r.second.kind() == Hold::Decision::Kind_Resolve);
			assert(r.second.payment_key() == a);
		}
		resolver.got.clear();
		return get(a.sha256());
	}).then([&](Hold::Invoice inv) {
		assert(inv.state == Hold::State_Paid);
		assert(inv.preimage == a);
		assert(inv.settled_at != 0);
		for (auto const& h : inv.htlcs)
			assert(h.state == Hold::State_Paid);

		/* Settling again does nothing.  */
		return engine.settle(a);
	}).then([&]() {
		assert(resolver.got.empty());

		/* Paid is final.  */
		return refused(engine.cancel(a.sha256()));
	}).then([&](bool flag) {
		assert(flag);

		/* A replayed hook of a settled HTLC gets the
		 * preimage again.  */
		return engine.htlc(make_htlc(a.sha256(), 2, 400));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Resolve);
		assert(dec.payment_key() == a);

		/* A new HTLC to a paid invoice is failed.  */
		return engine.htlc(make_htlc(a.sha256(), 3, 400));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Fail);
		assert(code_of(dec) == 0x400F);

		/* Overpayment: up to twice the amount.  */
		return engine.add_invoice(make_invoice(b, 1000));
	}).then([&](std::uint64_t) {
		return engine.add_invoice(make_invoice(c, 1000));
	}).then([&](std::uint64_t) {
		return engine.htlc(make_htlc(b.sha256(), 10, 2000));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		return engine.htlc(make_htlc(c.sha256(), 11, 2001));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Fail);
		assert(code_of(dec) == 0x400F);
		return get(c.sha256());
	}).then([&](Hold::Invoice inv) {
		/* The rejected HTLC is recorded as cancelled, the
		 * invoice itself is untouched.  */
		assert(inv.state == Hold::State_Unpaid);
		assert(inv.htlcs.size() == 1);
		assert(inv.htlcs[0].state == Hold::State_Cancelled);

		/* CLTV delta too small.  */
		auto r = make_htlc(c.sha256(), 12, 1000);
		r.cltv_expiry_relative = 9;
		return engine.htlc(r);
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Fail);
		assert(code_of(dec) == 18);

		/* Cancelling fails the held HTLCs.  */
		return engine.cancel(b.sha256());
	}).then([&]() {
		assert(resolver.got.size() == 1);
		assert(resolver.got[0].first.htlc_id == 10);
		assert(resolver.got[0].second.kind() == Hold::Decision::Kind_Fail);
		assert(code_of(resolver.got[0].second) == 0x400F);
		resolver.got.clear();
		return get(b.sha256());
	}).then([&](Hold::Invoice inv) {
		assert(inv.state == Hold::State_Cancelled);
		assert(inv.htlcs[0].state == Hold::State_Cancelled);

		/* Cancelling again is fine.  */
		return engine.cancel(b.sha256());
	}).then([&]() {
		assert(resolver.got.empty());
		return refused(engine.settle(b));
	}).then([&](bool flag) {
		assert(flag);
		return engine.htlc(make_htlc(b.sha256(), 13, 1000));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Fail);

		/* Nothing to settle yet.  */
		return refused(engine.settle(c));
	}).then([&](bool flag) {
		assert(flag);
		/* Unknown invoices cannot be settled or
		 * cancelled.  */
		return refused(engine.settle(preimage_of('7')));
	}).then([&](bool flag) {
		assert(flag);
		return refused(engine.cancel(preimage_of('7').sha256()));
	}).then([&](bool flag) {
		assert(flag);

		/* Payment secret must match when the invoice
		 * has one.  */
		auto inv = make_invoice(d, 1000);
		inv.payment_secret = preimage_of('5');
		return engine.add_invoice(std::move(inv));
	}).then([&](std::uint64_t) {
		auto r = make_htlc(d.sha256(), 20, 1000);
		r.payment_secret = preimage_of('6');
		return engine.htlc(r);
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Fail);
		auto r = make_htlc(d.sha256(), 21, 1000);
		r.payment_secret = preimage_of('5');
		return engine.htlc(r);
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);

		/* Incomplete multi-part payments time out.  */
		return engine.add_invoice(make_invoice(e, 1000));
	}).then([&](std::uint64_t) {
		return engine.htlc(make_htlc(e.sha256(), 30, 300));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		/* Not yet.  */
		return engine.sweep_mpp(Ev::now() + 30);
	}).then([&]() {
		assert(resolver.got.empty());
		return engine.sweep_mpp(Ev::now() + 61);
	}).then([&]() {
		assert(resolver.got.size() == 1);
		assert(resolver.got[0].first.payment_hash == e.sha256());
		assert(code_of(resolver.got[0].second) == 23);
		resolver.got.clear();
		return get(e.sha256());
	}).then([&](Hold::Invoice inv) {
		/* The invoice can still be paid.  */
		assert(inv.state == Hold::State_Unpaid);
		assert(inv.htlcs[0].state == Hold::State_Cancelled);

		/* Expiry watchdog.  */
		return engine.add_invoice(make_invoice(f, 0));
	}).then([&](std::uint64_t) {
		/* Any-amount invoices accept any first part.  */
		return engine.htlc(make_htlc(f.sha256(), 40, 1));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		/* 195 + 4 < 200.  */
		return engine.block(195);
	}).then([&]() {
		/* d holds an HTLC expiring at 200 as well.  */
		assert(resolver.got.empty());
		/* Blocks going back are ignored.  */
		return engine.block(190);
	}).then([&]() {
		assert(engine.height() == 195);
		return engine.block(196);
	}).then([&]() {
		/* Both d and f were accepted with one HTLC at
		 * expiry 200.  */
		assert(resolver.got.size() == 2);
		for (auto const& r : resolver.got)
			assert(r.second.kind() == Hold::Decision::Kind_Fail);
		resolver.got.clear();
		return get(f.sha256());
	}).then([&](Hold::Invoice inv) {
		assert(inv.state == Hold::State_Cancelled);

		/* Listing.  */
		return engine.list(Hold::Store::Filter());
	}).then([&](std::vector<Hold::Invoice> invs) {
		assert(invs.size() == 6);
		for (auto i = std::size_t(0); i < invs.size(); ++i)
			assert(invs[i].id == i + 1);

		auto filter = Hold::Store::Filter();
		filter.index_start = 3;
		filter.limit = 2;
		return engine.list(std::move(filter));
	}).then([&](std::vector<Hold::Invoice> invs) {
		assert(invs.size() == 2);
		assert(invs[0].id == 3);
		assert(invs[1].id == 4);

		auto filter = Hold::Store::Filter();
		filter.bolt11.reset(new std::string(make_invoice(c, 0).bolt11));
		return engine.list(std::move(filter));
	}).then([&](std::vector<Hold::Invoice> invs) {
		assert(invs.size() == 1);
		assert(invs[0].payment_hash == c.sha256());

		/* Only cancelled invoices older than an hour;
		 * there are none.  */
		return engine.clean(3600);
	}).then([&](std::uint64_t n) {
		assert(n == 0);
		/* b, d and f are cancelled.  */
		return engine.clean(0);
	}).then([&](std::uint64_t n) {
		assert(n == 3);
		return engine.list(Hold::Store::Filter());
	}).then([&](std::vector<Hold::Invoice> invs) {
		assert(invs.size() == 3);
		for (auto const& inv : invs)
			assert(inv.state != Hold::State_Cancelled);

		return engine2.init();
	}).then([&]() {
		return engine2.block(100);
	}).then([&]() {
		return engine2.track_all(nullptr);
	}).then([&](std::shared_ptr<Hold::Engine::TrackAllStart> start) {
		/* No catch-up without a filter.  */
		assert(start->catchup.empty());
		assert(start->seq == 0);
		all = std::move(start);

		return engine2.add_invoice(make_invoice(a, 1000));
	}).then([&](std::uint64_t) {
		return engine2.track(a.sha256());
	}).then([&](std::shared_ptr<Hold::Engine::TrackStart> start) {
		assert(start->states.size() == 1);
		assert(start->states[0] == Hold::State_Unpaid);
		follow = std::move(start);

		return engine2.add_invoice(make_invoice(b, 1000));
	}).then([&](std::uint64_t) {
		return engine2.add_invoice(make_invoice(c, 1000));
	}).then([&](std::uint64_t) {
		return engine2.cancel(b.sha256());
	}).then([&]() {
		/* Without a delta from lightningd it is counted
		 * from our height: 105 - 100 is below 10.  */
		auto r = make_htlc(c.sha256(), 1, 1000);
		r.has_cltv_expiry_relative = false;
		r.cltv_expiry = 105;
		return engine2.htlc(r);
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Fail);
		assert(code_of(dec) == 18);

		/* 150 - 100 is enough.  */
		auto r = make_htlc(c.sha256(), 2, 1000);
		r.has_cltv_expiry_relative = false;
		r.cltv_expiry = 150;
		return engine2.htlc(r);
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		return engine2.settle(c);
	}).then([&]() {
		return collect(*all->sub, 6, seen);
	}).then([&]() {
		/* Commit order across all invoices.  */
		auto expected = Seen{
			{a.sha256(), Hold::State_Unpaid},
			{b.sha256(), Hold::State_Unpaid},
			{c.sha256(), Hold::State_Unpaid},
			{b.sha256(), Hold::State_Cancelled},
			{c.sha256(), Hold::State_Accepted},
			{c.sha256(), Hold::State_Paid}
		};
		assert(*seen == expected);
		assert(all->sub->pending() == 0);
		/* HTLC transitions only with `include_htlcs`.  */
		assert(journal2.since(0).size() > expected.size());

		/* A late track replays from unpaid.  */
		return engine2.track(c.sha256());
	}).then([&](std::shared_ptr<Hold::Engine::TrackStart> start) {
		auto expected = std::vector<Hold::State>{
			Hold::State_Unpaid,
			Hold::State_Accepted,
			Hold::State_Paid
		};
		assert(start->states == expected);

		return engine2.track(b.sha256());
	}).then([&](std::shared_ptr<Hold::Engine::TrackStart> start) {
		auto expected = std::vector<Hold::State>{
			Hold::State_Unpaid,
			Hold::State_Cancelled
		};
		assert(start->states == expected);

		/* The early track of a follows it to paid.  */
		assert(follow->sub->pending() == 0);
		return engine2.htlc(make_htlc(a.sha256(), 3, 1000));
	}).then([&](Hold::Decision dec) {
		assert(dec.kind() == Hold::Decision::Kind_Hold);
		return engine2.settle(a);
	}).then([&]() {
		seen->clear();
		return collect(*follow->sub, 2, seen);
	}).then([&]() {
		auto expected = Seen{
			{a.sha256(), Hold::State_Accepted},
			{a.sha256(), Hold::State_Paid}
		};
		assert(*seen == expected);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
