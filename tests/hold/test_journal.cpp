#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Hold/Journal.hpp"
#include"Hold/Shutdown.hpp"
#include<assert.h>
#include<memory>

namespace {

Hold::Transition make(char c, Hold::State s) {
	auto t = Hold::Transition();
	t.payment_hash = Sha256::Hash(std::string(64, c));
	t.bolt11 = std::string("lnbc") + c;
	t.state = s;
	return t;
}

}

int main() {
	auto journal = Hold::Journal(4);
	journal.set_buffer(2);

	assert(journal.last_seq() == 0);
	assert(journal.since(0).empty());

	auto only_b = [](Hold::Transition const& t) {
		return t.bolt11 == "lnbcb";
	};

	auto all = std::shared_ptr<Hold::Journal::Subscription>();
	auto some = std::shared_ptr<Hold::Journal::Subscription>();
	auto waiting = std::shared_ptr<Hold::Journal::Subscription>();

	auto code = Ev::lift().then([&]() {
		assert(journal.append(make('a', Hold::State_Unpaid)) == 1);

		/* Subscriptions only see later appends.  */
		all = journal.subscribe();
		some = journal.subscribe(only_b);

		journal.append(make('b', Hold::State_Unpaid));
		journal.append(make('a', Hold::State_Accepted));
		assert(all->pending() == 2);
		assert(some->pending() == 1);

		return all->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(t);
		assert(t->seq == 2);
		assert(t->bolt11 == "lnbcb");
		return all->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(t->seq == 3);
		assert(t->state == Hold::State_Accepted);
		return some->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(t->seq == 2);

		/* A waiting subscriber is woken by an append.  */
		waiting = journal.subscribe();
		auto append = Ev::yield().then([&]() {
			journal.append(make('b', Hold::State_Paid));
			return Ev::lift();
		});
		return Ev::concurrent(append).then([&]() {
			assert(waiting->pending() == 0);
			return waiting->next();
		});
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(t);
		assert(t->seq == 4);
		assert(t->state == Hold::State_Paid);

		/* History keeps only the last 4.  */
		journal.append(make('c', Hold::State_Unpaid));
		assert(journal.last_seq() == 5);
		auto h = journal.since(0);
		assert(h.size() == 4);
		assert(h.front().seq == 2);
		assert(h.back().seq == 5);
		h = journal.since(3, only_b);
		assert(h.size() == 1);
		assert(h[0].seq == 4);

		/* `some` has one queued, `all` has two; one more
		 * overflows `all` but not `some`.  */
		assert(all->pending() == 2);
		journal.append(make('c', Hold::State_Cancelled));
		assert(all->pending() == 2);
		return all->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		/* What was queued still comes out first.  */
		assert(t->seq == 4);
		return all->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(t->seq == 5);
		return all->next().then([](std::shared_ptr<Hold::Transition>) {
			return Ev::lift(false);
		}).catching<Hold::Lagged>([](Hold::Lagged const&) {
			return Ev::lift(true);
		});
	}).then([&](bool lagged) {
		assert(lagged);
		/* The lagged subscriber gets nothing more.  */
		journal.append(make('b', Hold::State_Cancelled));
		assert(all->pending() == 0);
		assert(some->pending() == 2);

		/* Cancelling wakes the waiter with null, after
		 * the queued transitions.  */
		some->cancel();
		return some->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(t);
		assert(t->seq == 4);
		return some->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(t->seq == 7);
		return some->next();
	}).then([&](std::shared_ptr<Hold::Transition> t) {
		assert(!t);

		/* Shutdown fails the waiters.  */
		waiting = journal.subscribe();
		auto act = waiting->next().then([](std::shared_ptr<Hold::Transition>) {
			return Ev::lift(false);
		}).catching<Hold::Shutdown>([](Hold::Shutdown const&) {
			return Ev::lift(true);
		});
		journal.shutdown();
		return act;
	}).then([&](bool shut) {
		assert(shut);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
