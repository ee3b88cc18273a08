#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Hold/Mod/Waiter.hpp"
#include"Hold/Shutdown.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<memory>

namespace {

using Hold::Mod::Waiter;

/* Many short timed actions in a row: each timer must
 * be cancelled once the action wins.  */
Ev::Io<void> repeat(Waiter& waiter, std::shared_ptr<std::size_t> counter) {
	if (*counter == 0)
		return Ev::lift();
	--(*counter);
	return waiter.timed(60, Ev::yield().then([]() {
		return Ev::lift(true);
	})).catching<Waiter::TimedOut>([](Waiter::TimedOut const&) {
		return Ev::lift(false);
	}).then([&waiter, counter](bool flag) {
		assert(flag);
		return repeat(waiter, counter);
	});
}

}

int main() {
	S::Bus bus;
	Waiter waiter(bus);
	auto shutdown_seen = std::make_shared<bool>(false);

	auto code = Ev::lift().then([&]() {

		return waiter.timed(60, Ev::lift(42));
	}).then([&](int i) {
		assert(i == 42);

		/* The action waits too, but less.  */
		return waiter.timed(60, waiter.wait(0.001));
	}).then([&]() {

		/* Timeout first.  */
		return waiter.timed(0.001, waiter.wait(60).then([]() {
			return Ev::lift(true);
		})).catching<Waiter::TimedOut>([](Waiter::TimedOut const&) {
			return Ev::lift(false);
		});
	}).then([&](bool flag) {
		assert(!flag);

		return repeat(waiter, std::make_shared<std::size_t>(1000));
	}).then([&]() {

		/* A long wait is cut short by shutdown.  */
		auto wait = waiter.wait(3600).then([]() {
			return Ev::lift(false);
		}).catching<Hold::Shutdown>([](Hold::Shutdown const&) {
			return Ev::lift(true);
		}).then([shutdown_seen](bool flag) {
			*shutdown_seen = flag;
			return Ev::lift();
		});
		return Ev::concurrent(wait);
	}).then([&]() {
		return bus.raise(Hold::Shutdown());
	}).then([&]() {
		return Ev::yield() + Ev::yield();
	}).then([&]() {
		assert(*shutdown_seen);

		/* Later waits fail at once.  */
		return waiter.wait(3600).then([]() {
			return Ev::lift(false);
		}).catching<Hold::Shutdown>([](Hold::Shutdown const&) {
			return Ev::lift(true);
		});
	}).then([](bool flag) {
		assert(flag);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
