#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Hold/Mod/Waiter.hpp"
#include"Hold/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<list>

namespace Hold { namespace Mod {

class Waiter::Impl {
private:
	typedef std::function<void()> PassF;
	typedef std::function<void(std::exception_ptr)> FailF;

	struct Timer {
		ev_timer watcher;
		Impl* pimpl;
		PassF pass;
		FailF fail;
		std::list<Timer>::iterator it;
	};
	typedef std::list<Timer>::iterator TimerIt;

	bool shutting_down;
	/* Nodes of a std::list do not move, so the
	 * ev_timer inside can be handed to libev.  */
	std::list<Timer> timers;

	static
	void fail_shutdown(FailF const& fail) {
		try {
			throw Hold::Shutdown();
		} catch (...) {
			fail(std::current_exception());
		}
	}

	static
	void on_timer(EV_P_ ev_timer* w, int revents) {
		auto t = (Timer*) w->data;
		auto pass = std::move(t->pass);
		ev_timer_stop(EV_A_ w);
		t->pimpl->timers.erase(t->it);
		pass();
	}

	void shutdown() {
		shutting_down = true;
		auto dying = std::move(timers);
		timers.clear();
		for (auto& t : dying) {
			ev_timer_stop(EV_DEFAULT_ &t.watcher);
			fail_shutdown(t.fail);
		}
	}

	TimerIt arm(double seconds, PassF pass, FailF fail) {
		auto it = timers.emplace(timers.end());
		it->pimpl = this;
		it->pass = std::move(pass);
		it->fail = std::move(fail);
		it->it = it;
		ev_timer_init(&it->watcher, &on_timer, seconds, 0);
		it->watcher.data = &*it;
		ev_timer_start(EV_DEFAULT_ &it->watcher);
		return it;
	}
	void disarm(TimerIt it) {
		ev_timer_stop(EV_DEFAULT_ &it->watcher);
		timers.erase(it);
	}

	/* Shared between the timer and the action of one
	 * `timed` call; whichever ends first wins.  */
	struct Race {
		PassF pass;
		FailF fail;
		bool done;
		bool armed;
		TimerIt timer;
	};

public:
	explicit
	Impl(S::Bus& bus) : shutting_down(false) {
		bus.subscribe<Hold::Shutdown>([this](Hold::Shutdown const&) {
			shutdown();
			return Ev::lift();
		});
	}
	~Impl() {
		for (auto& t : timers)
			ev_timer_stop(EV_DEFAULT_ &t.watcher);
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([this, seconds](PassF pass, FailF fail) {
			if (shutting_down)
				return fail_shutdown(fail);
			arm(seconds, std::move(pass), std::move(fail));
		});
	}

	Ev::Io<void> timed_core(double timeout, Ev::Io<void> action) {
		auto paction = std::make_shared<Ev::Io<void>>(std::move(action));
		return Ev::Io<void>([this, timeout, paction](PassF pass, FailF fail) {
			if (shutting_down)
				return fail_shutdown(fail);

			auto race = std::make_shared<Race>();
			race->pass = std::move(pass);
			race->fail = std::move(fail);
			race->done = false;
			race->armed = false;

			auto finish_fail = [race](std::exception_ptr e) {
				if (race->done)
					return;
				race->done = true;
				auto fail = std::move(race->fail);
				race->pass = nullptr;
				fail(e);
			};
			auto on_timeout = [race, finish_fail]() {
				race->armed = false;
				try {
					throw TimedOut{};
				} catch (...) {
					finish_fail(std::current_exception());
				}
			};
			auto on_shutdown = [race, finish_fail](std::exception_ptr e) {
				race->armed = false;
				finish_fail(e);
			};
			auto end_action = [this, race]() {
				if (!race->armed)
					return;
				race->armed = false;
				disarm(race->timer);
			};

			race->timer = arm(timeout, on_timeout, on_shutdown);
			race->armed = true;

			paction->run([race, end_action]() {
				end_action();
				if (race->done)
					return;
				race->done = true;
				auto pass = std::move(race->pass);
				race->fail = nullptr;
				pass();
			}, [end_action, finish_fail](std::exception_ptr e) {
				end_action();
				finish_fail(e);
			});
		}).then([]() {
			/* Resume on a fresh stack.  */
			return Ev::yield();
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
Waiter::~Waiter() =default;

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}
Ev::Io<void> Waiter::timed_core(double timeout, Ev::Io<void> action) {
	return pimpl->timed_core(timeout, std::move(action));
}

}}
