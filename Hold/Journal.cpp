#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Hold/Journal.hpp"
#include"Hold/Shutdown.hpp"
#include<algorithm>
#include<deque>

namespace Hold {

class Journal::Subscription::Impl {
public:
	Filter filter;
	std::size_t bound;
	std::deque<Transition> queue;

	bool lagged;
	bool cancelled;
	bool shut;
	/* Set while a wakeup is already scheduled.  */
	bool waking;

	std::function<void(std::shared_ptr<Transition>)> pass;
	std::function<void(std::exception_ptr)> fail;

	Impl( Filter filter_
	    , std::size_t bound_
	    ) : filter(std::move(filter_))
	      , bound(bound_)
	      , lagged(false)
	      , cancelled(false)
	      , shut(false)
	      , waking(false)
	      { }

	bool closed() const {
		return lagged || cancelled || shut;
	}

	/* Returns true if a waiter has to be woken.  */
	bool push(Transition const& t) {
		if (closed())
			return false;
		if (filter && !filter(t))
			return false;
		if (queue.size() >= bound) {
			lagged = true;
		} else {
			queue.push_back(t);
		}
		return bool(pass);
	}

	/* Hand something to the waiter, if there is anything
	 * to hand.  */
	void deliver() {
		if (!pass)
			return;
		if (!queue.empty()) {
			auto t = std::make_shared<Transition>(
				std::move(queue.front())
			);
			queue.pop_front();
			take_pass()(std::move(t));
		} else if (lagged) {
			take_fail()(std::make_exception_ptr(Lagged()));
		} else if (shut) {
			take_fail()(std::make_exception_ptr(Shutdown()));
		} else if (cancelled) {
			take_pass()(nullptr);
		}
	}

	/* Deliver on a later turn of the loop, so that the
	 * waiter never runs inside the appender.  */
	static
	void wake(std::shared_ptr<Impl> const& self) {
		if (self->waking)
			return;
		self->waking = true;
		Ev::yield().run([self]() {
			self->waking = false;
			self->deliver();
		}, [](std::exception_ptr) { });
	}

private:
	std::function<void(std::shared_ptr<Transition>)> take_pass() {
		auto rv = std::move(pass);
		pass = nullptr;
		fail = nullptr;
		return rv;
	}
	std::function<void(std::exception_ptr)> take_fail() {
		auto rv = std::move(fail);
		pass = nullptr;
		fail = nullptr;
		return rv;
	}
};

class Journal::Impl {
public:
	std::size_t history_max;
	std::size_t buffer;
	std::uint64_t seq;
	std::deque<Transition> history;
	std::vector<std::weak_ptr<Subscription::Impl>> subs;
	bool shut;

	explicit
	Impl(std::size_t history_max_)
		: history_max(history_max_)
		, buffer(1024)
		, seq(0)
		, shut(false)
		{ }

	void prune() {
		subs.erase( std::remove_if( subs.begin(), subs.end()
					  , [](std::weak_ptr<Subscription::Impl> const& w) {
			auto s = w.lock();
			return !s || s->closed();
		}), subs.end());
	}
};

Journal::Subscription::Subscription(std::shared_ptr<Impl> pimpl_)
	: pimpl(std::move(pimpl_)) { }
Journal::Subscription::~Subscription() {
	cancel();
}

Ev::Io<std::shared_ptr<Transition>>
Journal::Subscription::next() {
	auto self = pimpl;
	return Ev::Io<std::shared_ptr<Transition>>([self
	]( std::function<void(std::shared_ptr<Transition>)> pass
	 , std::function<void(std::exception_ptr)> fail
	 ) {
		if (self->pass)
			throw std::logic_error(
				"Hold::Journal::Subscription::next: "
				"already waiting"
			);
		self->pass = std::move(pass);
		self->fail = std::move(fail);
		self->deliver();
	});
}

void Journal::Subscription::cancel() {
	if (pimpl->cancelled)
		return;
	pimpl->cancelled = true;
	if (pimpl->pass)
		Impl::wake(pimpl);
}

std::size_t Journal::Subscription::pending() const {
	return pimpl->queue.size();
}

Journal::Journal(std::size_t history)
	: pimpl(std::make_shared<Impl>(history)) { }
Journal::Journal(Journal&&) =default;
Journal::~Journal() =default;

void Journal::set_buffer(std::size_t buffer) {
	pimpl->buffer = buffer == 0 ? 1 : buffer;
}

std::uint64_t Journal::append(Transition t) {
	t.seq = ++pimpl->seq;

	pimpl->history.push_back(t);
	while (pimpl->history.size() > pimpl->history_max)
		pimpl->history.pop_front();

	/* Update every queue first, then wake.  */
	auto to_wake = std::vector<std::shared_ptr<Subscription::Impl>>();
	for (auto const& w : pimpl->subs) {
		auto s = w.lock();
		if (!s)
			continue;
		if (s->push(t))
			to_wake.push_back(std::move(s));
	}
	pimpl->prune();
	for (auto const& s : to_wake)
		Subscription::Impl::wake(s);

	return t.seq;
}

std::uint64_t Journal::last_seq() const {
	return pimpl->seq;
}

std::vector<Transition>
Journal::since(std::uint64_t seq, Filter const& filter) const {
	auto rv = std::vector<Transition>();
	for (auto const& t : pimpl->history) {
		if (t.seq <= seq)
			continue;
		if (filter && !filter(t))
			continue;
		rv.push_back(t);
	}
	return rv;
}

std::unique_ptr<Journal::Subscription>
Journal::subscribe(Filter filter) {
	auto s = std::make_shared<Subscription::Impl>(
		std::move(filter), pimpl->buffer
	);
	s->shut = pimpl->shut;
	pimpl->subs.push_back(s);
	return std::unique_ptr<Subscription>(new Subscription(std::move(s)));
}

void Journal::shutdown() {
	pimpl->shut = true;
	for (auto const& w : pimpl->subs) {
		auto s = w.lock();
		if (!s)
			continue;
		s->shut = true;
		if (s->pass)
			Subscription::Impl::wake(s);
	}
	pimpl->subs.clear();
}

}
