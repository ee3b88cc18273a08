#ifndef HOLD_MOD_WAITER_HPP
#define HOLD_MOD_WAITER_HPP

#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::Waiter
 *
 * @brief timers on the libev loop.
 *
 * @desc On `Hold::Shutdown`, every pending timer
 * fails with `Hold::Shutdown`, and so does every
 * later `wait`.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Waiter() =delete;
	Waiter(Waiter const&) =delete;

	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/** Hold::Mod::Waiter::wait
	 *
	 * @brief completes after the given number of
	 * seconds.
	 */
	Ev::Io<void> wait(double seconds);

	/** Hold::Mod::Waiter::timed
	 *
	 * @brief performs the action, throwing `TimedOut`
	 * if it does not complete in time.
	 *
	 * @desc The action cannot be cancelled and keeps
	 * running after a timeout; its result, if any, is
	 * then dropped.
	 * The timer is stopped as soon as the action ends.
	 */
	template<typename a>
	Ev::Io<a> timed( double timeout
		       , Ev::Io<a> action
		       );
	struct TimedOut { };

private:
	Ev::Io<void> timed_core( double timeout
			       , Ev::Io<void> action
			       );
};

template<typename a>
inline
Ev::Io<a> Waiter::timed( double timeout
		       , Ev::Io<a> action
		       ) {
	auto paction = std::make_shared<Ev::Io<a>>(std::move(action));
	auto presult = std::make_shared<std::unique_ptr<a>>();
	auto core = Ev::lift().then([paction, presult]() {
		return std::move(*paction).then([presult](a value) {
			*presult = Util::make_unique<a>(std::move(value));
			return Ev::lift();
		});
	});
	return timed_core(timeout, std::move(core)).then([presult]() {
		return Ev::lift(std::move(**presult));
	});
}
template<>
inline
Ev::Io<void> Waiter::timed<void>( double timeout
				, Ev::Io<void> action
				) {
	return timed_core(timeout, std::move(action));
}

}}

#endif /* !defined(HOLD_MOD_WAITER_HPP) */
