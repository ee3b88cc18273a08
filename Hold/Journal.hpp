#ifndef HOLD_JOURNAL_HPP
#define HOLD_JOURNAL_HPP

#include"Hold/Transition.hpp"
#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<cstdint>
#include<functional>
#include<memory>
#include<stdexcept>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Hold {

/** struct Hold::Lagged
 *
 * @brief thrown by `Hold::Journal::Subscription::next`
 * once a subscriber has fallen so far behind that its
 * queue overflowed.
 * The subscription is dead, and the subscriber has to
 * catch up again and resubscribe.
 */
struct Lagged : public Util::BacktraceException<std::runtime_error> {
	Lagged() : Util::BacktraceException<std::runtime_error>(
		"subscriber lagged behind"
	) { }
};

/** class Hold::Journal
 *
 * @brief in-memory, append-only log of committed
 * transitions, with a global sequence number and
 * any number of subscribers.
 *
 * @desc Appending never blocks: each subscription
 * has a bounded queue, and overflowing it closes the
 * subscription with `Hold::Lagged`.
 *
 * Callers append right after the database commit that
 * makes the transition durable, without yielding in
 * between, and subscribe inside the read transaction
 * that fetched their catch-up state.
 * Since database transactions are serialized, that
 * makes every subscriber see each committed
 * transition exactly once.
 */
class Journal {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

public:
	typedef std::function<bool(Transition const&)> Filter;

	/** class Hold::Journal::Subscription
	 *
	 * @brief a handle on the stream of transitions
	 * after the moment of subscription.
	 * Destroying it unsubscribes.
	 */
	class Subscription {
	private:
		class Impl;
		std::shared_ptr<Impl> pimpl;

		friend class Journal;
		friend class Journal::Impl;
		explicit
		Subscription(std::shared_ptr<Impl>);

	public:
		Subscription() =delete;
		Subscription(Subscription const&) =delete;
		~Subscription();

		/** Hold::Journal::Subscription::next
		 *
		 * @brief wait for the next transition.
		 *
		 * @desc Returns null once cancelled.
		 * Throws `Hold::Lagged` after the buffered
		 * transitions if the queue overflowed, or
		 * `Hold::Shutdown` if the journal was shut
		 * down.
		 * Only one `next` may be waiting at a time.
		 */
		Ev::Io<std::shared_ptr<Transition>> next();

		/* Stop delivery, waking any waiting `next`.  */
		void cancel();

		/* Number of transitions queued.  */
		std::size_t pending() const;
	};

	explicit
	Journal(std::size_t history = 4096);
	Journal(Journal&&);
	~Journal();

	/* Queue bound of new subscriptions.  */
	void set_buffer(std::size_t);

	/* Assigns and returns the sequence number.  */
	std::uint64_t append(Transition t);

	/* Sequence number of the latest append, 0 if none.  */
	std::uint64_t last_seq() const;

	/* Retained transitions after the given sequence
	 * number, oldest first.  Only the last `history`
	 * appends are retained.  */
	std::vector<Transition> since( std::uint64_t seq
				     , Filter const& filter = nullptr
				     ) const;

	/* A null filter passes everything.  */
	std::unique_ptr<Subscription> subscribe(Filter filter = nullptr);

	/* Fail every waiting `next` with `Hold::Shutdown`,
	 * and refuse further waits.  */
	void shutdown();
};

}

#endif /* !defined(HOLD_JOURNAL_HPP) */
