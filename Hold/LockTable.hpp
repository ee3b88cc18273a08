#ifndef HOLD_LOCKTABLE_HPP
#define HOLD_LOCKTABLE_HPP

#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Sha256/Hash.hpp"
#include<memory>

namespace Hold {

/** class Hold::LockTable
 *
 * @brief serializes actions per payment hash.
 *
 * @desc Actions on the same hash run one at a time,
 * in the order they were started.
 * Actions on different hashes may interleave.
 * An entry exists only while some action on its hash
 * is running or waiting.
 *
 * The table must outlive every action run through it.
 */
class LockTable {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	Ev::Io<void> core_run(Sha256::Hash const& h, Ev::Io<void> action);

public:
	LockTable();
	LockTable(LockTable&&);
	~LockTable();

	template<typename a>
	Ev::Io<a> run(Sha256::Hash const& h, Ev::Io<a> action) {
		return Ev::Detail::SemaphoreRunHelper<a>::run(
			std::move(action),
			[this, h](Ev::Io<void> action) {
				return core_run(h, std::move(action));
			}
		);
	}

	/* Number of hashes with a running or waiting action.  */
	std::size_t size() const;
};

}

#endif /* !defined(HOLD_LOCKTABLE_HPP) */
