#ifndef HOLD_CONCURRENT_HPP
#define HOLD_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Hold {

/** Hold::concurrent
 *
 * @brief `Ev::concurrent`, except that a
 * `Hold::Shutdown` escaping the new greenthread
 * ends it quietly.
 */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(HOLD_CONCURRENT_HPP) */
