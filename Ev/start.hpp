#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief run the given action in the main loop until
 * the loop has nothing left to do.
 *
 * @return the value the action returned, used as the
 * process exit code.
 */
int start(Ev::Io<int> io);

}

#endif /* !defined(EV_START_HPP) */
