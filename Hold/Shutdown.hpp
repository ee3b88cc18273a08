#ifndef HOLD_SHUTDOWN_HPP
#define HOLD_SHUTDOWN_HPP

namespace Hold {

/** struct Hold::Shutdown
 *
 * @brief thrown by waiting operations, such as
 * subscription reads and timers, once the plugin
 * is being torn down.
 */
struct Shutdown {};

}

#endif /* !defined(HOLD_SHUTDOWN_HPP) */
