#ifndef HOLD_LOG_HPP
#define HOLD_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Hold {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/** Hold::log
 *
 * @brief printf-style logging, forwarded to
 * lightningd as a `log` notification.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* HOLD_LOG_HPP */
