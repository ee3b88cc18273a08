#include"Hold/Msg/JsonCout.hpp"
#include"Hold/log.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace {

char const* level_name(Hold::LogLevel l) {
	switch (l) {
	case Hold::Trace: return "trace";
	case Hold::Debug: return "debug";
	case Hold::Info: return "info";
	case Hold::Warn: return "warn";
	case Hold::Error: return "error";
	}
	return "info";
}

}

namespace Hold {

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	auto js = Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("method", std::string("log"))
			.start_object("params")
				.field("level", std::string(level_name(l)))
				.field("message", msg)
			.end_object()
		.end_object()
		;

	return bus.raise(Hold::Msg::JsonCout{std::move(js)});
}

}
