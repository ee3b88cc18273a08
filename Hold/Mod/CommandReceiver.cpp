#include"Hold/Mod/CommandReceiver.hpp"
#include"Hold/Msg/CommandFail.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/CommandResponse.hpp"
#include"Hold/Msg/JsonCin.hpp"
#include"Hold/Msg/JsonCout.hpp"
#include"Hold/Msg/Notification.hpp"
#include"Hold/concurrent.hpp"
#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"

namespace Hold { namespace Mod {

bool CommandReceiver::take(Ln::CommandId const& id) {
	auto it = pendings.find(id);
	if (it == pendings.end())
		return false;
	pendings.erase(it);
	return true;
}

CommandReceiver::CommandReceiver(S::Bus& bus_) : bus(bus_) {
	bus.subscribe<Msg::JsonCin>([this](Msg::JsonCin const& m) {
		auto& inp = m.obj;

		/* Not JSON-RPC, ignore.  */
		if (!inp.is_object() || !inp.has("method"))
			return Ev::lift();
		if (!inp["method"].is_string())
			return Ev::lift();

		auto method = std::string(inp["method"]);
		auto params = inp.has("params") ? inp["params"]
						: Jsmn::Object()
						;

		if (!inp.has("id"))
			return Hold::concurrent(bus.raise(Msg::Notification{
				std::move(method), std::move(params)
			}));

		auto pid = Ln::command_id_from_jsmn_object(inp["id"]);
		if (!pid)
			return Ev::lift();
		pendings.insert(*pid);

		/* Each request runs in its own greenthread, since
		 * hooks and trackers can wait a long time.  */
		return Hold::concurrent(bus.raise(Msg::CommandRequest{
			std::move(method), std::move(params), *pid
		}));
	});

	bus.subscribe<Msg::CommandResponse>([this](Msg::CommandResponse const& r) {
		if (!take(r.id))
			return Ev::lift();
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", r.id)
				.field("result", r.response)
			.end_object()
			;
		return bus.raise(Msg::JsonCout{std::move(js)});
	});
	bus.subscribe<Msg::CommandFail>([this](Msg::CommandFail const& f) {
		if (!take(f.id))
			return Ev::lift();
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", f.id)
				.start_object("error")
					.field("code", f.code)
					.field("message", f.message)
					.field("data", f.data)
				.end_object()
			.end_object()
			;
		return bus.raise(Msg::JsonCout{std::move(js)});
	});
}

}}
