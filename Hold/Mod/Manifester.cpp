#include"Ev/Io.hpp"
#include"Hold/Mod/Manifester.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/CommandResponse.hpp"
#include"Hold/Msg/ManifestHook.hpp"
#include"Hold/Msg/ManifestNotification.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"

namespace {

std::string type_name(Hold::Msg::OptionType t) {
	switch (t) {
	case Hold::Msg::OptionType_String: return "string";
	case Hold::Msg::OptionType_Bool: return "bool";
	case Hold::Msg::OptionType_Int: return "int";
	case Hold::Msg::OptionType_Flag: return "flag";
	}
	return "string";
}

}

namespace Hold { namespace Mod {

void Manifester::start() {
	bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& req) {
		if (req.command != "getmanifest")
			return Ev::lift();

		auto id = req.id;
		return bus.raise(Msg::Manifestation()).then([this, id]() {
			auto result = Json::Out();
			auto robj = result.start_object();
			/* Held HTLCs must not lose their plugin, so
			 * no unloading at runtime.  */
			robj.field("dynamic", false);

			auto harr = robj.start_array("hooks");
			for (auto const& h : hooks)
				harr.entry(Json::Out()
					.start_object()
						.field("name", h)
					.end_object()
				);
			harr.end_array();

			auto sarr = robj.start_array("subscriptions");
			for (auto const& s : subscriptions)
				sarr.entry(s);
			sarr.end_array();

			auto narr = robj.start_array("notifications");
			for (auto const& n : emitted)
				narr.entry(Json::Out()
					.start_object()
						.field("method", n)
					.end_object()
				);
			narr.end_array();

			auto carr = robj.start_array("rpcmethods");
			for (auto const& c : commands) {
				auto const& info = c.second;
				carr.entry(Json::Out()
					.start_object()
						.field("name", info.name)
						.field("usage", info.usage)
						.field("description", info.description)
						.field("deprecated", info.deprecated)
					.end_object()
				);
			}
			carr.end_array();

			auto oarr = robj.start_array("options");
			for (auto const& o : options) {
				auto const& info = o.second;
				oarr.entry(Json::Out()
					.start_object()
						.field("name", info.name)
						.field("type", type_name(info.type))
						.field("default", info.default_value)
						.field("description", info.description)
					.end_object()
				);
			}
			oarr.end_array();

			robj.end_object();

			hooks.clear();
			subscriptions.clear();
			emitted.clear();
			commands.clear();
			options.clear();

			return bus.raise(Msg::CommandResponse{id, result});
		});
	});

	bus.subscribe<Msg::ManifestCommand>([this](Msg::ManifestCommand const& c) {
		commands[c.name] = c;
		return Ev::lift();
	});
	bus.subscribe<Msg::ManifestOption>([this](Msg::ManifestOption const& o) {
		options[o.name] = o;
		return Ev::lift();
	});
	bus.subscribe<Msg::ManifestHook>([this](Msg::ManifestHook const& h) {
		hooks.insert(h.name);
		return Ev::lift();
	});
	bus.subscribe<Msg::ManifestNotification>([this](Msg::ManifestNotification const& n) {
		if (n.emit)
			emitted.insert(n.name);
		else
			subscriptions.insert(n.name);
		return Ev::lift();
	});
}

}}
