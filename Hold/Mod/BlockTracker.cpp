#include"Ev/Io.hpp"
#include"Hold/Mod/BlockTracker.hpp"
#include"Hold/Msg/Block.hpp"
#include"Hold/Msg/ManifestNotification.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Hold/Msg/Notification.hpp"
#include"Hold/log.hpp"
#include"Jsmn/Object.hpp"
#include"S/Bus.hpp"
#include<sstream>

namespace Hold { namespace Mod {

void BlockTracker::start() {
	bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
		return bus.raise(Msg::ManifestNotification{
			"block_added", false
		});
	});
	bus.subscribe<Msg::Notification>([this](Msg::Notification const& n) {
		if (n.notification != "block_added")
			return Ev::lift();
		return on_block_added(n.params);
	});
}

Ev::Io<void> BlockTracker::on_block_added(Jsmn::Object const& params) {
	/* Older lightningd wraps the block in "block", newer
	 * in "block_added".  */
	auto block = Jsmn::Object();
	if (params.is_object() && params.has("block_added"))
		block = params["block_added"];
	else if (params.is_object() && params.has("block"))
		block = params["block"];

	if ( !block.is_object()
	  || !block.has("height")
	  || !block["height"].is_number()
	   ) {
		auto os = std::ostringstream();
		os << params;
		return Hold::log( bus, Error
				, "BlockTracker: unexpected block_added: %s"
				, os.str().c_str()
				);
	}

	auto height = std::uint32_t(double(block["height"]));
	return Hold::log( bus, Debug
			, "BlockTracker: block %u"
			, (unsigned) height
			)
	     + bus.raise(Msg::Block{height})
	     ;
}

}}
