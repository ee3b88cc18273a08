#include"Ev/Io.hpp"
#include"Hold/Mod/respond.hpp"
#include"Hold/Msg/CommandFail.hpp"
#include"Hold/Msg/CommandResponse.hpp"
#include"Hold/Refused.hpp"
#include"Hold/log.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include<stdexcept>

namespace {

auto const code_invalid_params = int(-32600);
auto const code_refused = int(2103);
auto const code_internal = int(-32603);

Ev::Io<void> fail( S::Bus& bus
		 , Ln::CommandId const& id
		 , int code
		 , std::string message
		 ) {
	return bus.raise(Hold::Msg::CommandFail{
		id, code, std::move(message), Json::Out::empty_object()
	});
}

}

namespace Hold { namespace Mod {

Ev::Io<void> respond( S::Bus& bus
		    , Ln::CommandId id
		    , std::string refused_prefix
		    , Ev::Io<Json::Out> action
		    ) {
	auto answer = action.then([&bus, id](Json::Out result) {
		return bus.raise(Msg::CommandResponse{id, std::move(result)});
	});
	return answer.catching<std::invalid_argument>([&bus, id](std::invalid_argument const& e) {
		return fail(bus, id, code_invalid_params, e.what());
	}).catching<Hold::Refused>([&bus, id, refused_prefix](Hold::Refused const& e) {
		return fail(bus, id, code_refused, refused_prefix + e.what());
	}).catching<std::exception>([&bus, id](std::exception const& e) {
		auto msg = std::string(e.what());
		return Hold::log( bus, Error
				, "Command failed: %s", msg.c_str()
				)
		     + fail(bus, id, code_internal, msg)
		     ;
	});
}

}}
