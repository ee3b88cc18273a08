#undef NDEBUG
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Hold/Main.hpp>
#include<Jsmn/Object.hpp>
#include<Jsmn/Parser.hpp>
#include<Net/Fd.hpp>
#include<assert.h>
#include<iostream>
#include<set>
#include<sstream>
#include<stdexcept>

/* Test that getmanifest causes Hold::Main to emit
 * the commands, options, hooks and notifications we
 * expect.
 */
namespace {
auto const expected_commands = std::vector<std::string>
{ "holdinvoice"
, "injectholdinvoice"
, "settleholdinvoice"
, "cancelholdinvoice"
, "listholdinvoices"
, "cleanholdinvoices"
, "trackholdinvoice"
, "trackallholdinvoices"
};
auto const expected_options = std::vector<std::string>
{ "hold-database"
, "hold-mpp-timeout"
, "hold-expiry-deadline"
, "hold-overpayment-factor"
, "hold-track-buffer"
, "hold-min-final-cltv"
};

std::set<std::string> names_of(Jsmn::Object const& arr, char const* key) {
	assert(arr.is_array());
	auto rv = std::set<std::string>();
	for (auto e : arr) {
		assert(e.is_object());
		assert(e.has(key));
		auto name = e[key];
		assert(name.is_string());
		rv.emplace(std::string(name));
	}
	return rv;
}
}

int main() {
	auto argv = std::vector<std::string>{"hold"};

	auto cin = std::stringstream(R"JSON(
	{"id": 0, "method": "getmanifest", "params": {}}
	)JSON");
	auto cout = std::stringstream("");
	auto cerr = std::stringstream("");

	auto dummy_open_rpc_socket = []( std::string const& lightning_dir
				       , std::string const& rpc_file
				       ){
		throw std::runtime_error("Should not be called");
		return Net::Fd();
	};
	auto main = Hold::Main( argv, cin, cout, cerr
			      , dummy_open_rpc_socket
			      );

	auto ec = Ev::start(main.run().then([](int ec) {
		return Ev::lift(ec);
	}));
	assert(ec == 0);

	std::cout << cout.str() << std::endl;

	Jsmn::Parser parser;
	auto output = parser.feed(cout.str());
	assert(output.size() >= 1);
	auto& last_output = output[output.size() - 1];
	assert(last_output.is_object());
	assert(double(last_output["id"]) == 0);
	assert(last_output.has("result"));
	auto result = last_output["result"];
	assert(result.is_object());

	/* Restarting would lose held HTLCs.  */
	assert(result["dynamic"].is_boolean());
	assert(!bool(result["dynamic"]));

	auto commands = names_of(result["rpcmethods"], "name");
	auto options = names_of(result["options"], "name");
	auto hooks = names_of(result["hooks"], "name");
	auto notifications = names_of(result["notifications"], "method");

	for (auto const& cmd : expected_commands)
		assert(commands.find(cmd) != commands.end());
	assert(commands.size() == expected_commands.size());
	for (auto const& opt : expected_options)
		assert(options.find(opt) != options.end());
	assert(hooks.count("htlc_accepted") == 1);
	assert(notifications.count("holdinvoice_update") == 1);

	return 0;
}
