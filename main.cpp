#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Hold/Main.hpp>
#include<Hold/open_rpc_socket.hpp>
#include<Net/Fd.hpp>
#include<iostream>
#include<memory>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i)
		arg_vec.push_back(std::string(argv[i]));
	auto main_obj = std::make_shared<Hold::Main>(
		arg_vec, std::cin, std::cout, std::cerr,
		Hold::open_rpc_socket
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Keep main_obj alive until the end.  */
		return Ev::lift(ec);
	});
}

}

int main (int argc, char **argv) {
	/* Build the Io before starting the loop: lightningd may
	 * already have written getmanifest to our stdin.  */
	auto code = io_main(argc, argv);
	return Ev::start(code);
}
