#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Hold/Mod/Rpc.hpp"
#include"Hold/Shutdown.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<cstdint>
#include<errno.h>
#include<fcntl.h>
#include<sys/socket.h>
#include<sys/types.h>
#include<unistd.h>

namespace {

/* Plays lightningd on the other end of the socket.  */
class FakeNode {
private:
	Net::Fd socket;
	Jsmn::Parser parser;

	Ev::Io<void> writeloop(std::string to_write) {
		return Ev::yield().then([this, to_write]() {
			auto res = write( socket.get()
					, to_write.c_str(), to_write.size()
					);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				return writeloop(to_write);
			assert(res >= 0);
			if (std::size_t(res) < to_write.size())
				return writeloop(to_write.substr(res));
			return Ev::yield();
		});
	}

public:
	std::vector<Jsmn::Object> requests;

	explicit
	FakeNode(Net::Fd socket_) : socket(std::move(socket_)) {
		auto flags = fcntl(socket.get(), F_GETFL);
		fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK);
	}

	/* Read until at least `n` requests arrived.  */
	Ev::Io<void> receive(std::size_t n) {
		return Ev::yield().then([this, n]() {
			char buf[256];
			for (;;) {
				auto res = read(socket.get(), buf, sizeof(buf));
				if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
					break;
				assert(res > 0);
				for (auto& r : parser.feed(std::string(buf, res)))
					requests.push_back(std::move(r));
			}
			if (requests.size() < n)
				return receive(n);
			return Ev::lift();
		});
	}

	Ev::Io<void> result(std::uint64_t id, Json::Out res) {
		return writeloop(Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", id)
				.field("result", res)
			.end_object()
			.output()
		);
	}
	Ev::Io<void> error(std::uint64_t id, int code, std::string msg) {
		return writeloop(Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", id)
				.start_object("error")
					.field("code", code)
					.field("message", msg)
				.end_object()
			.end_object()
			.output()
		);
	}
};

}

int main() {
	S::Bus bus;

	int sockets[2];
	auto res = socketpair(AF_UNIX, SOCK_STREAM, 0, sockets);
	assert(res >= 0);

	auto node_socket = Net::Fd(sockets[0]);
	FakeNode node(std::move(node_socket));
	auto rpc = Hold::Mod::Rpc(bus, Net::Fd(sockets[1]));

	auto got_info = false;
	auto got_error = false;
	auto got_shutdown = false;
	auto got_dead = false;

	/* Two commands in flight, answered out of order.  */
	auto node_code = Ev::lift().then([&]() {
		return node.receive(2);
	}).then([&]() {
		/* Answer the later one first.  */
		auto getinfo_id = std::uint64_t(0);
		auto signinvoice_id = std::uint64_t(0);
		for (auto const& r : node.requests) {
			auto id = std::uint64_t(double(r["id"]));
			auto method = std::string(r["method"]);
			if (method == "getinfo")
				getinfo_id = id;
			else if (method == "signinvoice") {
				signinvoice_id = id;
				assert(std::string(r["params"]["invstring"]) == "lnbc1");
			}
		}
		assert(getinfo_id != 0);
		assert(signinvoice_id != 0);
		assert(getinfo_id != signinvoice_id);
		return node.error(signinvoice_id, 209, "bad invoice"
				 ).then([&node, getinfo_id]() {
			return node.result(getinfo_id, Json::Out()
				.start_object()
					.field("blockheight", 600000)
				.end_object()
			);
		});
	}).then([&]() {
		/* Third command is never answered.  */
		return node.receive(3);
	}).then([&]() {
		return bus.raise(Hold::Shutdown());
	});

	auto getinfo = rpc.command("getinfo", Json::Out::empty_object()
			).then([&](Jsmn::Object r) {
		assert(double(r["blockheight"]) == 600000);
		/* The error was answered first.  */
		assert(got_error);
		got_info = true;
		return Ev::lift();
	});
	auto signinvoice = rpc.command("signinvoice", Json::Out()
			.start_object()
				.field("invstring", std::string("lnbc1"))
			.end_object()
			).then([](Jsmn::Object) {
		assert(false);
		return Ev::lift();
	}).catching<Hold::Mod::RpcError>([&](Hold::Mod::RpcError const& e) {
		assert(e.command == "signinvoice");
		assert(e.code() == 209);
		got_error = true;
		return Ev::lift();
	});

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(node_code)
		     + Ev::concurrent(signinvoice)
		     ;
	}).then([&]() {
		return getinfo;
	}).then([&]() {
		return rpc.command("waitblockheight", Json::Out::empty_object()
				  ).then([](Jsmn::Object) {
			return Ev::lift(false);
		}).catching<Hold::Shutdown>([](Hold::Shutdown const&) {
			return Ev::lift(true);
		});
	}).then([&](bool flag) {
		got_shutdown = flag;
		/* Once dead, commands fail at once.  */
		return rpc.command("getinfo", Json::Out::empty_object()
				  ).then([](Jsmn::Object) {
			return Ev::lift(false);
		}).catching<Hold::Shutdown>([](Hold::Shutdown const&) {
			return Ev::lift(true);
		});
	}).then([&](bool flag) {
		got_dead = flag;
		return Ev::lift(0);
	});

	auto ec = Ev::start(code);

	assert(got_info);
	assert(got_error);
	assert(got_shutdown);
	assert(got_dead);

	return ec;
}
