#include"Ev/Io.hpp"
#include"Hold/Mod/Rpc.hpp"
#include"Hold/Shutdown.hpp"
#include"Hold/log.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<cstdint>
#include<errno.h>
#include<ev.h>
#include<fcntl.h>
#include<map>
#include<sstream>
#include<string.h>
#include<unistd.h>

namespace {

/* Responses can be huge, so logs only show the
 * start.  */
std::string abbreviate(Jsmn::Object const& val) {
	char const* t;
	std::size_t len;
	val.direct_text(t, len);
	if (len > 200)
		return std::string(t, 200) + "...";
	return std::string(t, len);
}

}

namespace Hold { namespace Mod {

std::string RpcError::describe( std::string const& command
			      , Jsmn::Object const& e
			      ) {
	auto os = std::ostringstream();
	os << command << ": " << e;
	return os.str();
}

RpcError::RpcError( std::string command_
		  , Jsmn::Object error_
		  ) : Util::BacktraceException<std::runtime_error>(
			describe(command_, error_)
		    )
		    , command(std::move(command_))
		    , error(std::move(error_))
		    { }

int RpcError::code() const {
	if (!error.is_object() || !error.has("code"))
		return 0;
	auto c = error["code"];
	if (!c.is_number())
		return 0;
	return int(double(c));
}

class Rpc::Impl {
private:
	typedef std::function<void(Jsmn::Object)> PassF;
	typedef std::function<void(std::exception_ptr)> FailF;

	S::Bus& bus;
	Net::Fd socket;
	Jsmn::Parser parser;

	/* Set once we can no longer talk to lightningd;
	 * all later commands fail with this.  */
	std::exception_ptr dead;

	std::uint64_t next_id;
	struct Pending {
		std::string command;
		PassF pass;
		FailF fail;
	};
	std::map<std::uint64_t, Pending> pendings;

	std::string outbuf;

	ev_io reader;
	ev_io writer;
	bool writing;

	template<typename E>
	static
	std::exception_ptr make_exception(E e) {
		try {
			throw e;
		} catch (...) {
			return std::current_exception();
		}
	}

	void die(std::exception_ptr e) {
		if (dead)
			return;
		dead = e;
		ev_io_stop(EV_DEFAULT_ &reader);
		if (writing) {
			ev_io_stop(EV_DEFAULT_ &writer);
			writing = false;
		}
		outbuf.clear();

		auto failing = std::move(pendings);
		pendings.clear();
		for (auto& p : failing)
			p.second.fail(e);
	}

	void dispatch(Jsmn::Object const& resp) {
		if (!resp.is_object() || !resp.has("id"))
			return;
		auto jid = resp["id"];
		if (!jid.is_number())
			return;
		auto it = pendings.find(std::uint64_t(double(jid)));
		if (it == pendings.end())
			return;

		auto p = std::move(it->second);
		pendings.erase(it);
		if (resp.has("error"))
			p.fail(make_exception(RpcError( std::move(p.command)
						      , resp["error"]
						      )));
		else if (resp.has("result"))
			p.pass(resp["result"]);
		else
			p.fail(make_exception(RpcError( std::move(p.command)
						      , Jsmn::Object()
						      )));
	}

	void on_readable() {
		char buf[4096];
		auto res = ssize_t();
		do {
			res = read(socket.get(), buf, sizeof(buf));
		} while (res < 0 && errno == EINTR);
		if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
			return;
		if (res < 0)
			return die(make_exception(std::runtime_error(
				std::string("Rpc: read: ") + strerror(errno)
			)));
		if (res == 0)
			return die(make_exception(std::runtime_error(
				"Rpc: lightningd closed the RPC socket"
			)));

		auto responses = std::vector<Jsmn::Object>();
		try {
			responses = parser.feed(std::string(buf, res));
		} catch (std::exception const& e) {
			return die(make_exception(std::runtime_error(
				std::string("Rpc: bad response: ") + e.what()
			)));
		}
		for (auto const& r : responses)
			dispatch(r);
	}
	static
	void on_readable_static(EV_P_ ev_io* w, int) {
		static_cast<Impl*>(w->data)->on_readable();
	}

	void flush() {
		while (!outbuf.empty()) {
			auto res = ssize_t();
			do {
				res = write( socket.get()
					   , outbuf.data(), outbuf.size()
					   );
			} while (res < 0 && errno == EINTR);
			if (res < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
				break;
			if (res < 0)
				return die(make_exception(std::runtime_error(
					std::string("Rpc: write: ") + strerror(errno)
				)));
			outbuf.erase(0, std::size_t(res));
		}
		if (outbuf.empty() && writing) {
			ev_io_stop(EV_DEFAULT_ &writer);
			writing = false;
		} else if (!outbuf.empty() && !writing) {
			ev_io_start(EV_DEFAULT_ &writer);
			writing = true;
		}
	}
	static
	void on_writable_static(EV_P_ ev_io* w, int) {
		static_cast<Impl*>(w->data)->flush();
	}

	Ev::Io<Jsmn::Object> send(std::string const& command, Json::Out params) {
		return Ev::Io<Jsmn::Object>([this, command, params](PassF pass, FailF fail) {
			if (dead)
				return fail(dead);
			auto id = next_id++;
			outbuf += Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", id)
					.field("method", command)
					.field("params", params)
				.end_object()
				.output();
			outbuf += "\n\n";
			pendings[id] = Pending{ command
					      , std::move(pass)
					      , std::move(fail)
					      };
			flush();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Net::Fd socket_
	    ) : bus(bus_)
	      , socket(std::move(socket_))
	      , next_id(1)
	      , writing(false)
	      {
		auto flags = fcntl(socket.get(), F_GETFL);
		fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK);

		ev_io_init(&reader, &on_readable_static, socket.get(), EV_READ);
		reader.data = this;
		ev_io_start(EV_DEFAULT_ &reader);
		ev_io_init(&writer, &on_writable_static, socket.get(), EV_WRITE);
		writer.data = this;

		bus.subscribe<Hold::Shutdown>([this](Hold::Shutdown const& s) {
			die(make_exception(s));
			return Ev::lift();
		});
	}
	~Impl() {
		die(make_exception(Hold::Shutdown()));
	}

	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    ) {
		auto text = params.output();
		return Hold::log( bus, Trace
				, "Rpc out: %s %s"
				, command.c_str(), text.c_str()
				).then([this, command, params]() {
			return send(command, params);
		}).then([this, command](Jsmn::Object res) {
			return Hold::log( bus, Trace
					, "Rpc in: %s => %s"
					, command.c_str()
					, abbreviate(res).c_str()
					).then([res]() {
				return Ev::lift(res);
			});
		});
	}
};

Rpc::Rpc( S::Bus& bus
	, Net::Fd socket
	) : pimpl(Util::make_unique<Impl>(bus, std::move(socket))) { }
Rpc::Rpc(Rpc&&) =default;
Rpc::~Rpc() =default;

Ev::Io<Jsmn::Object> Rpc::command( std::string const& command
				 , Json::Out params
				 ) {
	assert(pimpl);
	return pimpl->command(command, std::move(params));
}

}}
