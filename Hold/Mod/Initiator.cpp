#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Hold/Mod/Initiator.hpp"
#include"Hold/Mod/Rpc.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/CommandResponse.hpp"
#include"Hold/Msg/EndOfOptions.hpp"
#include"Hold/Msg/Init.hpp"
#include"Hold/Msg/ManifestOption.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Hold/Msg/Option.hpp"
#include"Hold/log.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/NodeId.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<set>
#include<sstream>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace {

struct InitFailed : public Util::BacktraceException<std::runtime_error> {
	InitFailed(std::string const& what, Jsmn::Object const& js)
		: Util::BacktraceException<std::runtime_error>(
			describe(what, js)
		  ) { }

	static
	std::string describe(std::string const& what, Jsmn::Object const& js) {
		auto os = std::ostringstream();
		os << what << ": " << js;
		return os.str();
	}
};

/* Get an optional string field of an object.  */
std::string string_field( Jsmn::Object const& obj
			, char const* name
			, std::string dflt
			) {
	if (!obj.has(name))
		return dflt;
	auto js = obj[name];
	if (!js.is_string())
		throw InitFailed(std::string(name) + " not string", js);
	return std::string(js);
}

}

namespace Hold { namespace Mod {

class Initiator::Impl {
private:
	S::Bus& bus;
	Ev::ThreadPool& threadpool;
	std::function<Net::Fd( std::string const&
			     , std::string const&
			     )> open_rpc_socket;

	bool initted;
	std::set<std::string> options;
	std::string database;

	std::unique_ptr<Hold::Mod::Rpc> rpc;
	Sqlite3::Db db;

	Ev::Io<void> announce_options(Jsmn::Object const& params) {
		if (!params.has("options"))
			return bus.raise(Msg::EndOfOptions{});
		auto opts = params["options"];
		if (!opts.is_object())
			throw InitFailed("options not object", opts);
		auto act = Ev::lift();
		for (auto const& o : options) {
			if (!opts.has(o))
				continue;
			act += bus.raise(Msg::Option{o, opts[o]});
		}
		return act + bus.raise(Msg::EndOfOptions{});
	}

	struct NodeInfo {
		Ln::NodeId id;
		std::string network;
		std::uint32_t blockheight;
	};
	static
	NodeInfo parse_getinfo(Jsmn::Object const& info) {
		auto rv = NodeInfo();
		if (!info.is_object())
			throw InitFailed("getinfo result not object", info);
		auto id = string_field(info, "id", "");
		if (!Ln::NodeId::valid_string(id))
			throw InitFailed("getinfo has no valid id", info);
		rv.id = Ln::NodeId(id);
		rv.network = string_field(info, "network", "bitcoin");
		rv.blockheight = 0;
		if (info.has("blockheight") && info["blockheight"].is_number())
			rv.blockheight = std::uint32_t(double(info["blockheight"]));
		return rv;
	}

	Ev::Io<void> init(Ln::CommandId id, Jsmn::Object params) {
		if (!params.is_object())
			throw InitFailed("params not object", params);
		if (!params.has("configuration"))
			throw InitFailed("no configuration", params);
		auto conf = params["configuration"];
		if (!conf.is_object())
			throw InitFailed("configuration not object", conf);

		auto lightning_dir = string_field(conf, "lightning-dir", ".");
		auto rpc_file = string_field(conf, "rpc-file", "lightning-rpc");

		return Hold::log( bus, Info, "%s starting", PACKAGE_STRING
				).then([this, params]() {
			return announce_options(params);
		}).then([this, lightning_dir, rpc_file]() {
			/* This also changes into the lightning
			 * directory, so the database path below
			 * is relative to it.  */
			return threadpool.background<Net::Fd>([ this
							      , lightning_dir
							      , rpc_file
							      ]() {
				return open_rpc_socket(lightning_dir, rpc_file);
			});
		}).then([this](Net::Fd fd) {
			rpc = Util::make_unique<Hold::Mod::Rpc>(bus, std::move(fd));
			db = Sqlite3::Db(database);
			return Hold::log( bus, Debug
					, "Opened RPC socket and database %s."
					, database.c_str()
					);
		}).then([this]() {
			return rpc->command("getinfo", Json::Out::empty_object());
		}).then([this](Jsmn::Object info) {
			auto node = parse_getinfo(info);
			auto self = std::string(node.id);
			return Hold::log( bus, Info
					, "Node %s on %s at height %u."
					, self.c_str()
					, node.network.c_str()
					, (unsigned) node.blockheight
					).then([this, node]() {
				return bus.raise(Msg::Init{
					*rpc, node.id, node.network, db,
					node.blockheight
				});
			});
		}).then([this, id]() {
			return bus.raise(Msg::CommandResponse{
				id, Json::Out::empty_object()
			});
		});
	}

	Ev::Io<void> disable(Ln::CommandId id, std::string const& why) {
		return Hold::log( bus, Error, "init: %s", why.c_str()
				).then([this, id, why]() {
			return bus.raise(Msg::CommandResponse{
				id, Json::Out()
					.start_object()
						.field("disable", why)
					.end_object()
			});
		});
	}

public:
	Impl( S::Bus& bus_
	    , Ev::ThreadPool& threadpool_
	    , std::function<Net::Fd( std::string const&
				   , std::string const&
				   )> open_rpc_socket_
	    ) : bus(bus_)
	      , threadpool(threadpool_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , initted(false)
	      , database("hold.sqlite3")
	      {
		assert(open_rpc_socket);

		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestOption{
				"hold-database", Msg::OptionType_String,
				Json::Out::direct(std::string("hold.sqlite3")),
				"SQLite3 file of hold invoices, relative "
				"to the lightning directory."
			});
		});
		/* Remember every option, so that it can be
		 * handed back during init.  */
		bus.subscribe<Msg::ManifestOption>([this](Msg::ManifestOption const& o) {
			options.insert(o.name);
			return Ev::lift();
		});
		bus.subscribe<Msg::Option>([this](Msg::Option const& o) {
			if (o.name != "hold-database")
				return Ev::lift();
			if (o.value.is_string())
				database = std::string(o.value);
			return Ev::lift();
		});

		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& c) {
			if (c.command != "init")
				return Ev::lift();
			auto id = c.id;
			if (initted)
				return disable(id, "init received twice");
			initted = true;

			auto params = c.params;
			return Ev::lift().then([this, id, params]() {
				return init(id, params);
			}).catching<std::exception>([this, id](std::exception const& e) {
				return disable(id, e.what());
			});
		});
	}
};

Initiator::Initiator( S::Bus& bus
		    , Ev::ThreadPool& threadpool
		    , std::function<Net::Fd( std::string const&
					   , std::string const&
					   )> open_rpc_socket
		    ) : pimpl(Util::make_unique<Impl>( bus, threadpool
						     , std::move(open_rpc_socket)
						     ))
		      { }
Initiator::Initiator(Initiator&&) =default;
Initiator::~Initiator() =default;

}}
