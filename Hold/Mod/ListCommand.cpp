#include"Ev/Io.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Mod/ListCommand.hpp"
#include"Hold/Mod/ParamError.hpp"
#include"Hold/Mod/Params.hpp"
#include"Hold/Mod/jsonify.hpp"
#include"Hold/Mod/respond.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/Msg/ManifestCommand.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"

namespace Hold { namespace Mod {

class ListCommand::Impl {
private:
	S::Bus& bus;
	Hold::Engine* engine;

	Hold::Engine& get_engine() {
		if (!engine)
			throw std::runtime_error("hold invoice engine not ready");
		return *engine;
	}

	Ev::Io<Json::Out> list(Jsmn::Object const& params) {
		auto p = Params(params, { "payment_hash"
					, "bolt11"
					, "index_start"
					, "limit"
					});
		auto f = Store::Filter();
		if (p.has("payment_hash") && p.has("bolt11"))
			throw ParamError( "payment_hash and bolt11 are "
					  "mutually exclusive"
					);
		if (p.has("payment_hash"))
			f.payment_hash = Util::make_unique<Sha256::Hash>(
				p.hash("payment_hash")
			);
		if (p.has("bolt11"))
			f.bolt11 = Util::make_unique<std::string>(
				p.string("bolt11")
			);
		/* Ids start at 1, so 0 is the same as 1.  */
		if (p.has("index_start"))
			f.index_start = p.u64("index_start");
		if (p.has("limit")) {
			f.limit = p.u64("limit");
			if (f.limit == 0)
				throw ParamError("limit must be positive");
		}

		return get_engine().list(std::move(f)
		).then([](std::vector<Hold::Invoice> invoices) {
			auto rv = Json::Out();
			auto arr = rv.start_object().start_array("holdinvoices");
			for (auto const& inv : invoices)
				arr.entry(jsonify(inv));
			arr.end_array().end_object();
			return Ev::lift(std::move(rv));
		});
	}

	Ev::Io<Json::Out> clean(Jsmn::Object const& params) {
		auto p = Params(params, {"age"});
		auto age = p.has("age") ? p.u64("age") : std::uint64_t(0);
		return get_engine().clean(age).then([](std::uint64_t n) {
			return Ev::lift(Json::Out()
				.start_object()
					.field("cleaned", n)
				.end_object()
			);
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), engine(nullptr) {
		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestCommand{
				"listholdinvoices",
				"[payment_hash] [bolt11] [index_start] [limit]",
				"List hold invoices with their HTLCs, by id, "
				"optionally only the one of {payment_hash} or "
				"{bolt11}.",
				false
			}) + bus.raise(Msg::ManifestCommand{
				"cleanholdinvoices",
				"[age]",
				"Delete cancelled hold invoices created more "
				"than {age} seconds ago, default 0.",
				false
			});
		});
		bus.subscribe<Msg::EngineReady>([this](Msg::EngineReady const& m) {
			engine = &m.engine;
			return Ev::lift();
		});
		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& r) {
			auto params = r.params;
			if (r.command == "listholdinvoices")
				return respond( bus, r.id
					      , "could not list invoices: "
					      , Ev::lift().then([this, params]() {
					return list(params);
				}));
			if (r.command == "cleanholdinvoices")
				return respond( bus, r.id
					      , "could not clean invoices: "
					      , Ev::lift().then([this, params]() {
					return clean(params);
				}));
			return Ev::lift();
		});
	}
};

ListCommand::ListCommand(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
ListCommand::ListCommand(ListCommand&&) =default;
ListCommand::~ListCommand() =default;

}}
