#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Hold/Engine.hpp"
#include"Hold/Invoice.hpp"
#include"Hold/Mod/InvoiceCommand.hpp"
#include"Hold/Mod/ParamError.hpp"
#include"Hold/Mod/Params.hpp"
#include"Hold/Mod/Rpc.hpp"
#include"Hold/Mod/respond.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/EngineReady.hpp"
#include"Hold/Msg/Init.hpp"
#include"Hold/Msg/ManifestCommand.hpp"
#include"Hold/Msg/Manifestation.hpp"
#include"Hold/log.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Bolt11.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/make_unique.hpp"

namespace {

/* var_onion_optin and payment_secret required,
 * basic_mpp optional.  */
unsigned int const invoice_features[] = {8, 14, 17};

std::uint32_t u32_field(Jsmn::Object const& hop, char const* name) {
	auto js = hop[name];
	if (!js.is_number() || double(js) < 0 || double(js) > 4294967295.0)
		throw Hold::Mod::ParamError(
			std::string("routing_hints: bad ") + name
		);
	return std::uint32_t(double(js));
}

/* [[{id, short_channel_id, fee_base_msat,
 *    fee_proportional_millionths, cltv_expiry_delta}, ...], ...] */
std::vector<Ln::Bolt11::RouteHint> parse_route_hints(Jsmn::Object const& js) {
	auto rv = std::vector<Ln::Bolt11::RouteHint>();
	if (!js.is_array())
		throw Hold::Mod::ParamError("routing_hints must be an array");
	for (auto const& hint_js : js) {
		if (!hint_js.is_array() || hint_js.size() == 0)
			throw Hold::Mod::ParamError(
				"routing_hints entries must be non-empty arrays"
			);
		auto hint = Ln::Bolt11::RouteHint();
		for (auto const& hop_js : hint_js) {
			if (!hop_js.is_object())
				throw Hold::Mod::ParamError(
					"routing_hints hops must be objects"
				);
			auto hop = Ln::Bolt11::RouteHop();
			auto id = hop_js["id"];
			if (!id.is_string() || !Ln::NodeId::valid_string(std::string(id)))
				throw Hold::Mod::ParamError("routing_hints: bad id");
			hop.node_id = Ln::NodeId(std::string(id));
			auto scid = hop_js["short_channel_id"];
			if (!scid.is_string() || !Ln::Scid::valid_string(std::string(scid)))
				throw Hold::Mod::ParamError(
					"routing_hints: bad short_channel_id"
				);
			hop.scid = Ln::Scid(std::string(scid));
			hop.fee_base_msat = u32_field(hop_js, "fee_base_msat");
			hop.fee_proportional_millionths = u32_field(
				hop_js, "fee_proportional_millionths"
			);
			auto delta = u32_field(hop_js, "cltv_expiry_delta");
			if (delta > 0xFFFF)
				throw Hold::Mod::ParamError(
					"routing_hints: bad cltv_expiry_delta"
				);
			hop.cltv_expiry_delta = std::uint16_t(delta);
			hint.push_back(std::move(hop));
		}
		rv.push_back(std::move(hint));
	}
	return rv;
}

/* Whether we are the payee, or are on one of its
 * route hints.  */
bool related_to(Ln::Bolt11::Invoice const& inv, Ln::NodeId const& self) {
	if (inv.payee == self)
		return true;
	for (auto const& hint : inv.route_hints)
		for (auto const& hop : hint)
			if (hop.node_id == self)
				return true;
	return false;
}

}

namespace Hold { namespace Mod {

class InvoiceCommand::Impl {
private:
	S::Bus& bus;
	Hold::Mod::Rpc* rpc;
	Ln::NodeId self_id;
	std::string network;
	Hold::Engine* engine;
	Secp256k1::Random random;

	void check_ready() const {
		if (!engine || !rpc)
			throw std::runtime_error("hold invoice engine not ready");
	}

	Ev::Io<Json::Out> holdinvoice(Jsmn::Object const& params) {
		check_ready();
		auto p = Params(params, { "payment_hash"
					, "amount_msat"
					, "description"
					, "expiry"
					, "min_final_cltv_expiry"
					, "preimage"
					, "description_hash"
					, "routing_hints"
					});

		auto b11 = Ln::Bolt11::Invoice();
		b11.currency = Ln::Bolt11::currency_of_network(network);
		b11.payment_hash = p.hash("payment_hash");

		auto amount = p.get("amount_msat");
		if (amount.is_string() && std::string(amount) == "any") {
			b11.has_amount = false;
		} else {
			b11.has_amount = true;
			b11.amount = p.amount("amount_msat");
			/* No HTLC could ever pay it.  */
			if (b11.amount == Ln::Amount::msat(0))
				throw ParamError("amount_msat must be positive");
		}

		if (p.has("description") && p.has("description_hash"))
			throw ParamError( "description and description_hash "
					  "are mutually exclusive"
					);
		if (p.has("description_hash")) {
			b11.has_description_hash = true;
			b11.description_hash = p.hash("description_hash");
		} else if (p.has("description"))
			b11.description = p.string("description");

		if (p.has("expiry"))
			b11.expiry = p.u64("expiry");
		b11.min_final_cltv_expiry = engine->policy().min_final_cltv;
		if (p.has("min_final_cltv_expiry")) {
			auto c = p.u64("min_final_cltv_expiry");
			if (c == 0 || c > 0xFFFFFFFFu)
				throw ParamError("bad min_final_cltv_expiry");
			b11.min_final_cltv_expiry = std::uint32_t(c);
		}
		if (p.has("routing_hints"))
			b11.route_hints = parse_route_hints(p.get("routing_hints"));

		auto preimage = Ln::Preimage();
		if (p.has("preimage")) {
			preimage = p.preimage("preimage");
			if (preimage.sha256() != b11.payment_hash)
				throw ParamError( "preimage does not match "
						  "payment_hash"
						);
		}

		b11.timestamp = std::uint64_t(Ev::now());
		b11.payment_secret = Ln::Preimage(random);
		for (auto f : invoice_features)
			b11.features.insert(f);

		/* signinvoice replaces the signature with the
		 * node's own.  */
		auto unsigned_invoice = Ln::Bolt11::encode(
			b11, Secp256k1::PrivKey(random)
		);
		auto parms = Json::Out()
			.start_object()
				.field("invstring", unsigned_invoice)
			.end_object()
			;
		return rpc->command("signinvoice", parms
		).then([this, b11, preimage](Jsmn::Object res) {
			if (!res.is_object() || !res["bolt11"].is_string())
				throw std::runtime_error(
					"signinvoice: no bolt11 in result"
				);
			auto inv = Hold::Invoice();
			inv.payment_hash = b11.payment_hash;
			inv.preimage = preimage;
			inv.bolt11 = std::string(res["bolt11"]);
			inv.has_amount = b11.has_amount;
			inv.amount = b11.amount;
			inv.payment_secret = b11.payment_secret;
			inv.min_cltv = b11.min_final_cltv_expiry;
			auto bolt11 = inv.bolt11;
			return engine->add_invoice(std::move(inv)
			).then([bolt11](std::uint64_t) {
				return Ev::lift(Json::Out()
					.start_object()
						.field("bolt11", bolt11)
					.end_object()
				);
			});
		});
	}

	Ev::Io<Json::Out> inject(Jsmn::Object const& params) {
		check_ready();
		auto p = Params(params, {"bolt11", "min_cltv"});
		auto bolt11 = p.string("bolt11");
		auto b11 = Ln::Bolt11::decode(bolt11);
		if (!related_to(b11, self_id))
			throw ParamError("invoice is not related to us");
		if (b11.has_amount && b11.amount == Ln::Amount::msat(0))
			throw ParamError("invoice amount must be positive");

		auto inv = Hold::Invoice();
		inv.payment_hash = b11.payment_hash;
		inv.bolt11 = bolt11;
		inv.has_amount = b11.has_amount;
		inv.amount = b11.amount;
		inv.payment_secret = b11.payment_secret;
		if (p.has("min_cltv")) {
			auto c = p.u64("min_cltv");
			if (c > 0xFFFFFFFFu)
				throw ParamError("bad min_cltv");
			inv.min_cltv = std::uint32_t(c);
		}
		return engine->add_invoice(std::move(inv)
		).then([](std::uint64_t) {
			return Ev::lift(Json::Out::empty_object());
		});
	}

	void start() {
		bus.subscribe<Msg::Manifestation>([this](Msg::Manifestation const&) {
			return bus.raise(Msg::ManifestCommand{
				"holdinvoice",
				"payment_hash amount_msat [description] "
				"[expiry] [min_final_cltv_expiry] [preimage] "
				"[description_hash] [routing_hints]",
				"Create an invoice for {payment_hash} whose "
				"payment is held until settled or cancelled.  "
				"{amount_msat} may be \"any\".",
				false
			}) + bus.raise(Msg::ManifestCommand{
				"injectholdinvoice",
				"bolt11 [min_cltv]",
				"Hold payments to an existing {bolt11} that "
				"pays, or routes through, this node.",
				false
			});
		});
		bus.subscribe<Msg::Init>([this](Msg::Init const& init) {
			rpc = &init.rpc;
			self_id = init.self_id;
			network = init.network;
			return Ev::lift();
		});
		bus.subscribe<Msg::EngineReady>([this](Msg::EngineReady const& m) {
			engine = &m.engine;
			return Ev::lift();
		});
		bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& r) {
			auto params = r.params;
			if (r.command == "holdinvoice")
				return respond( bus, r.id
					      , "could not create invoice: "
					      , Ev::lift().then([this, params]() {
					return holdinvoice(params);
				}));
			if (r.command == "injectholdinvoice")
				return respond( bus, r.id
					      , "could not inject invoice: "
					      , Ev::lift().then([this, params]() {
					return inject(params);
				}));
			return Ev::lift();
		});
	}

public:
	explicit
	Impl(S::Bus& bus_) : bus(bus_), rpc(nullptr), engine(nullptr) {
		start();
	}
};

InvoiceCommand::InvoiceCommand(S::Bus& bus)
	: pimpl(Util::make_unique<Impl>(bus)) { }
InvoiceCommand::InvoiceCommand(InvoiceCommand&&) =default;
InvoiceCommand::~InvoiceCommand() =default;

}}
