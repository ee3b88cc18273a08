#include"Hold/Invoice.hpp"
#include"Hold/Mod/jsonify.hpp"
#include"Hold/Transition.hpp"
#include"Json/Out.hpp"

namespace Hold { namespace Mod {

Json::Out jsonify(Hold::Transition const& t) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj
		.field("seq", t.seq)
		.field("payment_hash", std::string(t.payment_hash))
		.field("bolt11", t.bolt11)
		.field("state", to_string(t.state))
		;
	if (t.is_htlc) {
		obj
			.start_object("htlc")
				.field("scid", std::string(t.scid))
				.field("id", t.htlc_id)
				.field("amount_msat", t.msat.to_msat())
			.end_object()
			;
	}
	obj.end_object();
	return rv;
}

Json::Out jsonify(Hold::Invoice const& inv) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj
		.field("id", inv.id)
		.field("payment_hash", std::string(inv.payment_hash))
		.field("bolt11", inv.bolt11)
		.field("state", to_string(inv.state))
		;
	if (inv.has_amount)
		obj.field("amount_msat", inv.amount.to_msat());
	else
		obj.field("amount_msat", nullptr);
	if (inv.state == State_Paid && inv.preimage)
		obj.field("preimage", std::string(inv.preimage));
	if (inv.min_cltv != 0)
		obj.field("min_cltv", inv.min_cltv);
	obj.field("created_at", inv.created_at);
	if (inv.accepted_at != 0)
		obj.field("accepted_at", inv.accepted_at);
	if (inv.settled_at != 0)
		obj.field("settled_at", inv.settled_at);

	auto arr = obj.start_array("htlcs");
	for (auto const& h : inv.htlcs)
		arr.entry(Json::Out()
			.start_object()
				.field("id", h.id)
				.field("scid", std::string(h.scid))
				.field("htlc_id", h.htlc_id)
				.field("amount_msat", h.msat.to_msat())
				.field("cltv_expiry", h.cltv_expiry)
				.field("state", to_string(h.state))
				.field("created_at", h.created_at)
			.end_object()
		);
	arr.end_array();

	obj.end_object();
	return rv;
}

}}
