#include"Jsmn/Object.hpp"
#include"Ln/HtlcAccepted.hpp"

namespace {

/* Newer lightningd uses `amount_msat` numbers, older
 * ones `amount` strings.  */
Ln::Amount get_amount(Jsmn::Object const& htlc) {
	if (htlc.has("amount_msat"))
		return Ln::Amount::object(htlc["amount_msat"]);
	return Ln::Amount::object(htlc["amount"]);
}

std::uint64_t get_uint(Jsmn::Object const& o) {
	if (!o.is_number())
		throw Jsmn::TypeError();
	return std::uint64_t(double(o));
}

}

namespace Ln { namespace HtlcAccepted {

Request Request::parse(Ln::CommandId id, Jsmn::Object const& params) {
	auto rv = Request();
	rv.id = std::move(id);

	auto onion = params["onion"];
	auto htlc = params["htlc"];
	if (!onion.is_object() || !htlc.is_object())
		throw Jsmn::TypeError();

	rv.scid = Ln::Scid(std::string(htlc["short_channel_id"]));
	rv.htlc_id = get_uint(htlc["id"]);
	rv.amount = get_amount(htlc);
	rv.cltv_expiry = std::uint32_t(get_uint(htlc["cltv_expiry"]));
	rv.has_cltv_expiry_relative = htlc.has("cltv_expiry_relative");
	if (rv.has_cltv_expiry_relative)
		rv.cltv_expiry_relative = std::int64_t(double(
			htlc["cltv_expiry_relative"]
		));
	else
		rv.cltv_expiry_relative = 0;
	rv.payment_hash = Sha256::Hash(std::string(htlc["payment_hash"]));

	if (onion.has("payment_secret"))
		rv.payment_secret = Ln::Preimage(std::string(
			onion["payment_secret"]
		));
	if (onion.has("total_msat"))
		rv.total_msat = Ln::Amount::object(onion["total_msat"]);
	else
		rv.total_msat = rv.amount;

	rv.is_forward = onion.has("short_channel_id")
		     || onion.has("next_node_id")
		      ;

	return rv;
}

}}
