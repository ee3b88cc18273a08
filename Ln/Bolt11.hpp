#ifndef LN_BOLT11_HPP
#define LN_BOLT11_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Preimage.hpp"
#include"Ln/Scid.hpp"
#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<set>
#include<stdexcept>
#include<string>
#include<vector>

namespace Secp256k1 { class PrivKey; }

namespace Ln { namespace Bolt11 {

/** struct Ln::Bolt11::RouteHop
 *
 * @brief one hop of a private route hint, i.e. one
 * entry of an `r` field.
 */
struct RouteHop {
	Ln::NodeId node_id;
	Ln::Scid scid;
	std::uint32_t fee_base_msat;
	std::uint32_t fee_proportional_millionths;
	std::uint16_t cltv_expiry_delta;
};
typedef std::vector<RouteHop> RouteHint;

/** struct Ln::Bolt11::Invoice
 *
 * @brief the fields of a bolt11 invoice that we
 * produce or consume.
 *
 * @desc Unknown tagged fields are skipped on decode
 * and never produced on encode.
 */
struct Invoice {
	/* "bc", "tb", "tbs", "bcrt".  */
	std::string currency;
	bool has_amount;
	Ln::Amount amount;
	/* Seconds since the epoch.  */
	std::uint64_t timestamp;

	Sha256::Hash payment_hash;
	/* Default-constructed if no `s` field.  */
	Ln::Preimage payment_secret;

	/* Exactly one of these is used.  */
	bool has_description_hash;
	std::string description;
	Sha256::Hash description_hash;

	/* Seconds, from `x`.  3600 if absent.  */
	std::uint64_t expiry;
	/* Blocks, from `c`.  18 if absent.  */
	std::uint32_t min_final_cltv_expiry;

	std::vector<RouteHint> route_hints;
	/* Set bit positions of the `9` field.  */
	std::set<unsigned int> features;

	/* From `n`, or recovered from the signature.
	 * Ignored by encode, which signs with the given
	 * key instead.
	 */
	Ln::NodeId payee;

	Invoice() : has_amount(false)
		  , timestamp(0)
		  , has_description_hash(false)
		  , expiry(3600)
		  , min_final_cltv_expiry(18)
		  { }
};

struct DecodeError : public Util::BacktraceException<std::invalid_argument> {
	DecodeError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"bolt11: " + msg
		  ) { }
};

/** Ln::Bolt11::decode
 *
 * @brief parse and verify an invoice string.
 * Throws `Ln::Bolt11::DecodeError` on malformed input
 * or a bad signature.
 */
Invoice decode(std::string const&);

/** Ln::Bolt11::encode
 *
 * @brief build the invoice string, signed by the
 * given key.
 *
 * @desc lightningd `signinvoice` replaces the
 * signature with one by the node key, so callers that
 * hand the result to `signinvoice` can use any key.
 * Throws `std::invalid_argument` if a field does not
 * fit in the format.
 */
std::string encode(Invoice const&, Secp256k1::PrivKey const&);

/** Ln::Bolt11::currency_of_network
 *
 * @brief map a lightningd network name to the invoice
 * currency prefix.
 * Throws `std::invalid_argument` if unknown.
 */
std::string currency_of_network(std::string const& network);

}}

#endif /* !defined(LN_BOLT11_HPP) */
