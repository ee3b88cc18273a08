#ifndef LN_HTLCACCEPTED_HPP
#define LN_HTLCACCEPTED_HPP

#include"Ln/Amount.hpp"
#include"Ln/CommandId.hpp"
#include"Ln/Preimage.hpp"
#include"Ln/Scid.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>

namespace Jsmn { class Object; }

namespace Ln { namespace HtlcAccepted {

/** struct Ln::HtlcAccepted::Request
 *
 * @brief Represents the payload of an `htlc_accepted`
 * hook, restricted to what a final recipient needs.
 */
struct Request {
	/* Command id, to respond with.  */
	Ln::CommandId id;

	/* Incoming channel and the HTLC index on it.
	 * Together they identify the HTLC across hook
	 * replays.
	 */
	Ln::Scid scid;
	std::uint64_t htlc_id;

	Ln::Amount amount;
	/* Absolute block height.  */
	std::uint32_t cltv_expiry;
	/* Blocks remaining until cltv_expiry, as counted by
	 * lightningd.  Older lightningd does not send it, in
	 * which case `has_cltv_expiry_relative` is false and
	 * the receiver counts from its own block height.  */
	bool has_cltv_expiry_relative;
	std::int64_t cltv_expiry_relative;

	Sha256::Hash payment_hash;
	/* Default-constructed if the onion carried none.  */
	Ln::Preimage payment_secret;
	/* Equal to amount if the onion carried none.  */
	Ln::Amount total_msat;

	/* True if the onion tells us to forward, i.e. we
	 * are not the final recipient.
	 */
	bool is_forward;

	/** Ln::HtlcAccepted::Request::parse
	 *
	 * @brief extract the fields from the hook params.
	 *
	 * @desc Throws `Jsmn::TypeError` or
	 * `std::invalid_argument` if the payload does not
	 * have the expected shape.
	 */
	static
	Request parse(Ln::CommandId id, Jsmn::Object const& params);
};

}}

#endif /* !defined(LN_HTLCACCEPTED_HPP) */
