#ifndef LN_FAILUREMESSAGE_HPP
#define LN_FAILUREMESSAGE_HPP

#include<cstdint>
#include<vector>

namespace Ln { class Amount; }

/** Ln::FailureMessage
 *
 * @brief constructors for the BOLT #4 onion failure
 * messages a final recipient returns to the payer.
 *
 * @desc Each returns the raw message, a big-endian
 * 2-byte failure code followed by its data fields, to
 * be hexdumped into the `failure_message` field of an
 * `htlc_accepted` hook result.
 */
namespace Ln { namespace FailureMessage {

/* PERM|15: the payment hash is unknown, the amount or
 * secret is wrong, or the payment is otherwise refused.
 * Carries the HTLC amount and our current block height.
 */
std::vector<std::uint8_t>
incorrect_or_unknown_payment_details( Ln::Amount htlc_msat
				    , std::uint32_t height
				    );

/* 18: the CLTV of the HTLC does not give us enough
 * blocks before expiry.  */
std::vector<std::uint8_t>
final_incorrect_cltv_expiry(std::uint32_t cltv_expiry);

/* 23: the parts of a multi-part payment did not all
 * arrive in time.  */
std::vector<std::uint8_t>
mpp_timeout();

/* Extract the failure code, or 0 if too short.  */
std::uint16_t code(std::vector<std::uint8_t> const& msg);

}}

#endif /* !defined(LN_FAILUREMESSAGE_HPP) */
