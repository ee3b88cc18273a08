#ifndef HOLD_POLICY_HPP
#define HOLD_POLICY_HPP

#include<cstddef>
#include<cstdint>

namespace Hold {

/** struct Hold::Policy
 *
 * @brief the tunables of the hold invoice engine,
 * filled in from plugin options.
 */
struct Policy {
	/* Seconds without a new part before the parts of
	 * an unpaid invoice are failed.  */
	double mpp_timeout;
	/* Blocks before CLTV expiry at which held HTLCs are
	 * failed.  0 disables.  */
	std::uint32_t expiry_deadline;
	/* Accepted total may reach amount times this.  */
	std::uint64_t overpayment_factor;
	/* Per-subscriber queue bound.  */
	std::size_t track_buffer;
	/* `c` field of invoices we create, if the caller
	 * gives none.  */
	std::uint32_t min_final_cltv;

	Policy() : mpp_timeout(60)
		 , expiry_deadline(4)
		 , overpayment_factor(2)
		 , track_buffer(1024)
		 , min_final_cltv(80)
		 { }
};

}

#endif /* !defined(HOLD_POLICY_HPP) */
