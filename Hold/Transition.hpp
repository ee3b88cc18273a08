#ifndef HOLD_TRANSITION_HPP
#define HOLD_TRANSITION_HPP

#include"Hold/State.hpp"
#include"Ln/Amount.hpp"
#include"Ln/Scid.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Hold {

/** struct Hold::Transition
 *
 * @brief one committed state change, of an invoice
 * or of one of its HTLCs.
 */
struct Transition {
	/* Position in the journal, starting at 1.  */
	std::uint64_t seq;
	Sha256::Hash payment_hash;
	std::string bolt11;
	/* The state entered.  */
	State state;

	/* Set for HTLC transitions, with the fields below
	 * filled in.  */
	bool is_htlc;
	Ln::Scid scid;
	std::uint64_t htlc_id;
	Ln::Amount msat;

	Transition() : seq(0), state(State_Unpaid)
		     , is_htlc(false), htlc_id(0)
		     { }
};

}

#endif /* !defined(HOLD_TRANSITION_HPP) */
