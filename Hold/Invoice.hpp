#ifndef HOLD_INVOICE_HPP
#define HOLD_INVOICE_HPP

#include"Hold/State.hpp"
#include"Ln/Amount.hpp"
#include"Ln/Preimage.hpp"
#include"Ln/Scid.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Hold {

/** struct Hold::Htlc
 *
 * @brief one HTLC offered to a hold invoice, as
 * recorded in the store.
 */
struct Htlc {
	/* Row id.  */
	std::uint64_t id;
	/* Incoming channel and HTLC index on it.  */
	Ln::Scid scid;
	std::uint64_t htlc_id;
	Ln::Amount msat;
	/* Absolute block height.  */
	std::uint32_t cltv_expiry;
	State state;
	std::uint64_t created_at;

	Htlc() : id(0), htlc_id(0), cltv_expiry(0)
	       , state(State_Accepted), created_at(0)
	       { }
};

/** struct Hold::Invoice
 *
 * @brief a hold invoice with its HTLCs.
 *
 * @desc Timestamps are seconds from the epoch, with
 * 0 for "not yet".
 */
struct Invoice {
	std::uint64_t id;
	Sha256::Hash payment_hash;
	/* Unset until known.  */
	Ln::Preimage preimage;
	std::string bolt11;
	/* False for an "any amount" invoice.  */
	bool has_amount;
	Ln::Amount amount;
	/* Unset if the invoice carries none.  */
	Ln::Preimage payment_secret;
	/* Minimum final CLTV delta, 0 to use the bolt11
	 * `c` field.  */
	std::uint32_t min_cltv;
	State state;
	std::uint64_t created_at;
	std::uint64_t accepted_at;
	std::uint64_t settled_at;

	std::vector<Htlc> htlcs;

	Invoice() : id(0), has_amount(false), min_cltv(0)
		  , state(State_Unpaid), created_at(0)
		  , accepted_at(0), settled_at(0)
		  { }

	/* Sum of HTLCs in the given state.  */
	Ln::Amount sum(State s) const {
		auto rv = Ln::Amount::msat(0);
		for (auto const& h : htlcs)
			if (h.state == s)
				rv += h.msat;
		return rv;
	}
	std::size_t count(State s) const {
		auto rv = std::size_t(0);
		for (auto const& h : htlcs)
			if (h.state == s)
				++rv;
		return rv;
	}
};

}

#endif /* !defined(HOLD_INVOICE_HPP) */
