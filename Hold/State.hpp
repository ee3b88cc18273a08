#ifndef HOLD_STATE_HPP
#define HOLD_STATE_HPP

#include<string>

namespace Hold {

/** enum Hold::State
 *
 * @brief state of a hold invoice, and of each of
 * its HTLCs.
 *
 * @desc Invoices go `Unpaid -> Accepted -> Paid`,
 * with `Cancelled` reachable from either of the
 * first two.
 * HTLCs start at `Accepted`, never `Unpaid`.
 */
enum State {
	State_Unpaid,
	State_Accepted,
	State_Paid,
	State_Cancelled
};

/* "unpaid", "accepted", "paid", "cancelled".  */
std::string to_string(State);
/* Return false if not one of the above.  */
bool from_string(State& s, std::string const&);

inline
bool is_final(State s) {
	return s == State_Paid || s == State_Cancelled;
}

}

#endif /* !defined(HOLD_STATE_HPP) */
