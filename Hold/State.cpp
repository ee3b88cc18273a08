#include"Hold/State.hpp"

namespace Hold {

std::string to_string(State s) {
	switch (s) {
	case State_Unpaid: return "unpaid";
	case State_Accepted: return "accepted";
	case State_Paid: return "paid";
	case State_Cancelled: return "cancelled";
	}
	return "unpaid";
}

bool from_string(State& s, std::string const& str) {
	if (str == "unpaid")
		s = State_Unpaid;
	else if (str == "accepted")
		s = State_Accepted;
	else if (str == "paid")
		s = State_Paid;
	else if (str == "cancelled")
		s = State_Cancelled;
	else
		return false;
	return true;
}

}
