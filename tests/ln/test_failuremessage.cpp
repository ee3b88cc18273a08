#undef NDEBUG
#include"Ln/Amount.hpp"
#include"Ln/FailureMessage.hpp"
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	auto m = Ln::FailureMessage::incorrect_or_unknown_payment_details(
		Ln::Amount::msat(100000), 250
	);
	assert(Util::Str::hexdump(&m[0], m.size()) == "400f00000000000186a0000000fa");
	assert(Ln::FailureMessage::code(m) == 0x400F);

	m = Ln::FailureMessage::final_incorrect_cltv_expiry(250);
	assert(Util::Str::hexdump(&m[0], m.size()) == "0012000000fa");
	assert(Ln::FailureMessage::code(m) == 0x0012);

	m = Ln::FailureMessage::mpp_timeout();
	assert(Util::Str::hexdump(&m[0], m.size()) == "0017");
	assert(Ln::FailureMessage::code(m) == 23);

	assert(Ln::FailureMessage::code(std::vector<std::uint8_t>()) == 0);

	return 0;
}
