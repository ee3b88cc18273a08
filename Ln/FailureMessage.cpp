#include"Ln/Amount.hpp"
#include"Ln/FailureMessage.hpp"

namespace {

auto const PERM = std::uint16_t(0x4000);

void push_be(std::vector<std::uint8_t>& v, std::uint64_t x, int bytes) {
	for (auto i = bytes - 1; i >= 0; --i)
		v.push_back(std::uint8_t((x >> (8 * i)) & 0xFF));
}

}

namespace Ln { namespace FailureMessage {

std::vector<std::uint8_t>
incorrect_or_unknown_payment_details( Ln::Amount htlc_msat
				    , std::uint32_t height
				    ) {
	auto rv = std::vector<std::uint8_t>();
	push_be(rv, PERM | 15, 2);
	push_be(rv, htlc_msat.to_msat(), 8);
	push_be(rv, height, 4);
	return rv;
}

std::vector<std::uint8_t>
final_incorrect_cltv_expiry(std::uint32_t cltv_expiry) {
	auto rv = std::vector<std::uint8_t>();
	push_be(rv, 18, 2);
	push_be(rv, cltv_expiry, 4);
	return rv;
}

std::vector<std::uint8_t>
mpp_timeout() {
	auto rv = std::vector<std::uint8_t>();
	push_be(rv, 23, 2);
	return rv;
}

std::uint16_t code(std::vector<std::uint8_t> const& msg) {
	if (msg.size() < 2)
		return 0;
	return (std::uint16_t(msg[0]) << 8) | std::uint16_t(msg[1]);
}

}}
