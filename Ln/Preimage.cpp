#include"Ln/Preimage.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[32] = { 0 };

}

namespace Ln {

Preimage::Preimage(Secp256k1::Random& r) : pimpl(std::make_shared<Impl>()) {
	for (auto i = 0; i < 32; ++i)
		pimpl->data[i] = r.get();
}
bool Preimage::valid_string(std::string const& s) {
	return s.size() == 64
	    && Util::Str::ishex(s)
	     ;
}
Preimage::Preimage(std::string const& s) : pimpl(std::make_shared<Impl>()) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>("Ln::Preimage: must be 32 hex bytes.");
	auto buf = Util::Str::hexread(s);
	for (auto i = 0; i < 32; ++i)
		pimpl->data[i] = buf[i];
}

Preimage::operator std::string() const {
	if (!pimpl)
		return std::string(64, '0');
	return Util::Str::hexdump(pimpl->data, 32);
}

bool Preimage::operator==(Preimage const& o) const {
	auto a = pimpl ? pimpl->data : zero;
	auto b = o.pimpl ? o.pimpl->data : zero;
	return 0 == sodium_memcmp(a, b, 32);
}

std::vector<std::uint8_t> Preimage::bytes() const {
	auto rv = std::vector<std::uint8_t>(32);
	to_buffer(&rv[0]);
	return rv;
}
Preimage Preimage::from_bytes(std::vector<std::uint8_t> const& b) {
	if (b.size() != 32)
		throw Util::BacktraceException<std::invalid_argument>("Ln::Preimage: wrong size.");
	auto rv = Preimage();
	rv.from_buffer(&b[0]);
	return rv;
}

Sha256::Hash Preimage::sha256() const {
	std::uint8_t buf[32];
	to_buffer(buf);
	return Sha256::fun(buf, sizeof(buf));
}

}
