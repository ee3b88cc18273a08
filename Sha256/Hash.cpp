#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[32] = { 0 };

}

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}
Hash::Hash(std::string const& s) {
	auto bytes = Util::Str::hexread(s);
	if (bytes.size() != 32)
		throw Util::BacktraceException<std::invalid_argument>("Hashes must be 32 bytes.");
	pimpl = std::make_shared<Impl>();
	for (auto i = std::size_t(0); i < 32; ++i)
		pimpl->d[i] = bytes[i];
}

Hash::operator std::string() const {
	if (!pimpl)
		return std::string(64, '0');
	return Util::Str::hexdump(pimpl->d, 32);
}
Hash::operator bool() const {
	if (!pimpl)
		return false;
	return !sodium_is_zero(pimpl->d, 32);
}
bool Hash::operator==(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return 0 == sodium_memcmp(a, b, 32);
}

std::vector<std::uint8_t> Hash::bytes() const {
	auto rv = std::vector<std::uint8_t>(32);
	to_buffer(&rv[0]);
	return rv;
}
Hash Hash::from_bytes(std::vector<std::uint8_t> const& b) {
	if (b.size() != 32)
		throw Util::BacktraceException<std::invalid_argument>("Hashes must be 32 bytes.");
	auto rv = Hash();
	rv.from_buffer(&b[0]);
	return rv;
}

}
