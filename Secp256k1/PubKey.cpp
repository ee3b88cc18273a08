#include<secp256k1.h>
#include<string.h>
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

using Secp256k1::Detail::context;

namespace Secp256k1 {

class PubKey::Impl {
public:
	secp256k1_pubkey key;

	Impl() {
		memset(&key, 0, sizeof(key));
	}
	Impl(Impl const&) =default;

	void parse(std::uint8_t const buffer[33]) {
		auto res = secp256k1_ec_pubkey_parse( context.get()
						    , &key
						    , buffer
						    , 33
						    );
		if (!res)
			throw InvalidPubKey();
	}
	void serialize(std::uint8_t buffer[33]) const {
		auto size = size_t(33);
		secp256k1_ec_pubkey_serialize( context.get()
					     , buffer
					     , &size
					     , &key
					     , SECP256K1_EC_COMPRESSED
					     );
	}
};

PubKey::PubKey() : pimpl(Util::make_unique<Impl>()) { }
void* PubKey::get_key() {
	return &pimpl->key;
}

PubKey::PubKey(std::string const& s) : pimpl(Util::make_unique<Impl>()) {
	if (s.size() != 66 || !Util::Str::ishex(s))
		throw InvalidPubKey();
	auto buf = Util::Str::hexread(s);
	pimpl->parse(&buf[0]);
}
PubKey::operator std::string() const {
	std::uint8_t buf[33];
	to_buffer(buf);
	return Util::Str::hexdump(buf, sizeof(buf));
}

PubKey::PubKey(Secp256k1::PrivKey const& sk) : pimpl(Util::make_unique<Impl>()) {
	auto res = secp256k1_ec_pubkey_create( context.get()
					     , &pimpl->key
					     , sk.key
					     );
	if (!res)
		throw InvalidPrivKey();
}

PubKey::PubKey(PubKey const& o) : pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
PubKey::PubKey(PubKey&& o) : pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
PubKey& PubKey::operator=(PubKey const& o) {
	*pimpl = *o.pimpl;
	return *this;
}
PubKey& PubKey::operator=(PubKey&& o) {
	*pimpl = *o.pimpl;
	return *this;
}
PubKey::~PubKey() { }

PubKey PubKey::from_buffer(std::uint8_t const buffer[33]) {
	auto rv = PubKey();
	rv.pimpl->parse(buffer);
	return rv;
}
void PubKey::to_buffer(std::uint8_t buffer[33]) const {
	pimpl->serialize(buffer);
}

bool PubKey::operator==(PubKey const& o) const {
	std::uint8_t a[33];
	std::uint8_t b[33];
	to_buffer(a);
	o.to_buffer(b);
	return 0 == memcmp(a, b, sizeof(a));
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::PubKey const& pk) {
	return os << std::string(pk);
}
