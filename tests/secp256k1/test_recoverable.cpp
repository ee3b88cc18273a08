#undef NDEBUG
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Secp256k1/RecoverableSignature.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<cstring>
#include<string>

int main() {
	Secp256k1::Random random;

	auto sk = Secp256k1::PrivKey(random);
	auto pk = Secp256k1::PubKey(sk);
	auto msg = std::string("lnbc1 invoice preimage");
	auto m = Sha256::fun(msg.c_str(), msg.size());

	auto sig = Secp256k1::RecoverableSignature::create(sk, m);
	assert(sig.recover(m) == pk);

	/* Through the wire form.  */
	std::uint8_t buf[65];
	sig.to_buffer(buf);
	assert(buf[64] < 4);
	auto sig2 = Secp256k1::RecoverableSignature::from_buffer(buf);
	assert(sig2.recover(m) == pk);

	/* Another message recovers another key.  */
	auto other = std::string("something else");
	auto m2 = Sha256::fun(other.c_str(), other.size());
	try {
		assert(sig.recover(m2) != pk);
	} catch (Secp256k1::BadSignatureEncoding const&) {
		/* Also acceptable: no key at all.  */
	}

	/* Bad recovery id.  */
	buf[64] = 7;
	try {
		(void) Secp256k1::RecoverableSignature::from_buffer(buf);
		assert(0);
	} catch (Secp256k1::BadSignatureEncoding const&) { }

	/* Fixed key, as in the bolt11 test vectors.  */
	auto fixed = Secp256k1::PrivKey(
		std::string("e126f68f7eafcc8b74f54d269fe206be715000f94dac067d1c04a8ca3b2db734")
	);
	assert( std::string(Secp256k1::PubKey(fixed))
	     == "03e7156ae33b0a208d0744199163177e909e80176e55d97a2f221ede0f934dd9ad"
	      );

	return 0;
}
