#ifndef SECP256K1_RECOVERABLESIGNATURE_HPP
#define SECP256K1_RECOVERABLESIGNATURE_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Sha256 { class Hash; }

namespace Secp256k1 {

class BadSignatureEncoding : public Util::BacktraceException<std::invalid_argument> {
public:
	BadSignatureEncoding()
		: Util::BacktraceException<std::invalid_argument>("Bad signature encoding")
		{ }
};

/** class Secp256k1::RecoverableSignature
 *
 * @brief an ECDSA signature together with the recovery
 * id that lets a verifier derive the signing public key
 * from the message hash alone.
 *
 * @desc This is the signature form used by bolt11
 * invoices, serialized as 64 compact bytes followed by
 * the one-byte recovery id.
 */
class RecoverableSignature {
private:
	/* Opaque secp256k1_ecdsa_recoverable_signature.  */
	std::uint8_t data[65];

	RecoverableSignature( Secp256k1::PrivKey const&
			    , Sha256::Hash const&
			    );

public:
	RecoverableSignature();
	RecoverableSignature(RecoverableSignature const&) =default;
	RecoverableSignature& operator=(RecoverableSignature const&) =default;

	static
	RecoverableSignature create( Secp256k1::PrivKey const& sk
				   , Sha256::Hash const& m
				   ) {
		return RecoverableSignature(sk, m);
	}

	/* 64 bytes of r and s, then the recovery id.
	 * Throws BadSignatureEncoding if malformed.  */
	static
	RecoverableSignature from_buffer(std::uint8_t const buffer[65]);
	void to_buffer(std::uint8_t buffer[65]) const;

	/** Secp256k1::RecoverableSignature::recover
	 *
	 * @brief derive the public key that produced this
	 * signature over the given message hash.
	 * Throws BadSignatureEncoding if no key can be
	 * recovered.
	 */
	Secp256k1::PubKey recover(Sha256::Hash const& m) const;
};

}

#endif /* !defined(SECP256K1_RECOVERABLESIGNATURE_HPP) */
