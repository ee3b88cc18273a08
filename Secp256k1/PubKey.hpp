#ifndef SECP256K1_PUBKEY_HPP
#define SECP256K1_PUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }

std::ostream& operator<<(std::ostream&, Secp256k1::PubKey const&);

namespace Secp256k1 {

/* Thrown in case of being fed an invalid public key.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey() : Util::BacktraceException<std::invalid_argument>("Invalid public key.") { }
};

/** class Secp256k1::PubKey
 *
 * @brief a point on the curve, as used for node ids.
 * Always serialized in 33-byte compressed form.
 */
class PubKey {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	PubKey();
	/* The underlying secp256k1_pubkey.  */
	void* get_key();

	friend class RecoverableSignature;

public:
	/* Load public key from a hex-encoded string.  */
	explicit PubKey(std::string const&);
	/* Create hex-encoded string.  */
	explicit operator std::string() const;
	/* Get the public key behind the given private key.  */
	explicit PubKey(Secp256k1::PrivKey const&);

	PubKey(PubKey const&);
	PubKey(PubKey&&);
	PubKey& operator=(PubKey const&);
	PubKey& operator=(PubKey&&);
	~PubKey();

	static
	PubKey from_buffer(std::uint8_t const buffer[33]);
	void to_buffer(std::uint8_t buffer[33]) const;

	bool operator==(PubKey const&) const;
	bool operator!=(PubKey const& o) const {
		return !(*this == o);
	}
};

}

#endif /* SECP256K1_PUBKEY_HPP */
