#include<secp256k1.h>
#include<secp256k1_recovery.h>
#include<string.h>
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/RecoverableSignature.hpp"
#include"Sha256/Hash.hpp"

using Secp256k1::Detail::context;

static_assert( sizeof(secp256k1_ecdsa_recoverable_signature) <= 65
	     , "secp256k1_ecdsa_recoverable_signature too large"
	     );

namespace {

secp256k1_ecdsa_recoverable_signature*
as_sig(std::uint8_t* data) {
	return reinterpret_cast<secp256k1_ecdsa_recoverable_signature*>(data);
}
secp256k1_ecdsa_recoverable_signature const*
as_sig(std::uint8_t const* data) {
	return reinterpret_cast<secp256k1_ecdsa_recoverable_signature const*>(data);
}

}

namespace Secp256k1 {

RecoverableSignature::RecoverableSignature() {
	memset(data, 0, sizeof(data));
}

RecoverableSignature::RecoverableSignature( Secp256k1::PrivKey const& sk
					  , Sha256::Hash const& m
					  ) {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);

	auto res = secp256k1_ecdsa_sign_recoverable
		( context.get()
		, as_sig(data)
		, reinterpret_cast<const unsigned char*>(mbuf)
		, reinterpret_cast<const unsigned char*>(sk.key)
		, nullptr
		, nullptr
		);
	if (res == 0)
		throw Util::BacktraceException<std::runtime_error>("Nonce generation for signing failed.");
}

RecoverableSignature
RecoverableSignature::from_buffer(std::uint8_t const buffer[65]) {
	auto rv = RecoverableSignature();
	auto recid = int(buffer[64]);
	if (recid > 3)
		throw BadSignatureEncoding();
	auto res = secp256k1_ecdsa_recoverable_signature_parse_compact
		( context.get()
		, as_sig(rv.data)
		, reinterpret_cast<const unsigned char*>(buffer)
		, recid
		);
	if (res == 0)
		throw BadSignatureEncoding();
	return rv;
}

void RecoverableSignature::to_buffer(std::uint8_t buffer[65]) const {
	auto recid = int();
	secp256k1_ecdsa_recoverable_signature_serialize_compact
		( context.get()
		, reinterpret_cast<unsigned char*>(buffer)
		, &recid
		, as_sig(data)
		);
	buffer[64] = std::uint8_t(recid);
}

Secp256k1::PubKey
RecoverableSignature::recover(Sha256::Hash const& m) const {
	std::uint8_t mbuf[32];
	m.to_buffer(mbuf);

	auto rv = Secp256k1::PubKey();
	auto res = secp256k1_ecdsa_recover
		( context.get()
		, reinterpret_cast<secp256k1_pubkey*>(rv.get_key())
		, as_sig(data)
		, reinterpret_cast<const unsigned char*>(mbuf)
		);
	if (res == 0)
		throw BadSignatureEncoding();
	return rv;
}

}
