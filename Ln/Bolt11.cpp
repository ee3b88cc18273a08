#include"Ln/Bolt11.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/RecoverableSignature.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Bech32.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<limits>
#include<ctype.h>
#include<sstream>

using Util::Bech32::bytes_to_words;
using Util::Bech32::uint_to_words;
using Util::Bech32::words_to_bytes;
using Util::Bech32::words_to_uint;

namespace {

typedef std::vector<std::uint8_t> Words;

/* Tagged field types, as bech32 character values.  */
auto const tag_p = std::uint8_t(1);
auto const tag_s = std::uint8_t(16);
auto const tag_d = std::uint8_t(13);
auto const tag_h = std::uint8_t(23);
auto const tag_x = std::uint8_t(6);
auto const tag_c = std::uint8_t(24);
auto const tag_n = std::uint8_t(19);
auto const tag_r = std::uint8_t(3);
auto const tag_9 = std::uint8_t(5);

/* 35-bit timestamp.  */
auto const timestamp_words = std::size_t(7);
/* 64-byte signature plus recovery id.  */
auto const signature_words = std::size_t(104);
/* 256 bits, padded.  */
auto const hash_words = std::size_t(52);
/* 264 bits, padded.  */
auto const pubkey_words = std::size_t(53);
/* pubkey, scid, fee_base, fee_prop, cltv delta.  */
auto const hop_bytes = std::size_t(33 + 8 + 4 + 4 + 2);

auto const msat_per_btc = std::uint64_t(100000000000ULL);

Ln::Bolt11::DecodeError fail(std::string const& msg) {
	return Ln::Bolt11::DecodeError(msg);
}

/* Amount part of the human-readable prefix.  */
Ln::Amount parse_amount(std::string const& s) {
	if (s.empty())
		throw fail("empty amount");

	auto digits = s;
	auto multiplier = char(0);
	if (!isdigit(digits.back())) {
		multiplier = digits.back();
		digits.pop_back();
	}
	if (digits.empty() || digits.size() > 19)
		throw fail("bad amount");
	if (!std::all_of(digits.begin(), digits.end(), [](char c) {
		return isdigit(c);
	}))
		throw fail("bad amount");
	auto is = std::istringstream(digits);
	auto value = std::uint64_t();
	is >> value;

	auto per = std::uint64_t();
	switch (multiplier) {
	case 0: per = msat_per_btc; break;
	case 'm': per = msat_per_btc / 1000; break;
	case 'u': per = msat_per_btc / 1000000; break;
	case 'n': per = msat_per_btc / 1000000000; break;
	case 'p':
		/* Sub-millisatoshi amounts are invalid.  */
		if (value % 10 != 0)
			throw fail("amount not a whole msat");
		return Ln::Amount::msat(value / 10);
	default:
		throw fail(std::string("unknown multiplier ") + multiplier);
	}
	if (value > std::numeric_limits<std::uint64_t>::max() / per)
		throw fail("amount too large");
	return Ln::Amount::msat(value * per);
}
std::string print_amount(Ln::Amount a) {
	auto msat = a.to_msat();
	auto os = std::ostringstream();
	if (msat % msat_per_btc == 0)
		os << (msat / msat_per_btc);
	else if (msat % (msat_per_btc / 1000) == 0)
		os << (msat / (msat_per_btc / 1000)) << 'm';
	else if (msat % (msat_per_btc / 1000000) == 0)
		os << (msat / (msat_per_btc / 1000000)) << 'u';
	else if (msat % (msat_per_btc / 1000000000) == 0)
		os << (msat / (msat_per_btc / 1000000000)) << 'n';
	else
		os << (msat * 10) << 'p';
	return os.str();
}

/* Split "lnbcrt1230p" into currency and amount.  */
void parse_hrp(Ln::Bolt11::Invoice& inv, std::string const& hrp) {
	if (hrp.size() < 3 || hrp.substr(0, 2) != "ln")
		throw fail("not a lightning invoice");
	auto rest = hrp.substr(2);
	auto it = std::find_if(rest.begin(), rest.end(), [](char c) {
		return isdigit(c);
	});
	inv.currency = std::string(rest.begin(), it);
	if (inv.currency.empty())
		throw fail("no currency");
	if (it == rest.end()) {
		inv.has_amount = false;
		inv.amount = Ln::Amount::msat(0);
	} else {
		inv.has_amount = true;
		inv.amount = parse_amount(std::string(it, rest.end()));
	}
}

Sha256::Hash signing_hash( std::string const& hrp
			 , Words::const_iterator b
			 , Words::const_iterator e
			 ) {
	auto hasher = Sha256::Hasher();
	hasher.feed(hrp.data(), hrp.size());
	auto bytes = words_to_bytes(b, e, true);
	if (!bytes.empty())
		hasher.feed(&bytes[0], bytes.size());
	return std::move(hasher).finalize();
}

Sha256::Hash hash_of_words(Words::const_iterator b, Words::const_iterator e) {
	auto bytes = words_to_bytes(b, e);
	if (bytes.size() != 32)
		throw fail("bad hash length");
	return Sha256::Hash::from_bytes(bytes);
}

std::uint64_t read_be(std::uint8_t const* p, std::size_t n) {
	auto rv = std::uint64_t(0);
	for (auto i = std::size_t(0); i < n; ++i)
		rv = (rv << 8) | p[i];
	return rv;
}
void write_be(std::vector<std::uint8_t>& v, std::uint64_t x, std::size_t n) {
	for (auto i = n; i > 0; --i)
		v.push_back(std::uint8_t((x >> (8 * (i - 1))) & 0xFF));
}

Ln::Scid scid_of_u64(std::uint64_t v) {
	auto os = std::ostringstream();
	os << ((v >> 40) & 0xFFFFFF) << "x"
	   << ((v >> 16) & 0xFFFFFF) << "x"
	   << (v & 0xFFFF)
	   ;
	return Ln::Scid(os.str());
}
std::uint64_t u64_of_scid(Ln::Scid const& scid) {
	auto s = std::string(scid);
	auto b = std::uint64_t();
	auto t = std::uint64_t();
	auto o = std::uint64_t();
	auto x = char();
	auto is = std::istringstream(s);
	is >> b >> x >> t >> x >> o;
	return (b << 40) | (t << 16) | o;
}

Ln::Bolt11::RouteHint parse_route(Words::const_iterator b, Words::const_iterator e) {
	auto bytes = words_to_bytes(b, e);
	if (bytes.size() % hop_bytes != 0 || bytes.empty())
		throw fail("bad route hint length");
	auto rv = Ln::Bolt11::RouteHint();
	for (auto p = &bytes[0]; p < &bytes[0] + bytes.size(); p += hop_bytes) {
		auto hop = Ln::Bolt11::RouteHop();
		hop.node_id = Ln::NodeId(Util::Str::hexdump(p, 33));
		hop.scid = scid_of_u64(read_be(p + 33, 8));
		hop.fee_base_msat = std::uint32_t(read_be(p + 41, 4));
		hop.fee_proportional_millionths = std::uint32_t(read_be(p + 45, 4));
		hop.cltv_expiry_delta = std::uint16_t(read_be(p + 49, 2));
		rv.push_back(std::move(hop));
	}
	return rv;
}

std::set<unsigned int> parse_features(Words::const_iterator b, Words::const_iterator e) {
	auto rv = std::set<unsigned int>();
	auto n = std::size_t(e - b);
	for (auto i = std::size_t(0); i < n; ++i) {
		auto w = *(b + i);
		/* The last word holds bits 0 to 4.  */
		auto base = unsigned((n - 1 - i) * 5);
		for (auto bit = 0u; bit < 5; ++bit)
			if (w & (1 << bit))
				rv.insert(base + bit);
	}
	return rv;
}
Words print_features(std::set<unsigned int> const& features) {
	if (features.empty())
		return Words();
	auto top = *features.rbegin();
	auto n = std::size_t(top / 5 + 1);
	auto rv = Words(n, 0);
	for (auto f : features)
		rv[n - 1 - f / 5] |= std::uint8_t(1 << (f % 5));
	return rv;
}

void add_field(Words& data, std::uint8_t tag, Words const& content) {
	if (content.size() >= 1024)
		throw Util::BacktraceException<std::invalid_argument>(
			"bolt11: field too long"
		);
	data.push_back(tag);
	data.push_back(std::uint8_t(content.size() >> 5));
	data.push_back(std::uint8_t(content.size() & 31));
	data.insert(data.end(), content.begin(), content.end());
}

}

namespace Ln { namespace Bolt11 {

Invoice decode(std::string const& s) {
	auto hrp = std::string();
	auto words = Words();
	if (!Util::Bech32::decode(hrp, words, s))
		throw fail("invalid bech32");

	auto rv = Invoice();
	parse_hrp(rv, hrp);

	if (words.size() < timestamp_words + signature_words)
		throw fail("too short");
	auto data_end = words.end() - signature_words;
	rv.timestamp = words_to_uint(words.begin(), words.begin() + timestamp_words);

	auto has_p = false;
	auto has_d = false;
	auto has_n = false;
	for (auto it = words.cbegin() + timestamp_words; it < data_end;) {
		if (data_end - it < 3)
			throw fail("truncated field");
		auto tag = *it;
		auto len = std::size_t(*(it + 1)) * 32 + *(it + 2);
		auto b = it + 3;
		if (std::size_t(data_end - b) < len)
			throw fail("truncated field");
		auto e = b + len;
		it = e;

		/* Fields of the wrong length must be skipped.  */
		switch (tag) {
		case tag_p:
			if (len != hash_words || has_p)
				break;
			rv.payment_hash = hash_of_words(b, e);
			has_p = true;
			break;
		case tag_s:
			if (len != hash_words)
				break;
			rv.payment_secret = Ln::Preimage::from_bytes(
				words_to_bytes(b, e)
			);
			break;
		case tag_d: {
			auto bytes = words_to_bytes(b, e);
			rv.description = std::string(bytes.begin(), bytes.end());
			has_d = true;
		} break;
		case tag_h:
			if (len != hash_words)
				break;
			rv.description_hash = hash_of_words(b, e);
			rv.has_description_hash = true;
			break;
		case tag_x:
			rv.expiry = words_to_uint(b, e);
			break;
		case tag_c:
			rv.min_final_cltv_expiry = std::uint32_t(words_to_uint(b, e));
			break;
		case tag_n: {
			if (len != pubkey_words)
				break;
			auto bytes = words_to_bytes(b, e);
			rv.payee = Ln::NodeId(Util::Str::hexdump(&bytes[0], 33));
			has_n = true;
		} break;
		case tag_r:
			rv.route_hints.push_back(parse_route(b, e));
			break;
		case tag_9:
			rv.features = parse_features(b, e);
			break;
		default:
			break;
		}
	}
	if (!has_p)
		throw fail("no payment hash");
	if (has_d && rv.has_description_hash)
		throw fail("both description and description hash");

	auto sigbytes = words_to_bytes(data_end, words.cend());
	auto hash = signing_hash(hrp, words.cbegin(), data_end);
	auto recovered = Ln::NodeId();
	try {
		auto sig = Secp256k1::RecoverableSignature::from_buffer(
			&sigbytes[0]
		);
		recovered = Ln::NodeId(std::string(sig.recover(hash)));
	} catch (Secp256k1::BadSignatureEncoding const&) {
		throw fail("bad signature");
	}
	if (has_n && rv.payee != recovered)
		throw fail("signature does not match payee");
	rv.payee = std::move(recovered);

	return rv;
}

std::string encode(Invoice const& inv, Secp256k1::PrivKey const& sk) {
	auto hrp = std::string("ln") + inv.currency;
	if (inv.has_amount)
		hrp += print_amount(inv.amount);

	auto data = uint_to_words(inv.timestamp);
	if (data.size() > timestamp_words)
		throw Util::BacktraceException<std::invalid_argument>(
			"bolt11: timestamp out of range"
		);
	data.insert(data.begin(), timestamp_words - data.size(), 0);

	add_field(data, tag_p, bytes_to_words(inv.payment_hash.bytes()));
	if (inv.payment_secret)
		add_field(data, tag_s, bytes_to_words(inv.payment_secret.bytes()));
	if (inv.has_description_hash)
		add_field(data, tag_h, bytes_to_words(inv.description_hash.bytes()));
	else
		add_field(data, tag_d, bytes_to_words(std::vector<std::uint8_t>(
			inv.description.begin(), inv.description.end()
		)));
	add_field(data, tag_x, uint_to_words(inv.expiry));
	add_field(data, tag_c, uint_to_words(inv.min_final_cltv_expiry));
	for (auto const& hint : inv.route_hints) {
		auto bytes = std::vector<std::uint8_t>();
		for (auto const& hop : hint) {
			auto node = Util::Str::hexread(std::string(hop.node_id));
			bytes.insert(bytes.end(), node.begin(), node.end());
			write_be(bytes, u64_of_scid(hop.scid), 8);
			write_be(bytes, hop.fee_base_msat, 4);
			write_be(bytes, hop.fee_proportional_millionths, 4);
			write_be(bytes, hop.cltv_expiry_delta, 2);
		}
		add_field(data, tag_r, bytes_to_words(bytes));
	}
	if (!inv.features.empty())
		add_field(data, tag_9, print_features(inv.features));

	auto hash = signing_hash(hrp, data.cbegin(), data.cend());
	auto sig = Secp256k1::RecoverableSignature::create(sk, hash);
	std::uint8_t sigbuf[65];
	sig.to_buffer(sigbuf);
	auto sigwords = bytes_to_words(std::vector<std::uint8_t>(
		sigbuf, sigbuf + sizeof(sigbuf)
	));
	data.insert(data.end(), sigwords.begin(), sigwords.end());

	return Util::Bech32::encode(hrp, data);
}

std::string currency_of_network(std::string const& network) {
	if (network == "bitcoin")
		return "bc";
	if (network == "testnet" || network == "testnet4")
		return "tb";
	if (network == "signet")
		return "tbs";
	if (network == "regtest")
		return "bcrt";
	throw Util::BacktraceException<std::invalid_argument>(
		"unknown network: " + network
	);
}

}}
