#include"Util/Bech32.hpp"
#include<algorithm>
#include<assert.h>
#include<ctype.h>

namespace {

auto const bech32_chars = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

int decode_char(char c) {
	auto it = std::find( bech32_chars.begin(), bech32_chars.end()
			   , tolower(c)
			   );
	if (it == bech32_chars.end()) {
		return -1;
	}
	return it - bech32_chars.begin();
}

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	static std::uint32_t const gen[] =
	{ 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = chk >> 25;
		chk = ((chk & 0x1ffffff) << 5) ^ v;
		for (auto i = 0; i < 5; ++i)
			if ((top >> i) & 1)
				chk ^= gen[i];
	}
	return chk;
}

std::vector<std::uint8_t> hrp_expand(std::string const& hrp) {
	auto rv = std::vector<std::uint8_t>();
	rv.reserve(hrp.size() * 2 + 1);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) >> 5);
	rv.push_back(0);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) & 31);
	return rv;
}

}

namespace Util { namespace Bech32 {

bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& words
	   , std::string const& bech32
	   ) {
	auto has_lower = false;
	auto has_upper = false;
	for (auto c : bech32) {
		if (c < 33 || c > 126)
			return false;
		if (islower(c))
			has_lower = true;
		if (isupper(c))
			has_upper = true;
	}
	if (has_lower && has_upper)
		return false;

	/* Get the separator.
	 * The last `1` character is the separator, so
	 * do the scan in reverse order.
	 */
	auto rit = std::find(bech32.rbegin(), bech32.rend(), '1');
	/* No `1` separator.  */
	if (rit == bech32.rend())
		return false;
	/* Convert to forward iterator.  */
	auto it = rit.base();

	/* Empty HRP, or data part too short for a checksum.  */
	if (it - 1 == bech32.begin())
		return false;
	if (bech32.end() - it < 6)
		return false;

	/* `it` is *after* the `1` separator.
	 * The HRP is up to but not including the `1` separator,
	 * so we use `it - 1` as the end to point to the `1` separator.
	 */
	hrp.resize(it - 1 - bech32.begin());
	std::transform( bech32.begin(), it - 1
		      , hrp.begin()
		      , [](char c) {
		return tolower(c);
	});

	auto values = std::vector<std::uint8_t>();
	for (auto p = it; p < bech32.end(); ++p) {
		auto val = decode_char(*p);
		if (val < 0)
			/* Non-bech32 char.  */
			return false;
		values.push_back(std::uint8_t(val));
	}

	auto check = hrp_expand(hrp);
	check.insert(check.end(), values.begin(), values.end());
	if (polymod(check) != 1)
		return false;

	words = std::vector<std::uint8_t>(values.begin(), values.end() - 6);
	return true;
}

std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& words
		  ) {
	auto lhrp = hrp;
	std::transform(lhrp.begin(), lhrp.end(), lhrp.begin(), [](char c) {
		return tolower(c);
	});

	auto values = hrp_expand(lhrp);
	values.insert(values.end(), words.begin(), words.end());
	values.insert(values.end(), 6, 0);
	auto mod = polymod(values) ^ 1;

	auto rv = lhrp + "1";
	rv.reserve(lhrp.size() + 1 + words.size() + 6);
	for (auto w : words) {
		assert(w < 32);
		rv.push_back(bech32_chars[w]);
	}
	for (auto i = 0; i < 6; ++i)
		rv.push_back(bech32_chars[(mod >> (5 * (5 - i))) & 31]);
	return rv;
}

std::vector<std::uint8_t>
words_to_bytes( std::vector<std::uint8_t>::const_iterator b
	      , std::vector<std::uint8_t>::const_iterator e
	      , bool pad
	      ) {
	auto rv = std::vector<std::uint8_t>();
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (; b != e; ++b) {
		acc = (acc << 5) | (*b & 31);
		bits += 5;
		if (bits >= 8) {
			bits -= 8;
			rv.push_back(std::uint8_t((acc >> bits) & 0xFF));
		}
	}
	if (pad && bits > 0)
		rv.push_back(std::uint8_t((acc << (8 - bits)) & 0xFF));
	return rv;
}

std::vector<std::uint8_t>
bytes_to_words(std::vector<std::uint8_t> const& bytes) {
	auto rv = std::vector<std::uint8_t>();
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto byte : bytes) {
		acc = (acc << 8) | byte;
		bits += 8;
		while (bits >= 5) {
			bits -= 5;
			rv.push_back(std::uint8_t((acc >> bits) & 31));
		}
	}
	if (bits > 0)
		rv.push_back(std::uint8_t((acc << (5 - bits)) & 31));
	return rv;
}

std::uint64_t
words_to_uint( std::vector<std::uint8_t>::const_iterator b
	     , std::vector<std::uint8_t>::const_iterator e
	     ) {
	auto rv = std::uint64_t(0);
	for (; b != e; ++b)
		rv = (rv << 5) | (*b & 31);
	return rv;
}

std::vector<std::uint8_t> uint_to_words(std::uint64_t v) {
	auto rv = std::vector<std::uint8_t>();
	while (v != 0) {
		rv.push_back(std::uint8_t(v & 31));
		v >>= 5;
	}
	std::reverse(rv.begin(), rv.end());
	return rv;
}

}}
