#undef NDEBUG
#include"Util/Bech32.hpp"
#include<assert.h>

int main() {
	auto hrp = std::string();
	auto words = std::vector<std::uint8_t>();

	/* BIP173 valid checksums.  */
	assert(Util::Bech32::decode(hrp, words, "A12UEL5L"));
	assert(hrp == "a");
	assert(words.empty());
	assert(Util::Bech32::decode(hrp, words, "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw"));
	assert(hrp == "abcdef");
	assert(words.size() == 32);
	for (auto i = std::size_t(0); i < words.size(); ++i)
		assert(words[i] == i);

	/* Encoding gives back the lowercase form.  */
	assert(Util::Bech32::encode("A", std::vector<std::uint8_t>()) == "a12uel5l");
	assert(Util::Bech32::encode(hrp, words) == "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw");

	/* Invalid: mixed case, bad checksum, no separator,
	 * empty hrp, char out of range.  */
	assert(!Util::Bech32::decode(hrp, words, "A12uEL5L"));
	assert(!Util::Bech32::decode(hrp, words, "a12uel5m"));
	assert(!Util::Bech32::decode(hrp, words, "pzry9x0s0muk"));
	assert(!Util::Bech32::decode(hrp, words, "1pzry9x0s0muk"));
	assert(!Util::Bech32::decode(hrp, words, "x1b4n0q5v"));

	{
		auto bytes = std::vector<std::uint8_t>{0xff, 0x00, 0xa5};
		auto w = Util::Bech32::bytes_to_words(bytes);
		assert(w.size() == 5);
		auto back = Util::Bech32::words_to_bytes(w.cbegin(), w.cend());
		assert(back == bytes);
		/* Padding adds the leftover bit as one more byte.  */
		back = Util::Bech32::words_to_bytes(w.cbegin(), w.cend(), true);
		assert(back.size() == 4);
	}
	{
		assert(Util::Bech32::uint_to_words(0).empty());
		auto w = Util::Bech32::uint_to_words(3600);
		assert(w.size() == 3);
		assert(Util::Bech32::words_to_uint(w.cbegin(), w.cend()) == 3600);
		w = Util::Bech32::uint_to_words(31);
		assert(w.size() == 1 && w[0] == 31);
	}

	return 0;
}
