#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/** Util::Bech32::decode
 *
 * @brief decode a bech32 string into its human-readable
 * part and its 5-bit data words, checksum stripped.
 *
 * @return true if decoding succeeded and the checksum
 * matched.
 *
 * @desc There is no length limit, since bolt11
 * invoices routinely exceed the 90 characters that
 * BIP173 allows for addresses.
 * Mixed-case strings are rejected.
 */
bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& words
	   , std::string const& bech32
	   );

/** Util::Bech32::encode
 *
 * @brief encode the human-readable part and 5-bit
 * data words, appending the checksum.
 * The result is all lowercase.
 */
std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& words
		  );

/** Util::Bech32::words_to_bytes
 *
 * @brief regroup 5-bit words into 8-bit bytes.
 * Trailing bits that do not fill a byte are dropped,
 * unless `pad` is set, in which case they are
 * zero-extended into one last byte.
 */
std::vector<std::uint8_t>
words_to_bytes( std::vector<std::uint8_t>::const_iterator b
	      , std::vector<std::uint8_t>::const_iterator e
	      , bool pad = false
	      );

/** Util::Bech32::bytes_to_words
 *
 * @brief regroup 8-bit bytes into 5-bit words,
 * zero-padding the last word.
 */
std::vector<std::uint8_t>
bytes_to_words(std::vector<std::uint8_t> const& bytes);

/** Util::Bech32::words_to_uint
 *
 * @brief read the given 5-bit words as a big-endian
 * unsigned integer.
 */
std::uint64_t
words_to_uint( std::vector<std::uint8_t>::const_iterator b
	     , std::vector<std::uint8_t>::const_iterator e
	     );

/** Util::Bech32::uint_to_words
 *
 * @brief write an unsigned integer in the minimum
 * number of big-endian 5-bit words.
 * Zero is written as no words at all.
 */
std::vector<std::uint8_t> uint_to_words(std::uint64_t v);

}}

#endif /* !defined(UTIL_BECH32_HPP) */
