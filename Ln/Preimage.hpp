#ifndef LN_PREIMAGE_HPP
#define LN_PREIMAGE_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

namespace Secp256k1 { class Random; }
namespace Sha256 { class Hash; }

namespace Ln {

/** class Ln::Preimage
 *
 * @brief a 32-byte secret whose SHA256 is a payment
 * hash.
 * Also used for payment secrets, which have the same
 * shape.
 */
class Preimage {
private:
	struct Impl {
		std::uint8_t data[32];
	};
	std::shared_ptr<Impl> pimpl;

public:
	Preimage() =default;
	Preimage(Preimage const&) =default;
	Preimage(Preimage&&) =default;
	Preimage& operator=(Preimage const&) =default;
	Preimage& operator=(Preimage&&) =default;
	~Preimage() =default;

	explicit
	Preimage(Secp256k1::Random&);

	static
	bool valid_string(std::string const&);
	explicit
	Preimage(std::string const&);

	explicit
	operator std::string() const;

	bool operator==(Preimage const&) const;
	bool operator!=(Preimage const& o) const {
		return !(*this == o);
	}

	/* False if default-constructed.  */
	explicit
	operator bool() const {
		return !!pimpl;
	}
	bool operator!() const {
		return !bool(*this);
	}

	void to_buffer(std::uint8_t data[32]) const {
		if (pimpl)
			for (auto i = std::size_t(0); i < 32; ++i)
				data[i] = pimpl->data[i];
		else
			for (auto i = std::size_t(0); i < 32; ++i)
				data[i] = 0;
	}
	void from_buffer(std::uint8_t const data[32]) {
		if (!pimpl)
			pimpl = std::make_shared<Impl>();
		for (auto i = std::size_t(0); i < 32; ++i)
			pimpl->data[i] = data[i];
	}

	/* For BLOB columns.  */
	std::vector<std::uint8_t> bytes() const;
	static
	Preimage from_bytes(std::vector<std::uint8_t> const&);

	Sha256::Hash sha256() const;
};

}

#endif /* !defined(LN_PREIMAGE_HPP) */
