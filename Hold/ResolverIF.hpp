#ifndef HOLD_RESOLVERIF_HPP
#define HOLD_RESOLVERIF_HPP

#include"Ln/Scid.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Hold { class Decision; }

namespace Hold {

/** struct Hold::HtlcKey
 *
 * @brief identifies one incoming HTLC.
 */
struct HtlcKey {
	Ln::Scid scid;
	std::uint64_t htlc_id;
	Sha256::Hash payment_hash;

	bool operator==(HtlcKey const& o) const {
		return scid == o.scid
		    && htlc_id == o.htlc_id
		    && payment_hash == o.payment_hash
		     ;
	}
	bool operator!=(HtlcKey const& o) const {
		return !(*this == o);
	}
};

/** class Hold::ResolverIF
 *
 * @brief receives the final decision for an HTLC
 * that was earlier told to `hold`.
 *
 * @desc The decision may arrive before the `hold`
 * itself has been handed back to the hook caller, so
 * implementations have to keep it until then.
 */
class ResolverIF {
public:
	virtual ~ResolverIF() { }
	virtual
	Ev::Io<void> resolve(HtlcKey const& key, Decision const& decision) =0;
};

}

namespace std {
	template<>
	struct hash<::Hold::HtlcKey> {
		std::size_t operator()(::Hold::HtlcKey const& k) const {
			return std::hash<Sha256::Hash>()(k.payment_hash)
			     ^ std::hash<std::uint64_t>()(k.htlc_id)
			     ^ (std::hash<std::string>()(std::string(k.scid)) << 1)
			     ;
		}
	};
}

#endif /* !defined(HOLD_RESOLVERIF_HPP) */
