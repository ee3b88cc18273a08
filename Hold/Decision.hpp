#ifndef HOLD_DECISION_HPP
#define HOLD_DECISION_HPP

#include"Ln/Preimage.hpp"
#include<cstdint>
#include<vector>

namespace Json { class Out; }

namespace Hold {

/** class Hold::Decision
 *
 * @brief what to tell lightningd about one incoming
 * HTLC.
 *
 * @desc `hold` is the only decision that is not sent
 * back immediately: the hook stays unanswered until a
 * later decision for the same HTLC is made.
 */
class Decision {
public:
	enum Kind {
		Kind_Continue,
		Kind_Hold,
		Kind_Fail,
		Kind_Resolve
	};

private:
	Kind k;
	std::vector<std::uint8_t> failure;
	Ln::Preimage key;

	explicit
	Decision(Kind k_) : k(k_) { }

public:
	Decision() =delete;

	static Decision cont() { return Decision(Kind_Continue); }
	static Decision hold() { return Decision(Kind_Hold); }
	static Decision fail(std::vector<std::uint8_t> msg) {
		auto rv = Decision(Kind_Fail);
		rv.failure = std::move(msg);
		return rv;
	}
	static Decision resolve(Ln::Preimage preimage) {
		auto rv = Decision(Kind_Resolve);
		rv.key = std::move(preimage);
		return rv;
	}

	Kind kind() const { return k; }
	/* Only meaningful for `Kind_Fail`.  */
	std::vector<std::uint8_t> const& failure_message() const {
		return failure;
	}
	/* Only meaningful for `Kind_Resolve`.  */
	Ln::Preimage const& payment_key() const {
		return key;
	}

	bool operator==(Decision const& o) const;
	bool operator!=(Decision const& o) const {
		return !(*this == o);
	}

	/* The `htlc_accepted` hook result.  Must not be
	 * called on `Kind_Hold`.  */
	Json::Out to_json() const;
};

}

#endif /* !defined(HOLD_DECISION_HPP) */
