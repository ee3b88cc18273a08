#ifndef HOLD_MOD_HTLCGATE_HPP
#define HOLD_MOD_HTLCGATE_HPP

#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::HtlcGate
 *
 * @brief handles the `htlc_accepted` hook.
 *
 * @desc Asks the engine for a decision on each HTLC.
 * Held HTLCs keep their hook call open until a
 * `Hold::Msg::ReleaseHtlc` for them arrives.
 *
 * Any failure, including a payload we cannot parse,
 * is logged and answered with `continue`, so that
 * lightningd handles the HTLC itself.
 */
class HtlcGate {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	HtlcGate() =delete;
	HtlcGate(HtlcGate const&) =delete;

	explicit
	HtlcGate(S::Bus& bus);
	HtlcGate(HtlcGate&&);
	~HtlcGate();
};

}}

#endif /* !defined(HOLD_MOD_HTLCGATE_HPP) */
