#ifndef HOLD_MOD_MPPTIMEOUT_HPP
#define HOLD_MOD_MPPTIMEOUT_HPP

#include<memory>

namespace Hold { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::MppTimeout
 *
 * @brief periodically fails the parts of unpaid
 * invoices that stopped receiving new parts.
 *
 * @desc lightningd leaves held HTLCs alone, so this
 * is the only thing that times out an incomplete
 * multi-part payment.
 */
class MppTimeout {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	MppTimeout() =delete;
	MppTimeout(MppTimeout const&) =delete;

	MppTimeout(S::Bus& bus, Waiter& waiter);
	MppTimeout(MppTimeout&&);
	~MppTimeout();
};

}}

#endif /* !defined(HOLD_MOD_MPPTIMEOUT_HPP) */
