#ifndef HOLD_MOD_UPDATENOTIFIER_HPP
#define HOLD_MOD_UPDATENOTIFIER_HPP

#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::UpdateNotifier
 *
 * @brief sends every invoice transition to lightningd
 * as a `holdinvoice_update` custom notification, in
 * journal order.
 *
 * @desc If it falls behind the journal, it catches up
 * from the retained history and logs a warning for
 * anything no longer retained.
 */
class UpdateNotifier {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	UpdateNotifier() =delete;
	UpdateNotifier(UpdateNotifier const&) =delete;

	explicit
	UpdateNotifier(S::Bus& bus);
	UpdateNotifier(UpdateNotifier&&);
	~UpdateNotifier();
};

}}

#endif /* !defined(HOLD_MOD_UPDATENOTIFIER_HPP) */
