#ifndef HOLD_MOD_TRACKCOMMAND_HPP
#define HOLD_MOD_TRACKCOMMAND_HPP

#include<memory>

namespace Hold { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::TrackCommand
 *
 * @brief the `trackholdinvoice` and
 * `trackallholdinvoices` commands.
 *
 * @desc `trackholdinvoice` only returns once the
 * invoice is paid or cancelled.
 * `trackallholdinvoices` is a long-poll: callers
 * pass back the returned `next` as `since` to get
 * the following transitions.
 */
class TrackCommand {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	TrackCommand() =delete;
	TrackCommand(TrackCommand const&) =delete;

	TrackCommand(S::Bus& bus, Waiter& waiter);
	TrackCommand(TrackCommand&&);
	~TrackCommand();
};

}}

#endif /* !defined(HOLD_MOD_TRACKCOMMAND_HPP) */
