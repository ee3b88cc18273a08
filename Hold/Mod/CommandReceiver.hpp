#ifndef HOLD_MOD_COMMANDRECEIVER_HPP
#define HOLD_MOD_COMMANDRECEIVER_HPP

#include"Ln/CommandId.hpp"
#include<set>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::CommandReceiver
 *
 * @brief splits the incoming JSON-RPC objects into
 * `Hold::Msg::Notification` and
 * `Hold::Msg::CommandRequest`, and turns the
 * `Hold::Msg::CommandResponse` and
 * `Hold::Msg::CommandFail` answers back into JSON.
 *
 * @desc Hook calls are requests like any other.
 * Each request gets at most one answer; extra answers
 * are dropped.
 */
class CommandReceiver {
private:
	S::Bus& bus;
	std::set<Ln::CommandId> pendings;

	/* Whether the id was pending, removing it.  */
	bool take(Ln::CommandId const& id);

public:
	explicit
	CommandReceiver(S::Bus& bus);
};

}}

#endif /* !defined(HOLD_MOD_COMMANDRECEIVER_HPP) */
