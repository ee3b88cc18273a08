#ifndef HOLD_MOD_RESOLVECOMMAND_HPP
#define HOLD_MOD_RESOLVECOMMAND_HPP

#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::ResolveCommand
 *
 * @brief the `settleholdinvoice` and
 * `cancelholdinvoice` commands.
 */
class ResolveCommand {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	ResolveCommand() =delete;
	ResolveCommand(ResolveCommand const&) =delete;

	explicit
	ResolveCommand(S::Bus& bus);
	ResolveCommand(ResolveCommand&&);
	~ResolveCommand();
};

}}

#endif /* !defined(HOLD_MOD_RESOLVECOMMAND_HPP) */
