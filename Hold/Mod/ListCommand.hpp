#ifndef HOLD_MOD_LISTCOMMAND_HPP
#define HOLD_MOD_LISTCOMMAND_HPP

#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::ListCommand
 *
 * @brief the `listholdinvoices` and
 * `cleanholdinvoices` commands.
 */
class ListCommand {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	ListCommand() =delete;
	ListCommand(ListCommand const&) =delete;

	explicit
	ListCommand(S::Bus& bus);
	ListCommand(ListCommand&&);
	~ListCommand();
};

}}

#endif /* !defined(HOLD_MOD_LISTCOMMAND_HPP) */
