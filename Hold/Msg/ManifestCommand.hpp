#ifndef HOLD_MSG_MANIFESTCOMMAND_HPP
#define HOLD_MSG_MANIFESTCOMMAND_HPP

#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::ManifestCommand
 *
 * @brief emitted while handling a `Hold::Msg::Manifestation`
 * in order to register a command.
 */
struct ManifestCommand {
	std::string name;
	std::string usage;
	std::string description;
	bool deprecated;
};

}}

#endif /* !defined(HOLD_MSG_MANIFESTCOMMAND_HPP) */
