#ifndef HOLD_MOD_MANIFESTER_HPP
#define HOLD_MOD_MANIFESTER_HPP

#include"Hold/Msg/ManifestCommand.hpp"
#include"Hold/Msg/ManifestOption.hpp"
#include<map>
#include<set>
#include<string>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::Manifester
 *
 * @brief answers `getmanifest` with whatever the other
 * modules registered during `Hold::Msg::Manifestation`.
 */
class Manifester {
private:
	S::Bus& bus;
	std::map<std::string, Msg::ManifestCommand> commands;
	std::map<std::string, Msg::ManifestOption> options;
	std::set<std::string> hooks;
	std::set<std::string> subscriptions;
	std::set<std::string> emitted;

	void start();

public:
	explicit
	Manifester(S::Bus& bus_) : bus(bus_) { start(); }
};

}}

#endif /* !defined(HOLD_MOD_MANIFESTER_HPP) */
