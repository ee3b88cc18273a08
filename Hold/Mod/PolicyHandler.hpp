#ifndef HOLD_MOD_POLICYHANDLER_HPP
#define HOLD_MOD_POLICYHANDLER_HPP

#include<memory>

namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::PolicyHandler
 *
 * @brief registers the engine tunables as plugin
 * options, and raises `Hold::Msg::PolicyResource`
 * once their values are known.
 *
 * @desc Unusable values are logged and replaced with
 * the default.
 */
class PolicyHandler {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	PolicyHandler() =delete;
	PolicyHandler(PolicyHandler const&) =delete;

	explicit
	PolicyHandler(S::Bus& bus);
	PolicyHandler(PolicyHandler&&);
	~PolicyHandler();
};

}}

#endif /* !defined(HOLD_MOD_POLICYHANDLER_HPP) */
