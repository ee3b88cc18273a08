#ifndef HOLD_MSG_POLICYRESOURCE_HPP
#define HOLD_MSG_POLICYRESOURCE_HPP

#include"Hold/Policy.hpp"

namespace Hold { namespace Msg {

/** struct Hold::Msg::PolicyResource
 *
 * @brief the engine tunables, raised once the plugin
 * options are known and before `Hold::Msg::Init`.
 */
struct PolicyResource {
	Hold::Policy policy;
};

}}

#endif /* !defined(HOLD_MSG_POLICYRESOURCE_HPP) */
