#ifndef HOLD_MSG_MANIFESTHOOK_HPP
#define HOLD_MSG_MANIFESTHOOK_HPP

#include<string>

namespace Hold { namespace Msg {

/** struct Hold::Msg::ManifestHook
 *
 * @brief emitted in response to `Hold::Msg::Manifestation`
 * to register a hook.
 */
struct ManifestHook {
	std::string name;
};

}}

#endif /* !defined(HOLD_MSG_MANIFESTHOOK_HPP) */
