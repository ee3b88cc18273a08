#ifndef HOLD_MSG_RELEASEHTLC_HPP
#define HOLD_MSG_RELEASEHTLC_HPP

#include"Hold/Decision.hpp"
#include"Hold/ResolverIF.hpp"

namespace Hold { namespace Msg {

/** struct Hold::Msg::ReleaseHtlc
 *
 * @brief the final decision on an HTLC that the engine
 * earlier told to hold.
 *
 * @desc `Hold::Mod::HtlcGate` answers the pending
 * `htlc_accepted` hook with it.
 */
struct ReleaseHtlc {
	Hold::HtlcKey key;
	Hold::Decision decision;
};

}}

#endif /* !defined(HOLD_MSG_RELEASEHTLC_HPP) */
