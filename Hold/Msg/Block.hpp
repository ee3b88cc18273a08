#ifndef HOLD_MSG_BLOCK_HPP
#define HOLD_MSG_BLOCK_HPP

#include<cstdint>

namespace Hold { namespace Msg {

/** struct Hold::Msg::Block
 *
 * @brief a new block has been processed by lightningd.
 *
 * @desc Heights may be skipped, and after a reorg the
 * same height may be reported again.
 */
struct Block {
	std::uint32_t height;
};

}}

#endif /* !defined(HOLD_MSG_BLOCK_HPP) */
