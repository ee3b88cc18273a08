#ifndef HOLD_MOD_BLOCKTRACKER_HPP
#define HOLD_MOD_BLOCKTRACKER_HPP

namespace Jsmn { class Object; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::BlockTracker
 *
 * @brief subscribes to the `block_added` notification
 * and emits a `Hold::Msg::Block` for each.
 */
class BlockTracker {
private:
	S::Bus& bus;

	Ev::Io<void> on_block_added(Jsmn::Object const& params);
	void start();

public:
	explicit
	BlockTracker(S::Bus& bus_) : bus(bus_) { start(); }
};

}}

#endif /* !defined(HOLD_MOD_BLOCKTRACKER_HPP) */
