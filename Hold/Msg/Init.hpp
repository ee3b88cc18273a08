#ifndef HOLD_MSG_INIT_HPP
#define HOLD_MSG_INIT_HPP

#include"Ln/NodeId.hpp"
#include"Sqlite3/Db.hpp"
#include<cstdint>
#include<string>

namespace Hold { namespace Mod { class Rpc; }}

namespace Hold { namespace Msg {

/** struct Hold::Msg::Init
 *
 * @brief emitted when the `init` command is
 * performed.
 */
struct Init {
	Hold::Mod::Rpc& rpc;
	Ln::NodeId self_id;
	/* As lightningd names it, e.g. "regtest".  */
	std::string network;
	Sqlite3::Db db;
	/* From `getinfo`.  */
	std::uint32_t blockheight;
};

}}

#endif /* !defined(HOLD_MSG_INIT_HPP) */
