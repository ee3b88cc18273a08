#ifndef HOLD_OPEN_RPC_SOCKET_HPP
#define HOLD_OPEN_RPC_SOCKET_HPP

#include<string>

namespace Net { class Fd; }

namespace Hold {

/** Hold::open_rpc_socket
 *
 * @brief change to the lightning directory and
 * connect to the node RPC socket there.
 *
 * @desc Passed to `Hold::Main` as a function so
 * tests can substitute a socketpair.
 * Throws `std::runtime_error` on failure.
 */
Net::Fd open_rpc_socket( std::string const& lightning_dir = "."
		       , std::string const& rpc_file = "lightning-rpc"
		       );

}

#endif /* !defined(HOLD_OPEN_RPC_SOCKET_HPP) */
