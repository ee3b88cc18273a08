#ifndef HOLD_MOD_INITIATOR_HPP
#define HOLD_MOD_INITIATOR_HPP

#include<functional>
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Hold { namespace Mod {

/** class Hold::Mod::Initiator
 *
 * @brief handles the `init` command.
 *
 * @desc Hands out the option values, opens the RPC
 * socket and the database, asks the node who it is,
 * then raises `Hold::Msg::Init` before answering
 * `init`.
 *
 * If anything fails, the plugin asks lightningd to
 * disable it instead of crashing.
 */
class Initiator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Initiator() =delete;

	Initiator( S::Bus& bus
		 , Ev::ThreadPool& threadpool
		 , std::function<Net::Fd( std::string const&
					, std::string const&
					)> open_rpc_socket
		 );
	Initiator(Initiator&&);
	~Initiator();
};

}}

#endif /* !defined(HOLD_MOD_INITIATOR_HPP) */
