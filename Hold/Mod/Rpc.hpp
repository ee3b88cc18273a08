#ifndef HOLD_MOD_RPC_HPP
#define HOLD_MOD_RPC_HPP

#include"Jsmn/Object.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Hold { namespace Mod {

/** struct Hold::Mod::RpcError
 *
 * @brief lightningd answered an RPC command with an
 * error object.
 */
struct RpcError : public Util::BacktraceException<std::runtime_error> {
private:
	static
	std::string describe( std::string const&
			    , Jsmn::Object const&
			    );
public:
	RpcError() =delete;
	RpcError(std::string command, Jsmn::Object error);

	std::string command;
	Jsmn::Object error;

	/* The `code` of the error, or 0 if it has none.  */
	int code() const;
};

/** class Hold::Mod::Rpc
 *
 * @brief JSON-RPC client over the `lightning-rpc`
 * socket of the node.
 *
 * @desc Constructed by `Hold::Mod::Initiator` during
 * `init`, and handed to other modules in
 * `Hold::Msg::Init`.
 * Several commands may be in flight at once.
 * At `Hold::Shutdown`, and if the socket fails, all
 * pending and later commands fail.
 */
class Rpc {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Rpc() =delete;
	Rpc(Rpc const&) =delete;

	Rpc(S::Bus& bus, Net::Fd socket);
	Rpc(Rpc&&);
	~Rpc();

	Ev::Io<Jsmn::Object> command( std::string const& command
				    , Json::Out params
				    );
};

}}

#endif /* !defined(HOLD_MOD_RPC_HPP) */
