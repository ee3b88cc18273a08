#ifndef HOLD_MOD_RESPOND_HPP
#define HOLD_MOD_RESPOND_HPP

#include"Ln/CommandId.hpp"
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace S { class Bus; }

namespace Hold { namespace Mod {

/** Hold::Mod::respond
 *
 * @brief run the action of a command, then answer it
 * with the result or with an error.
 *
 * @desc Error codes:
 * - `std::invalid_argument`, including
 *   `Hold::Mod::ParamError` and `Jsmn::TypeError`:
 *   -32600.
 * - `Hold::Refused`: 2103, with `refused_prefix`
 *   before the message.
 * - any other `std::exception`: -32603.
 *
 * `Hold::Shutdown` passes through unanswered.
 */
Ev::Io<void> respond( S::Bus& bus
		    , Ln::CommandId id
		    , std::string refused_prefix
		    , Ev::Io<Json::Out> action
		    );

}}

#endif /* !defined(HOLD_MOD_RESPOND_HPP) */
