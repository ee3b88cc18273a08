#ifndef HOLD_MOD_PARAMS_HPP
#define HOLD_MOD_PARAMS_HPP

#include"Jsmn/Object.hpp"
#include<cstdint>
#include<map>
#include<string>
#include<vector>

namespace Ln { class Amount; }
namespace Ln { class Preimage; }
namespace Sha256 { class Hash; }

namespace Hold { namespace Mod {

/** class Hold::Mod::Params
 *
 * @brief the parameters of a command, given either as
 * an array in the order of `names`, or as an object
 * keyed by those names.
 *
 * @desc A JSON `null` counts as absent.
 * All failures throw `Hold::Mod::ParamError`.
 */
class Params {
private:
	std::map<std::string, Jsmn::Object> values;

	Jsmn::Object need(std::string const& name) const;

public:
	Params( Jsmn::Object const& params
	      , std::vector<std::string> const& names
	      );

	bool has(std::string const& name) const;
	/* Null if absent.  */
	Jsmn::Object get(std::string const& name) const;

	std::string string(std::string const& name) const;
	std::uint64_t u64(std::string const& name) const;
	Ln::Amount amount(std::string const& name) const;
	Sha256::Hash hash(std::string const& name) const;
	Ln::Preimage preimage(std::string const& name) const;
};

}}

#endif /* !defined(HOLD_MOD_PARAMS_HPP) */
