#include"Hold/Mod/ParamError.hpp"
#include"Hold/Mod/Params.hpp"
#include"Ln/Amount.hpp"
#include"Ln/Preimage.hpp"
#include"Sha256/Hash.hpp"
#include<sstream>

namespace Hold { namespace Mod {

Params::Params( Jsmn::Object const& params
	      , std::vector<std::string> const& names
	      ) {
	if (params.is_array()) {
		if (params.size() > names.size()) {
			auto os = std::ostringstream();
			os << "too many parameters, at most "
			   << names.size();
			throw ParamError(os.str());
		}
		for (auto i = std::size_t(0); i < params.size(); ++i)
			if (!params[i].is_null())
				values[names[i]] = params[i];
	} else if (params.is_object()) {
		for (auto const& k : params.keys()) {
			auto found = false;
			for (auto const& n : names)
				if (n == k) {
					found = true;
					break;
				}
			if (!found)
				throw ParamError("unknown parameter " + k);
			if (!params[k].is_null())
				values[k] = params[k];
		}
	} else if (!params.is_null())
		throw ParamError("parameters must be array or object");
}

bool Params::has(std::string const& name) const {
	return values.find(name) != values.end();
}
Jsmn::Object Params::get(std::string const& name) const {
	auto it = values.find(name);
	if (it == values.end())
		return Jsmn::Object();
	return it->second;
}
Jsmn::Object Params::need(std::string const& name) const {
	auto it = values.find(name);
	if (it == values.end())
		throw ParamError("missing required parameter " + name);
	return it->second;
}

std::string Params::string(std::string const& name) const {
	auto js = need(name);
	if (!js.is_string())
		throw ParamError(name + " must be a string");
	return std::string(js);
}
std::uint64_t Params::u64(std::string const& name) const {
	auto js = need(name);
	auto text = js.is_number() ? js.direct_text()
		  : js.is_string() ? std::string(js)
		  : std::string()
		  ;
	auto is = std::istringstream(text);
	auto rv = std::uint64_t();
	if (text.empty() || text[0] == '-' || !(is >> rv) || !is.eof())
		throw ParamError(name + " must be a non-negative integer");
	return rv;
}
Ln::Amount Params::amount(std::string const& name) const {
	auto js = need(name);
	if (js.is_string()) {
		/* Plain digits are millisatoshis too.  */
		auto s = std::string(js);
		if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos)
			return Ln::Amount::msat(u64(name));
	}
	if (!Ln::Amount::valid_object(js))
		throw ParamError(name + " must be an amount");
	return Ln::Amount::object(js);
}
Sha256::Hash Params::hash(std::string const& name) const {
	auto s = string(name);
	if (!Sha256::Hash::valid_string(s))
		throw ParamError(name + " must be 64 hex digits");
	return Sha256::Hash(s);
}
Ln::Preimage Params::preimage(std::string const& name) const {
	auto s = string(name);
	if (!Ln::Preimage::valid_string(s))
		throw ParamError(name + " must be 64 hex digits");
	return Ln::Preimage(s);
}

}}
