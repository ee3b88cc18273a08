#undef NDEBUG
#include"Hold/Mod/ParamError.hpp"
#include"Hold/Mod/Params.hpp"
#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include"Ln/Preimage.hpp"
#include"Sha256/Hash.hpp"
#include<assert.h>
#include<functional>
#include<sstream>

namespace {

Jsmn::Object parse(std::string const& s) {
	auto is = std::istringstream(s);
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

bool param_error(std::function<void()> f) {
	try {
		f();
	} catch (Hold::Mod::ParamError const&) {
		return true;
	}
	return false;
}

auto const names = std::vector<std::string>{"payment_hash", "amount_msat", "expiry"};
auto const hash = std::string(64, 'a');

}

int main() {
	{
		/* Positional, with trailing ones left out.  */
		auto p = Hold::Mod::Params(parse(
			"[\"" + hash + "\", \"1000\"]"
		), names);
		assert(p.has("payment_hash"));
		assert(p.has("amount_msat"));
		assert(!p.has("expiry"));
		assert(p.hash("payment_hash") == Sha256::Hash(hash));
		assert(p.amount("amount_msat") == Ln::Amount::msat(1000));
		assert(p.get("expiry").is_null());
		assert(param_error([&]() { p.u64("expiry"); }));
	}
	{
		/* Named, with nulls as absent.  */
		auto p = Hold::Mod::Params(parse(
			"{\"expiry\": 3600, \"amount_msat\": \"2000msat\""
			", \"payment_hash\": null}"
		), names);
		assert(!p.has("payment_hash"));
		assert(p.u64("expiry") == 3600);
		assert(p.amount("amount_msat") == Ln::Amount::msat(2000));
	}
	{
		/* Positional nulls skip.  */
		auto p = Hold::Mod::Params(parse("[null, 5, \"7\"]"), names);
		assert(!p.has("payment_hash"));
		assert(p.amount("amount_msat") == Ln::Amount::msat(5));
		assert(p.u64("expiry") == 7);
	}
	{
		auto p = Hold::Mod::Params(parse("null"), names);
		assert(!p.has("payment_hash"));
	}

	assert(param_error([]() {
		Hold::Mod::Params(parse("[1, 2, 3, 4]"), names);
	}));
	assert(param_error([]() {
		Hold::Mod::Params(parse("{\"label\": \"x\"}"), names);
	}));
	assert(param_error([]() {
		Hold::Mod::Params(parse("\"x\""), names);
	}));

	{
		auto p = Hold::Mod::Params(parse(
			"[\"xyz\", \"lots\", -1]"
		), names);
		assert(param_error([&]() { p.hash("payment_hash"); }));
		assert(param_error([&]() { p.preimage("payment_hash"); }));
		assert(param_error([&]() { p.amount("amount_msat"); }));
		assert(param_error([&]() { p.u64("expiry"); }));
		assert(p.string("payment_hash") == "xyz");
		assert(param_error([&]() { p.string("expiry"); }));
	}
	{
		auto p = Hold::Mod::Params(parse("[1, 2, 1.5]"), names);
		assert(param_error([&]() { p.u64("expiry"); }));
		/* Not a string.  */
		assert(param_error([&]() { p.hash("payment_hash"); }));
	}
	{
		auto p = Hold::Mod::Params(parse("[\"" + hash + "\"]"), names);
		assert(p.preimage("payment_hash") == Ln::Preimage(hash));
	}

	/* Parameter errors are invalid arguments.  */
	try {
		throw Hold::Mod::ParamError("bad");
	} catch (std::invalid_argument const& e) {
		assert(std::string(e.what()) == "bad");
	}

	return 0;
}
