#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Amount.hpp"
#include"Ln/CommandId.hpp"
#include"Ln/NodeId.hpp"
#include"Ln/Scid.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

namespace {

Jsmn::Object parse(std::string const& s) {
	auto is = std::istringstream(s);
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

}

int main() {
	/* Amounts as lightningd writes them in htlc_accepted.  */
	{
		auto js = parse(R"JSON(
		{ "number": 2100000000000000000
		, "string": "1000msat"
		, "float": 1.5
		, "bad": "1000sat"
		, "array": []
		}
		)JSON");
		/* Exact even where a double would round.  */
		assert( Ln::Amount::object(js["number"]).to_msat()
		     == std::uint64_t(2100000000000000000ULL)
		      );
		assert(Ln::Amount::object(js["string"]) == Ln::Amount::msat(1000));
		assert(Ln::Amount::valid_object(js["string"]));
		assert(!Ln::Amount::valid_object(js["bad"]));
		assert(!Ln::Amount::valid_object(js["array"]));

		auto thrown = false;
		try {
			(void) Ln::Amount::object(js["float"]);
		} catch (std::invalid_argument const&) {
			thrown = true;
		}
		assert(thrown);

		assert(std::string(Ln::Amount::msat(42)) == "42msat");
		assert(!Ln::Amount::valid_string("msat"));
		assert(!Ln::Amount::valid_string("12345678901234567890msat"));
	}

	/* Channels of incoming HTLCs.  */
	{
		assert(Ln::Scid::valid_string("103x1x0"));
		assert(!Ln::Scid::valid_string("103x1"));
		assert(!Ln::Scid::valid_string("103:1:0"));
		auto a = Ln::Scid("103x1x0");
		auto b = Ln::Scid("103x2x0");
		assert(std::string(a) == "103x1x0");
		assert(a < b);
		assert(a != b);
		assert(!Ln::Scid());
		assert(bool(a));
	}

	/* Payees and route hint nodes.  */
	{
		auto s = std::string("03e7156ae33b0a208d0744199163177e909e80176e55d97a2f221ede0f934dd9ad");
		assert(Ln::NodeId::valid_string(s));
		assert(!Ln::NodeId::valid_string(s.substr(2)));
		assert(!Ln::NodeId::valid_string("04" + s.substr(2)));
		assert(std::string(Ln::NodeId(s)) == s);
	}

	/* Request ids, which we must hand back unchanged.  */
	{
		auto js = parse(R"JSON(
		[18446744073709551615, "cln:htlc_accepted#42", null, {}]
		)JSON");
		auto n = Ln::command_id_from_jsmn_object(js[0]);
		assert(n);
		assert(*n == Ln::CommandId::left(18446744073709551615ULL));
		auto s = Ln::command_id_from_jsmn_object(js[1]);
		assert(s);
		assert(*s == Ln::CommandId::right("cln:htlc_accepted#42"));
		assert(!(*n == *s));
		assert(!Ln::command_id_from_jsmn_object(js[2]));
		assert(!Ln::command_id_from_jsmn_object(js[3]));

		auto out = Json::Out()
			.start_object()
				.field("n", *n)
				.field("s", *s)
			.end_object()
			.output()
			;
		auto back = parse(out);
		assert(back["n"].direct_text() == "18446744073709551615");
		assert(std::string(back["s"]) == "cln:htlc_accepted#42");
	}

	return 0;
}
