#undef NDEBUG
#include"Ln/Bolt11.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>
#include<assert.h>
#include<ctype.h>

namespace {

/* Regtest invoice for 123msat, with a payment secret.  */
auto const simple = std::string("lnbcrt1230p1pnwzkshsp584p434kjslfl030shwps75nvy4leq5k6psvdxn4kzsxjnptlmr3spp5nxqauehzqkx3xswjtrgx9lh5pqjxkyx0kszj0nc4m4jn7uk9gc5qdq8v9ekgesxqyjw5qcqp29qxpqysgqu6ft6p8c36khp082xng2xzmta25nlg803qjncal3fhzw8eshrsdyevhlgs970a09n95r3gtvqvvyk24vyv4506cu6cxl8ytaywrjkhcp468qnl");

/* Mainnet invoice with a private route hint.  */
auto const routed = std::string("lnbc12340n1pneza3zpp5hhjgu6far8trlutxt8pjrc62dsnpvafcwl23adt8282u2dra7wxscqzyssp5ntyh5dfyvd22lgusezf37eyq2pxatwetdnjufjr03cmxqdmty64s9q7sqqqqqqqqqqqqqqqqqqqsqqqqqysgqdqqmqz9gxqyjw5qrzjqwryaup9lh50kkranzgcdnn2fgvx390wgj5jd07rwr3vxeje0glclll3zu949263tyqqqqlgqqqqqeqqjq9tp6ckmkl3mfm8f74aeardylyreyrwwkm5r89rlea9sergw9gzt5k8tx9jjmpq8qvgjpjgz09d8fswxkxn93cyk3w8ahhs7uqd4qgkgpww9uwa");

bool throws_decode_error(std::string const& s) {
	try {
		Ln::Bolt11::decode(s);
	} catch (Ln::Bolt11::DecodeError const&) {
		return true;
	}
	return false;
}

/* The words of a valid invoice under another prefix,
 * with a correct checksum.  */
std::string reprefix(std::string const& s, std::string const& hrp) {
	auto old_hrp = std::string();
	auto words = std::vector<std::uint8_t>();
	assert(Util::Bech32::decode(old_hrp, words, s));
	return Util::Bech32::encode(hrp, words);
}

}

int main() {
	{
		auto inv = Ln::Bolt11::decode(simple);
		assert(inv.currency == "bcrt");
		assert(inv.has_amount);
		assert(inv.amount == Ln::Amount::msat(123));
		assert(inv.payment_hash == Sha256::Hash("9981de66e2058d1341d258d062fef408246b10cfb40527cf15dd653f72c54628"));
		assert(inv.payment_secret == Ln::Preimage("3d4358d6d287d3f7c5f0bb830f526c257f9052da0c18d34eb6140d29857fd8e3"));
		assert(inv.min_final_cltv_expiry == 10);
		assert(!inv.has_description_hash);
		assert(inv.route_hints.empty());
		assert(inv.payee);
	}
	{
		/* Uppercase is still valid bech32.  */
		auto upper = simple;
		std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
			return toupper(c);
		});
		auto inv = Ln::Bolt11::decode(upper);
		assert(inv.amount == Ln::Amount::msat(123));
	}
	{
		auto inv = Ln::Bolt11::decode(routed);
		assert(inv.currency == "bc");
		assert(inv.amount == Ln::Amount::msat(1234000));
		assert(inv.payee == Ln::NodeId("0367d0a9bdc0e3d410379223e4b930806c3a2f4ee4e2c9811973f1170b52ab5159"));
		assert(inv.route_hints.size() == 1);
		assert(inv.route_hints[0].size() == 1);
		assert(inv.route_hints[0][0].node_id == Ln::NodeId("03864ef025fde8fb587d989186ce6a4a186895ee44a926bfc370e2c366597a3f8f"));
		assert(inv.description == "");
	}

	/* Corruptions.  */
	assert(throws_decode_error(""));
	assert(throws_decode_error("lnbcrt1230p1qqqqqq"));
	{
		auto bad = simple;
		bad[bad.size() - 10] = (bad[bad.size() - 10] == 'q') ? 'p' : 'q';
		assert(throws_decode_error(bad));
	}
	{
		/* Amounts that do not fit in 64 bits of msat.  */
		assert(throws_decode_error(reprefix(simple, "lnbc200000000000")));
		assert(throws_decode_error(reprefix(simple, "lnbc184467440738")));
		assert(throws_decode_error(reprefix(simple, "lnbc18446744073710m")));
		auto flag = false;
		try {
			Ln::Bolt11::decode(reprefix(simple, "lnbc9999999999999999999n"));
		} catch (Ln::Bolt11::DecodeError const& e) {
			flag = std::string(e.what()).find("too large")
			    != std::string::npos
			     ;
		}
		assert(flag);
	}
	{
		/* Mixed case.  */
		auto bad = simple;
		bad[0] = 'L';
		assert(throws_decode_error(bad));
	}

	{
		/* What we encode, we decode, signed by the given key.  */
		Secp256k1::Random random;
		auto sk = Secp256k1::PrivKey(random);
		auto inv = Ln::Bolt11::Invoice();
		inv.currency = Ln::Bolt11::currency_of_network("regtest");
		inv.has_amount = true;
		inv.amount = Ln::Amount::msat(150000);
		inv.timestamp = 1700000000;
		inv.payment_hash = Sha256::Hash("9981de66e2058d1341d258d062fef408246b10cfb40527cf15dd653f72c54628");
		inv.payment_secret = Ln::Preimage(random);
		inv.description = "coffee";
		inv.expiry = 600;
		inv.min_final_cltv_expiry = 80;
		inv.features.insert(8);
		inv.features.insert(14);
		inv.features.insert(17);

		auto s = Ln::Bolt11::encode(inv, sk);
		assert(s.substr(0, 11) == "lnbcrt1500n");

		auto back = Ln::Bolt11::decode(s);
		assert(back.amount == inv.amount);
		assert(back.timestamp == inv.timestamp);
		assert(back.payment_hash == inv.payment_hash);
		assert(back.payment_secret == inv.payment_secret);
		assert(back.description == "coffee");
		assert(back.expiry == 600);
		assert(back.min_final_cltv_expiry == 80);
		assert(back.features == inv.features);
		assert(back.payee == Ln::NodeId(std::string(Secp256k1::PubKey(sk))));
	}
	{
		auto inv = Ln::Bolt11::Invoice();
		inv.currency = "bc";
		inv.payment_hash = Sha256::Hash("9981de66e2058d1341d258d062fef408246b10cfb40527cf15dd653f72c54628");
		Secp256k1::Random random;
		auto s = Ln::Bolt11::encode(inv, Secp256k1::PrivKey(random));
		auto back = Ln::Bolt11::decode(s);
		assert(!back.has_amount);
		assert(back.expiry == 3600);
	}

	assert(Ln::Bolt11::currency_of_network("bitcoin") == "bc");
	assert(Ln::Bolt11::currency_of_network("signet") == "tbs");
	{
		auto flag = false;
		try {
			Ln::Bolt11::currency_of_network("liquid");
		} catch (std::invalid_argument const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
