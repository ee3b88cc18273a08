#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Ln/HtlcAccepted.hpp"
#include"Util/Str.hpp"
#include<assert.h>

namespace {

auto const final_hop = std::string(R"JSON(
{ "onion": { "payload": "00"
           , "type": "tlv"
           , "total_msat": 150000
           , "payment_secret": "3d4358d6d287d3f7c5f0bb830f526c257f9052da0c18d34eb6140d29857fd8e3"
           }
, "htlc": { "short_channel_id": "103x1x0"
          , "id": 7
          , "amount_msat": 100000
          , "cltv_expiry": 250
          , "cltv_expiry_relative": 90
          , "payment_hash": "9981de66e2058d1341d258d062fef408246b10cfb40527cf15dd653f72c54628"
          }
, "forward_to": null
}
)JSON");

auto const forward = std::string(R"JSON(
{ "onion": { "payload": "00"
           , "short_channel_id": "104x1x1"
           , "forward_msat": 99000
           , "outgoing_cltv_value": 200
           }
, "htlc": { "short_channel_id": "103x1x0"
          , "id": 8
          , "amount": "100000msat"
          , "cltv_expiry": 250
          , "payment_hash": "9981de66e2058d1341d258d062fef408246b10cfb40527cf15dd653f72c54628"
          }
}
)JSON");

}

int main() {
	{
		auto r = Ln::HtlcAccepted::Request::parse(
			Ln::CommandId::left(42),
			Jsmn::Object::parse_json(final_hop.c_str())
		);
		assert(r.id == Ln::CommandId::left(42));
		assert(r.scid == Ln::Scid("103x1x0"));
		assert(r.htlc_id == 7);
		assert(r.amount == Ln::Amount::msat(100000));
		assert(r.cltv_expiry == 250);
		assert(r.has_cltv_expiry_relative);
		assert(r.cltv_expiry_relative == 90);
		assert(r.payment_hash == Sha256::Hash("9981de66e2058d1341d258d062fef408246b10cfb40527cf15dd653f72c54628"));
		assert(r.payment_secret == Ln::Preimage("3d4358d6d287d3f7c5f0bb830f526c257f9052da0c18d34eb6140d29857fd8e3"));
		assert(r.total_msat == Ln::Amount::msat(150000));
		assert(!r.is_forward);
	}
	{
		auto r = Ln::HtlcAccepted::Request::parse(
			Ln::CommandId::right("\"cln:htlc_accepted#1\""),
			Jsmn::Object::parse_json(forward.c_str())
		);
		assert(r.htlc_id == 8);
		assert(r.amount == Ln::Amount::msat(100000));
		/* No onion total means a single-part payment.  */
		assert(r.total_msat == r.amount);
		assert(!r.payment_secret);
		assert(!r.has_cltv_expiry_relative);
		assert(r.is_forward);
	}
	{
		auto flag = false;
		try {
			Ln::HtlcAccepted::Request::parse(
				Ln::CommandId::left(1),
				Jsmn::Object::parse_json("{\"onion\": 1}")
			);
		} catch (std::exception const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
