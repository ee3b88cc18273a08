#undef NDEBUG
#include"Hold/Decision.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/FailureMessage.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

namespace {

Jsmn::Object parse(Json::Out const& js) {
	auto is = std::istringstream(js.output());
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

}

int main() {
	auto key = Ln::Preimage(std::string(64, '3'));

	{
		auto js = parse(Hold::Decision::cont().to_json());
		assert(js.size() == 1);
		assert(std::string(js["result"]) == "continue");
	}
	{
		auto d = Hold::Decision::resolve(key);
		auto js = parse(d.to_json());
		assert(std::string(js["result"]) == "resolve");
		assert(std::string(js["payment_key"]) == std::string(64, '3'));
	}
	{
		auto d = Hold::Decision::fail(Ln::FailureMessage::mpp_timeout());
		auto js = parse(d.to_json());
		assert(std::string(js["result"]) == "fail");
		assert(std::string(js["failure_message"]) == "0017");
	}

	/* Hold is never sent.  */
	auto thrown = false;
	try {
		Hold::Decision::hold().to_json();
	} catch (std::logic_error const&) {
		thrown = true;
	}
	assert(thrown);

	assert(Hold::Decision::hold() == Hold::Decision::hold());
	assert(Hold::Decision::hold() != Hold::Decision::cont());
	assert(Hold::Decision::resolve(key) == Hold::Decision::resolve(key));
	assert( Hold::Decision::resolve(key)
	     != Hold::Decision::resolve(Ln::Preimage(std::string(64, '4')))
	      );
	assert( Hold::Decision::fail(Ln::FailureMessage::mpp_timeout())
	     != Hold::Decision::fail(
			Ln::FailureMessage::final_incorrect_cltv_expiry(100)
		)
	      );

	return 0;
}
