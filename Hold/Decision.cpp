#include"Hold/Decision.hpp"
#include"Json/Out.hpp"
#include"Util/Str.hpp"
#include<stdexcept>

namespace Hold {

bool Decision::operator==(Decision const& o) const {
	if (k != o.k)
		return false;
	switch (k) {
	case Kind_Fail:
		return failure == o.failure;
	case Kind_Resolve:
		return key == o.key;
	default:
		return true;
	}
}

Json::Out Decision::to_json() const {
	switch (k) {
	case Kind_Continue:
		return Json::Out()
			.start_object()
				.field("result", std::string("continue"))
			.end_object()
			;
	case Kind_Fail:
		return Json::Out()
			.start_object()
				.field("result", std::string("fail"))
				.field( "failure_message"
				      , Util::Str::hexdump( failure.data()
							  , failure.size()
							  )
				      )
			.end_object()
			;
	case Kind_Resolve:
		return Json::Out()
			.start_object()
				.field("result", std::string("resolve"))
				.field("payment_key", std::string(key))
			.end_object()
			;
	case Kind_Hold:
		break;
	}
	throw std::logic_error("Hold::Decision: hold has no hook result");
}

}
