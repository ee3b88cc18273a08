#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<string>

/* lightningd writes requests to our stdin, and answers
 * on the RPC socket, in whatever chunks the kernel
 * hands over.  */
int main() {
	/* Split in the middle of a string.  */
	{
		Jsmn::Parser parser;
		auto r = parser.feed(R"JSON({"id": 1, "method": "htlc_ac)JSON");
		assert(r.empty());
		r = parser.feed(R"JSON(cepted", "params": {}})JSON");
		assert(r.size() == 1);
		assert(std::string(r[0]["method"]) == "htlc_accepted");
		assert(double(r[0]["id"]) == 1);
	}

	/* Several in one chunk, with the last one cut.  */
	{
		Jsmn::Parser parser;
		auto r = parser.feed(
			"{\"id\": 1}\n\n{\"id\": 2}\n{\"id\""
		);
		assert(r.size() == 2);
		assert(double(r[0]["id"]) == 1);
		assert(double(r[1]["id"]) == 2);
		r = parser.feed(": \"three\"}\n");
		assert(r.size() == 1);
		assert(std::string(r[0]["id"]) == "three");
		/* Only whitespace left.  */
		r = parser.feed("  \n");
		assert(r.empty());
	}

	/* One byte at a time.  */
	{
		Jsmn::Parser parser;
		auto text = std::string(R"JSON({"result": {"bolt11": "lnbcrt1", "list": [1, 2, {"x": null}]}})JSON");
		auto count = std::size_t(0);
		for (auto c : text) {
			auto r = parser.feed(std::string(1, c));
			if (!r.empty()) {
				assert(r.size() == 1);
				assert(r[0]["result"]["list"].size() == 3);
				assert(r[0]["result"]["list"][2]["x"].is_null());
				++count;
			}
		}
		assert(count == 1);
	}

	/* Garbage is refused.  */
	{
		Jsmn::Parser parser;
		auto thrown = false;
		try {
			(void) parser.feed("{\"id\": @}");
		} catch (Jsmn::ParseError const& e) {
			thrown = true;
			assert(e.position() == 7);
			assert(std::string(e.what()).find("@") != std::string::npos);
		}
		assert(thrown);
	}

	return 0;
}
