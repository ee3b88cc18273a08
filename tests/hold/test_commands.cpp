#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Hold/Mod/HtlcGate.hpp"
#include"Hold/Mod/InvoiceCommand.hpp"
#include"Hold/Mod/InvoiceEngine.hpp"
#include"Hold/Mod/ListCommand.hpp"
#include"Hold/Mod/ResolveCommand.hpp"
#include"Hold/Mod/Rpc.hpp"
#include"Hold/Mod/TrackCommand.hpp"
#include"Hold/Mod/UpdateNotifier.hpp"
#include"Hold/Mod/Waiter.hpp"
#include"Hold/Msg/CommandFail.hpp"
#include"Hold/Msg/CommandRequest.hpp"
#include"Hold/Msg/CommandResponse.hpp"
#include"Hold/Msg/Init.hpp"
#include"Hold/Msg/JsonCout.hpp"
#include"Hold/Shutdown.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Ln/Bolt11.hpp"
#include"Ln/Preimage.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Sqlite3.hpp"
#include<assert.h>
#include<errno.h>
#include<fcntl.h>
#include<sstream>
#include<sys/socket.h>
#include<sys/types.h>
#include<unistd.h>

namespace {

Jsmn::Object parse(std::string const& s) {
	auto is = std::istringstream(s);
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

/* Plays lightningd on the RPC socket: answers
 * `signinvoice` by handing the invoice back.  */
class FakeNode {
private:
	Net::Fd socket;
	Jsmn::Parser parser;
	std::size_t answered;

	Ev::Io<void> writeloop(std::string to_write) {
		return Ev::yield().then([this, to_write]() {
			auto res = write( socket.get()
					, to_write.c_str(), to_write.size()
					);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				return writeloop(to_write);
			assert(res >= 0);
			if (std::size_t(res) < to_write.size())
				return writeloop(to_write.substr(res));
			return Ev::lift();
		});
	}

public:
	explicit
	FakeNode(Net::Fd socket_) : socket(std::move(socket_)), answered(0) {
		auto flags = fcntl(socket.get(), F_GETFL);
		fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK);
	}

	/* Answer `n` requests, then stop.  */
	Ev::Io<void> serve(std::size_t n) {
		return Ev::yield().then([this, n]() {
			if (answered >= n)
				return Ev::lift();
			char buf[1024];
			auto requests = std::vector<Jsmn::Object>();
			for (;;) {
				auto res = read(socket.get(), buf, sizeof(buf));
				if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
					break;
				assert(res > 0);
				for (auto& r : parser.feed(std::string(buf, res)))
					requests.push_back(std::move(r));
			}
			auto act = Ev::lift();
			for (auto const& r : requests) {
				assert(std::string(r["method"]) == "signinvoice");
				++answered;
				act += writeloop(Json::Out()
					.start_object()
						.field("jsonrpc", std::string("2.0"))
						.field("id", std::uint64_t(double(r["id"])))
						.start_object("result")
							.field( "bolt11"
							      , std::string(r["params"]["invstring"])
							      )
						.end_object()
					.end_object()
					.output()
				);
			}
			return act.then([this, n]() {
				return serve(n);
			});
		});
	}
};

std::string htlc_params( Sha256::Hash const& hash
		       , std::uint64_t htlc_id
		       , std::uint64_t msat
		       , std::uint32_t relative
		       , Ln::Preimage const& secret
		       ) {
	return Json::Out()
		.start_object()
			.start_object("onion")
				.field("payload", std::string("00"))
				.field("type", std::string("tlv"))
				.field("total_msat", msat)
				.field("payment_secret", std::string(secret))
			.end_object()
			.start_object("htlc")
				.field("short_channel_id", std::string("103x1x0"))
				.field("id", htlc_id)
				.field("amount_msat", msat)
				.field("cltv_expiry", std::uint64_t(100 + relative))
				.field("cltv_expiry_relative", std::uint64_t(relative))
				.field("payment_hash", std::string(hash))
			.end_object()
		.end_object()
		.output()
		;
}

class Harness {
private:
	S::Bus& bus;

public:
	std::vector<std::pair<Ln::CommandId, std::string>> responses;
	std::vector<std::pair<Ln::CommandId, std::pair<int, std::string>>> fails;
	std::vector<std::string> couts;

	explicit
	Harness(S::Bus& bus_) : bus(bus_) {
		bus.subscribe<Hold::Msg::CommandResponse>([this](Hold::Msg::CommandResponse const& r) {
			responses.emplace_back(r.id, r.response.output());
			return Ev::lift();
		});
		bus.subscribe<Hold::Msg::CommandFail>([this](Hold::Msg::CommandFail const& f) {
			fails.emplace_back(f.id, std::make_pair(f.code, f.message));
			return Ev::lift();
		});
		bus.subscribe<Hold::Msg::JsonCout>([this](Hold::Msg::JsonCout const& c) {
			couts.push_back(c.obj.output());
			return Ev::lift();
		});
	}

	Ev::Io<void> call( std::uint64_t id
			 , std::string command
			 , std::string params
			 ) {
		return bus.raise(Hold::Msg::CommandRequest{
			std::move(command), parse(params),
			Ln::CommandId::left(id)
		});
	}
	/* For commands that only return later.  */
	Ev::Io<void> launch( std::uint64_t id
			   , std::string command
			   , std::string params
			   ) {
		return Ev::concurrent(call(id, std::move(command), std::move(params)));
	}

	bool responded(std::uint64_t id) const {
		auto cid = Ln::CommandId::left(id);
		for (auto const& r : responses)
			if (r.first == cid)
				return true;
		for (auto const& f : fails)
			if (f.first == cid)
				return true;
		return false;
	}
	Ev::Io<void> wait_for(std::uint64_t id) {
		if (responded(id))
			return Ev::lift();
		return Ev::yield().then([this, id]() {
			return wait_for(id);
		});
	}

	Jsmn::Object result(std::uint64_t id) const {
		auto cid = Ln::CommandId::left(id);
		for (auto const& r : responses)
			if (r.first == cid)
				return parse(r.second);
		assert(false);
		return Jsmn::Object();
	}
	std::pair<int, std::string> failure(std::uint64_t id) const {
		auto cid = Ln::CommandId::left(id);
		for (auto const& f : fails)
			if (f.first == cid)
				return f.second;
		assert(false);
		return std::make_pair(0, std::string());
	}
	bool starts_with(std::string const& s, std::string const& prefix) const {
		return s.substr(0, prefix.size()) == prefix;
	}
};

}

int main() {
	S::Bus bus;
	Harness harness(bus);

	int sockets[2];
	auto res = socketpair(AF_UNIX, SOCK_STREAM, 0, sockets);
	assert(res >= 0);
	auto node_socket = Net::Fd(sockets[0]);
	FakeNode node(std::move(node_socket));
	auto rpc = Hold::Mod::Rpc(bus, Net::Fd(sockets[1]));

	Hold::Mod::Waiter waiter(bus);
	auto engine = Hold::Mod::InvoiceEngine(bus);
	auto gate = Hold::Mod::HtlcGate(bus);
	auto invoice_command = Hold::Mod::InvoiceCommand(bus);
	auto resolve_command = Hold::Mod::ResolveCommand(bus);
	auto list_command = Hold::Mod::ListCommand(bus);
	auto track_command = Hold::Mod::TrackCommand(bus, waiter);
	auto notifier = Hold::Mod::UpdateNotifier(bus);

	auto self_key = Secp256k1::PrivKey(std::string(64, '1'));
	auto self_id = Ln::NodeId(std::string(Secp256k1::PubKey(self_key)));

	auto a = Ln::Preimage(std::string(64, 'a'));
	auto b = Ln::Preimage(std::string(64, 'b'));
	auto c = Ln::Preimage(std::string(64, 'c'));
	auto hash_a = std::string(a.sha256());
	auto hash_b = std::string(b.sha256());
	auto bolt11_a = std::string();
	auto secret_a = Ln::Preimage();
	auto next = std::uint64_t(0);

	/* Our own invoice, as some other plugin made it.  */
	auto ours = [&](Ln::Preimage const& p, std::uint64_t msat) {
		auto b11 = Ln::Bolt11::Invoice();
		b11.currency = "bcrt";
		b11.has_amount = true;
		b11.amount = Ln::Amount::msat(msat);
		b11.timestamp = std::uint64_t(Ev::now());
		b11.payment_hash = p.sha256();
		b11.payment_secret = Ln::Preimage(std::string(64, '5'));
		b11.description = "injected";
		return Ln::Bolt11::encode(b11, self_key);
	};

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(node.serve(2));
	}).then([&]() {
		return bus.raise(Hold::Msg::Init{
			rpc, self_id, "regtest", Sqlite3::Db(":memory:"), 100
		});
	}).then([&]() {

		/* holdinvoice.  */
		return harness.call(1, "holdinvoice"
				   , "{\"payment_hash\": \"" + hash_a + "\""
				     ", \"amount_msat\": 1000"
				     ", \"description\": \"coffee\"}"
				   );
	}).then([&]() {
		auto r = harness.result(1);
		bolt11_a = std::string(r["bolt11"]);
		auto b11 = Ln::Bolt11::decode(bolt11_a);
		assert(b11.currency == "bcrt");
		assert(b11.amount == Ln::Amount::msat(1000));
		assert(b11.payment_hash == a.sha256());
		assert(b11.description == "coffee");
		assert(b11.min_final_cltv_expiry == 80);
		assert(b11.payment_secret);
		assert(b11.features.count(14) == 1);
		secret_a = b11.payment_secret;

		/* Same hash again.  */
		return harness.call(2, "holdinvoice"
				   , "[\"" + hash_a + "\", \"any\"]"
				   );
	}).then([&]() {
		auto f = harness.failure(2);
		assert(f.first == 2103);
		assert(harness.starts_with(f.second, "could not create invoice: "));

		return harness.call(3, "holdinvoice"
				   , "[\"" + hash_b + "\", 1, \"x\", null, null"
				     ", null, \"" + hash_b + "\"]"
				   );
	}).then([&]() {
		assert(harness.failure(3).first == -32600);

		/* Zero could never be paid.  */
		return harness.call(7, "holdinvoice", "[\"" + hash_b + "\", 0]");
	}).then([&]() {
		assert(harness.failure(7).first == -32600);
		return harness.call(8, "injectholdinvoice"
				   , "[\"" + ours(Ln::Preimage(std::string(64, 'd')), 0) + "\"]"
				   );
	}).then([&]() {
		assert(harness.failure(8).first == -32600);

		/* A preimage that does not match.  */
		return harness.call(4, "holdinvoice"
				   , "{\"payment_hash\": \"" + hash_b + "\""
				     ", \"amount_msat\": 1"
				     ", \"preimage\": \"" + std::string(a) + "\"}"
				   );
	}).then([&]() {
		assert(harness.failure(4).first == -32600);

		/* Injecting an invoice of another node.  */
		return harness.call(5, "injectholdinvoice", "[\"" + bolt11_a + "\"]");
	}).then([&]() {
		auto f = harness.failure(5);
		assert(f.first == -32600);
		assert(f.second == "invoice is not related to us");

		return harness.call(6, "injectholdinvoice", "[\"" + ours(b, 500) + "\"]");
	}).then([&]() {
		assert(harness.result(6).size() == 0);

		/* Follow b until it ends.  */
		return harness.launch(10, "trackholdinvoice", "[\"" + hash_b + "\"]");
	}).then([&]() {

		/* Pay a.  */
		return harness.call(20, "htlc_accepted"
				   , htlc_params(a.sha256(), 1, 1000, 90, secret_a)
				   );
	}).then([&]() {
		/* Held.  */
		assert(!harness.responded(20));
		return harness.call(21, "settleholdinvoice", "[\"" + std::string(a) + "\"]");
	}).then([&]() {
		assert(harness.result(21).size() == 0);
		return harness.wait_for(20);
	}).then([&]() {
		auto r = harness.result(20);
		assert(std::string(r["result"]) == "resolve");
		assert(std::string(r["payment_key"]) == std::string(a));

		return harness.call(22, "cancelholdinvoice", "[\"" + hash_a + "\"]");
	}).then([&]() {
		auto f = harness.failure(22);
		assert(f.first == 2103);
		assert(f.second == "could not cancel invoice: state paid is final");

		return harness.call(23, "settleholdinvoice", "[\"nothex\"]");
	}).then([&]() {
		assert(harness.failure(23).first == -32600);

		/* Tracking a settled invoice replays its whole
		 * path and returns at once.  */
		return harness.call(26, "trackholdinvoice", "{\"payment_hash\": \"" + hash_a + "\"}");
	}).then([&]() {
		auto t = harness.result(26);
		assert(std::string(t["payment_hash"]) == hash_a);
		auto states = t["states"];
		assert(states.size() == 3);
		assert(std::string(states[0]) == "unpaid");
		assert(std::string(states[1]) == "accepted");
		assert(std::string(states[2]) == "paid");

		/* Pay b, then cancel it.  */
		return harness.call(24, "htlc_accepted"
				   , htlc_params( b.sha256(), 2, 500, 20
						, Ln::Preimage(std::string(64, '5'))
						)
				   );
	}).then([&]() {
		assert(!harness.responded(24));
		assert(!harness.responded(10));
		return harness.call(25, "cancelholdinvoice", "{\"payment_hash\": \"" + hash_b + "\"}");
	}).then([&]() {
		assert(harness.result(25).size() == 0);
		return harness.wait_for(24) + harness.wait_for(10);
	}).then([&]() {
		auto r = harness.result(24);
		assert(std::string(r["result"]) == "fail");

		auto t = harness.result(10);
		assert(std::string(t["payment_hash"]) == hash_b);
		auto states = t["states"];
		assert(states.size() == 3);
		assert(std::string(states[0]) == "unpaid");
		assert(std::string(states[1]) == "accepted");
		assert(std::string(states[2]) == "cancelled");

		/* Listing.  */
		return harness.call(30, "listholdinvoices", "{}");
	}).then([&]() {
		auto invs = harness.result(30)["holdinvoices"];
		assert(invs.size() == 2);
		assert(double(invs[0]["id"]) == 1);
		assert(std::string(invs[0]["state"]) == "paid");
		assert(std::string(invs[0]["preimage"]) == std::string(a));
		assert(std::string(invs[0]["bolt11"]) == bolt11_a);
		assert(invs[0]["htlcs"].size() == 1);
		assert(std::string(invs[0]["htlcs"][0]["state"]) == "paid");
		assert(std::string(invs[1]["state"]) == "cancelled");
		assert(!invs[1].has("preimage"));

		return harness.call(31, "listholdinvoices", "{\"limit\": 0}");
	}).then([&]() {
		assert(harness.failure(31).first == -32600);
		return harness.call(32, "listholdinvoices"
				   , "[\"" + hash_a + "\", \"" + bolt11_a + "\"]"
				   );
	}).then([&]() {
		assert(harness.failure(32).first == -32600);
		return harness.call(33, "listholdinvoices", "{\"index_start\": 2}");
	}).then([&]() {
		auto invs = harness.result(33)["holdinvoices"];
		assert(invs.size() == 1);
		assert(double(invs[0]["id"]) == 2);

		return harness.call(34, "listholdinvoices", "{\"index_start\": 18446744073709551615}");
	}).then([&]() {
		assert(harness.result(34)["holdinvoices"].size() == 0);

		/* Everything so far.  */
		return harness.call(40, "trackallholdinvoices", "{\"since\": 0}");
	}).then([&]() {
		auto r = harness.result(40);
		auto events = r["events"];
		assert(events.size() > 6);
		auto last = 0.0;
		for (auto e : events) {
			assert(double(e["seq"]) > last);
			last = double(e["seq"]);
		}
		next = std::uint64_t(double(r["next"]));
		assert(double(next) == last);

		/* Nothing new.  */
		return harness.call( 41, "trackallholdinvoices"
				   , "{\"since\": " + std::to_string(next) + "}"
				   );
	}).then([&]() {
		auto r = harness.result(41);
		assert(r["events"].size() == 0);
		assert(std::uint64_t(double(r["next"])) == next);

		/* Current state of the given invoices.  */
		return harness.call( 42, "trackallholdinvoices"
				   , "{\"payment_hashes\": [\"" + hash_a + "\"]}"
				   );
	}).then([&]() {
		auto r = harness.result(42);
		assert(r["events"].size() == 1);
		assert(std::string(r["events"][0]["state"]) == "paid");
		assert(std::string(r["events"][0]["payment_hash"]) == hash_a);

		/* Long-poll, woken by a new invoice.  */
		return harness.launch( 43, "trackallholdinvoices"
				     , "{\"since\": " + std::to_string(next)
				       + ", \"timeout\": 30}"
				     );
	}).then([&]() {
		return Ev::yield() + Ev::yield() + Ev::yield();
	}).then([&]() {
		assert(!harness.responded(43));
		return harness.call(44, "injectholdinvoice", "[\"" + ours(c, 700) + "\"]");
	}).then([&]() {
		return harness.wait_for(43);
	}).then([&]() {
		auto r = harness.result(43);
		assert(r["events"].size() == 1);
		assert(std::string(r["events"][0]["state"]) == "unpaid");
		assert(std::string(r["events"][0]["payment_hash"]) == std::string(c.sha256()));
		assert(std::uint64_t(double(r["next"])) == next + 1);

		/* Long-poll that times out.  */
		return harness.call( 45, "trackallholdinvoices"
				   , "{\"since\": " + std::to_string(next + 1)
				     + ", \"timeout\": 1}"
				   );
	}).then([&]() {
		assert(harness.result(45)["events"].size() == 0);

		return harness.call(50, "cleanholdinvoices", "{}");
	}).then([&]() {
		assert(double(harness.result(50)["cleaned"]) == 1);

		/* Let the notifier catch up.  */
		auto act = Ev::lift();
		for (auto i = 0; i < 50; ++i)
			act += Ev::yield();
		return act;
	}).then([&]() {
		/* a: unpaid, accepted, paid.  b: unpaid, accepted,
		 * cancelled.  c: unpaid.  */
		auto updates = std::size_t(0);
		auto logs = std::size_t(0);
		for (auto const& s : harness.couts) {
			auto js = parse(s);
			auto method = std::string(js["method"]);
			if (method == "log") {
				++logs;
				continue;
			}
			assert(method == "holdinvoice_update");
			auto u = js["params"]["holdinvoice_update"];
			assert(u.has("seq"));
			assert(!u.has("htlc"));
			++updates;
		}
		assert(updates == 7);
		assert(logs > 0);

		return bus.raise(Hold::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
