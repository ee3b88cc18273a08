#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Hold/Store.hpp"
#include"Sqlite3.hpp"
#include<assert.h>

namespace {

Hold::Invoice make(char c, std::uint64_t created_at) {
	auto inv = Hold::Invoice();
	inv.payment_hash = Sha256::Hash(std::string(64, c));
	inv.bolt11 = std::string("lnbcrt1") + c;
	inv.created_at = created_at;
	return inv;
}

Hold::Htlc htlc(std::uint64_t htlc_id, std::uint32_t cltv_expiry) {
	auto h = Hold::Htlc();
	h.scid = Ln::Scid("700000x1x2");
	h.htlc_id = htlc_id;
	h.msat = Ln::Amount::msat(5000);
	h.cltv_expiry = cltv_expiry;
	h.created_at = 1000;
	return h;
}

}

int main() {
	auto db = Sqlite3::Db(":memory:");

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		Hold::Store::create_tables(tx);
		/* Twice is fine.  */
		Hold::Store::create_tables(tx);

		/* Optional fields left unset.  */
		auto a = make('a', 100);
		assert(Hold::Store::add_invoice(tx, a) == 1);

		auto b = make('b', 200);
		b.has_amount = true;
		b.amount = Ln::Amount::msat(12345);
		b.payment_secret = Ln::Preimage(std::string(64, '5'));
		b.min_cltv = 40;
		assert(Hold::Store::add_invoice(tx, b) == 2);
		assert(Hold::Store::add_htlc(tx, 2, htlc(7, 300)) == 1);
		assert(Hold::Store::add_htlc(tx, 2, htlc(8, 310)) == 2);

		auto c = make('c', 300);
		c.state = Hold::State_Cancelled;
		assert(Hold::Store::add_invoice(tx, c) == 3);
		assert(Hold::Store::add_htlc(tx, 3, htlc(9, 250)) == 3);
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto a = Hold::Store::get_invoice(tx, Sha256::Hash(std::string(64, 'a')));
		assert(a);
		assert(a->id == 1);
		assert(a->bolt11 == "lnbcrt1a");
		assert(!a->has_amount);
		assert(!a->preimage);
		assert(!a->payment_secret);
		assert(a->min_cltv == 0);
		assert(a->state == Hold::State_Unpaid);
		assert(a->created_at == 100);
		assert(a->accepted_at == 0);
		assert(a->htlcs.empty());

		auto b = Hold::Store::get_invoice(tx, Sha256::Hash(std::string(64, 'b')));
		assert(b->has_amount);
		assert(b->amount == Ln::Amount::msat(12345));
		assert(b->payment_secret == Ln::Preimage(std::string(64, '5')));
		assert(b->min_cltv == 40);
		assert(b->htlcs.size() == 2);
		assert(b->htlcs[0].htlc_id == 7);
		assert(b->htlcs[0].scid == Ln::Scid("700000x1x2"));
		assert(b->htlcs[1].cltv_expiry == 310);
		assert(b->htlcs[1].state == Hold::State_Accepted);

		assert(!Hold::Store::get_invoice(tx, Sha256::Hash(std::string(64, 'd'))));

		/* Only accepted HTLCs expire.  */
		auto exp = Hold::Store::expiring(tx, 305);
		assert(exp.size() == 1);
		assert(exp[0] == b->payment_hash);
		assert(Hold::Store::expiring(tx, 299).empty());

		/* Write back.  */
		b->state = Hold::State_Paid;
		b->preimage = Ln::Preimage(std::string(64, '6'));
		b->accepted_at = 210;
		b->settled_at = 220;
		Hold::Store::update_invoice(tx, *b);
		Hold::Store::set_htlc_state(tx, b->htlcs[0].id, Hold::State_Paid);
		Hold::Store::set_htlc_state(tx, b->htlcs[1].id, Hold::State_Paid);
		tx.commit();

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto b = Hold::Store::get_invoice(tx, Sha256::Hash(std::string(64, 'b')));
		assert(b->state == Hold::State_Paid);
		assert(b->preimage == Ln::Preimage(std::string(64, '6')));
		assert(b->accepted_at == 210);
		assert(b->settled_at == 220);
		assert(b->sum(Hold::State_Paid) == Ln::Amount::msat(10000));
		assert(Hold::Store::expiring(tx, 1000).empty());

		/* Listing.  */
		auto all = Hold::Store::list(tx, Hold::Store::Filter());
		assert(all.size() == 3);
		assert(all[1].htlcs.size() == 2);
		assert(all[2].htlcs.size() == 1);

		auto f = Hold::Store::Filter();
		f.index_start = 2;
		f.limit = 1;
		auto page = Hold::Store::list(tx, f);
		assert(page.size() == 1);
		assert(page[0].id == 2);
		assert(page[0].htlcs.size() == 2);

		/* Past any possible id.  */
		f.index_start = std::uint64_t(-1);
		f.limit = 0;
		assert(Hold::Store::list(tx, f).empty());
		f.index_start = std::uint64_t(1) << 63;
		assert(Hold::Store::list(tx, f).empty());
		f.index_start = 1;
		f.limit = std::uint64_t(-1);
		assert(Hold::Store::list(tx, f).size() == 3);

		auto g = Hold::Store::Filter();
		g.bolt11.reset(new std::string("lnbcrt1c"));
		auto one = Hold::Store::list(tx, g);
		assert(one.size() == 1);
		assert(one[0].id == 3);

		/* Clean removes old cancelled invoices with their
		 * HTLCs.  */
		assert(Hold::Store::clean(tx, 299) == 0);
		assert(Hold::Store::clean(tx, 300) == 1);
		auto n = std::uint64_t(0);
		auto res = tx.query("SELECT COUNT(*) FROM \"holdinvoice_htlcs\";")
			.execute();
		for (auto& r : res)
			n = r.get<std::uint64_t>(0);
		assert(n == 2);

		/* Ids are not reused.  */
		assert(Hold::Store::add_invoice(tx, make('d', 400)) == 4);
		tx.commit();

		return Ev::lift(0);
	});

	return Ev::start(code);
}
