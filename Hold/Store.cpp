#include"Hold/Store.hpp"
#include"Sqlite3.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>
#include<limits>
#include<map>
#include<stdexcept>

namespace {

auto const invoice_columns = std::string(
	"id, payment_hash, preimage, bolt11, amount_msat, payment_secret"
	", min_cltv, state, created_at, accepted_at, settled_at"
);

Hold::State read_state(std::string const& s) {
	auto rv = Hold::State();
	if (!Hold::from_string(rv, s))
		throw Util::BacktraceException<std::runtime_error>(
			"Hold::Store: unknown state in db: " + s
		);
	return rv;
}

/* Nullable integer columns hold 0 as NULL.  */
template<typename a>
void bind_optional(Sqlite3::Query& q, char const* field, a value) {
	if (value == 0)
		q.bind(field, nullptr);
	else
		q.bind(field, value);
}
void bind_optional(Sqlite3::Query& q, char const* field, Ln::Preimage const& p) {
	if (!p)
		q.bind(field, nullptr);
	else
		q.bind(field, p.bytes());
}

Hold::Invoice read_invoice(Sqlite3::Row& r) {
	auto inv = Hold::Invoice();
	inv.id = r.get<std::uint64_t>(0);
	inv.payment_hash = Sha256::Hash::from_bytes(
		r.get<std::vector<std::uint8_t>>(1)
	);
	if (!r.is_null(2))
		inv.preimage = Ln::Preimage::from_bytes(
			r.get<std::vector<std::uint8_t>>(2)
		);
	inv.bolt11 = r.get<std::string>(3);
	inv.has_amount = !r.is_null(4);
	if (inv.has_amount)
		inv.amount = Ln::Amount::msat(r.get<std::uint64_t>(4));
	if (!r.is_null(5))
		inv.payment_secret = Ln::Preimage::from_bytes(
			r.get<std::vector<std::uint8_t>>(5)
		);
	if (!r.is_null(6))
		inv.min_cltv = r.get<std::uint32_t>(6);
	inv.state = read_state(r.get<std::string>(7));
	inv.created_at = r.get<std::uint64_t>(8);
	if (!r.is_null(9))
		inv.accepted_at = r.get<std::uint64_t>(9);
	if (!r.is_null(10))
		inv.settled_at = r.get<std::uint64_t>(10);
	return inv;
}

/* Fill in the HTLCs of the given invoices, indexed
 * by id.  */
void load_htlcs( Sqlite3::Tx& tx
	       , std::map<std::uint64_t, Hold::Invoice*> const& by_id
	       ) {
	if (by_id.empty())
		return;
	auto q = std::string(
		"SELECT invoice_id, id, scid, htlc_id, msat, cltv_expiry"
		"     , state, created_at"
		"  FROM \"holdinvoice_htlcs\""
		" WHERE invoice_id >= :lo AND invoice_id <= :hi"
		" ORDER BY id;"
	);
	auto res = tx.query(q)
		.bind(":lo", by_id.begin()->first)
		.bind(":hi", by_id.rbegin()->first)
		.execute()
		;
	for (auto& r : res) {
		auto it = by_id.find(r.get<std::uint64_t>(0));
		if (it == by_id.end())
			continue;
		auto h = Hold::Htlc();
		h.id = r.get<std::uint64_t>(1);
		h.scid = Ln::Scid(r.get<std::string>(2));
		h.htlc_id = r.get<std::uint64_t>(3);
		h.msat = Ln::Amount::msat(r.get<std::uint64_t>(4));
		h.cltv_expiry = r.get<std::uint32_t>(5);
		h.state = read_state(r.get<std::string>(6));
		h.created_at = r.get<std::uint64_t>(7);
		it->second->htlcs.push_back(std::move(h));
	}
}

}

namespace Hold { namespace Store {

void create_tables(Sqlite3::Tx& tx) {
	/* AUTOINCREMENT so ids of cleaned invoices are never
	 * handed out again.  */
	tx.query_execute(R"QRY(
	CREATE TABLE IF NOT EXISTS "holdinvoices"
		( id INTEGER PRIMARY KEY AUTOINCREMENT
		, payment_hash BLOB NOT NULL UNIQUE
		, preimage BLOB
		, bolt11 TEXT NOT NULL
		, amount_msat INTEGER
		, payment_secret BLOB
		, min_cltv INTEGER
		, state TEXT NOT NULL
		, created_at INTEGER NOT NULL
		, accepted_at INTEGER
		, settled_at INTEGER
		);
	CREATE INDEX IF NOT EXISTS "holdinvoices_state_idx"
		ON "holdinvoices"(state, created_at);

	CREATE TABLE IF NOT EXISTS "holdinvoice_htlcs"
		( id INTEGER PRIMARY KEY AUTOINCREMENT
		, invoice_id INTEGER NOT NULL
		  REFERENCES "holdinvoices"(id)
		  ON DELETE CASCADE
		, scid TEXT NOT NULL
		, htlc_id INTEGER NOT NULL
		, msat INTEGER NOT NULL
		, cltv_expiry INTEGER NOT NULL
		, state TEXT NOT NULL
		, created_at INTEGER NOT NULL
		, UNIQUE(invoice_id, scid, htlc_id)
		);
	CREATE INDEX IF NOT EXISTS "holdinvoice_htlcs_expiry_idx"
		ON "holdinvoice_htlcs"(state, cltv_expiry);
	)QRY");
}

std::uint64_t add_invoice(Sqlite3::Tx& tx, Invoice const& inv) {
	auto q = tx.query(R"QRY(
	INSERT INTO "holdinvoices"
		( payment_hash, preimage, bolt11, amount_msat
		, payment_secret, min_cltv, state, created_at
		, accepted_at, settled_at
		)
	VALUES
		( :payment_hash, :preimage, :bolt11, :amount_msat
		, :payment_secret, :min_cltv, :state, :created_at
		, :accepted_at, :settled_at
		);
	)QRY");
	q.bind(":payment_hash", inv.payment_hash.bytes());
	bind_optional(q, ":preimage", inv.preimage);
	q.bind(":bolt11", inv.bolt11);
	if (inv.has_amount)
		q.bind(":amount_msat", inv.amount.to_msat());
	else
		q.bind(":amount_msat", nullptr);
	bind_optional(q, ":payment_secret", inv.payment_secret);
	bind_optional(q, ":min_cltv", inv.min_cltv);
	q.bind(":state", to_string(inv.state));
	q.bind(":created_at", inv.created_at);
	bind_optional(q, ":accepted_at", inv.accepted_at);
	bind_optional(q, ":settled_at", inv.settled_at);
	q.execute();

	auto rv = std::uint64_t(0);
	auto res = tx.query("SELECT last_insert_rowid();").execute();
	for (auto& r : res)
		rv = r.get<std::uint64_t>(0);
	return rv;
}

std::unique_ptr<Invoice>
get_invoice(Sqlite3::Tx& tx, Sha256::Hash const& payment_hash) {
	auto rv = std::unique_ptr<Invoice>();
	auto res = tx.query(
		"SELECT " + invoice_columns + " FROM \"holdinvoices\""
		" WHERE payment_hash = :payment_hash;"
	)
		.bind(":payment_hash", payment_hash.bytes())
		.execute()
		;
	for (auto& r : res)
		rv = Util::make_unique<Invoice>(read_invoice(r));
	if (!rv)
		return rv;

	auto by_id = std::map<std::uint64_t, Invoice*>();
	by_id[rv->id] = rv.get();
	load_htlcs(tx, by_id);
	return rv;
}

void update_invoice(Sqlite3::Tx& tx, Invoice const& inv) {
	auto q = tx.query(R"QRY(
	UPDATE "holdinvoices"
	   SET preimage = :preimage
	     , state = :state
	     , accepted_at = :accepted_at
	     , settled_at = :settled_at
	 WHERE id = :id;
	)QRY");
	bind_optional(q, ":preimage", inv.preimage);
	q.bind(":state", to_string(inv.state));
	bind_optional(q, ":accepted_at", inv.accepted_at);
	bind_optional(q, ":settled_at", inv.settled_at);
	q.bind(":id", inv.id);
	q.execute();
}

std::uint64_t add_htlc( Sqlite3::Tx& tx
		      , std::uint64_t invoice_id
		      , Htlc const& htlc
		      ) {
	tx.query(R"QRY(
	INSERT INTO "holdinvoice_htlcs"
		( invoice_id, scid, htlc_id, msat, cltv_expiry
		, state, created_at
		)
	VALUES
		( :invoice_id, :scid, :htlc_id, :msat, :cltv_expiry
		, :state, :created_at
		);
	)QRY")
		.bind(":invoice_id", invoice_id)
		.bind(":scid", std::string(htlc.scid))
		.bind(":htlc_id", htlc.htlc_id)
		.bind(":msat", htlc.msat.to_msat())
		.bind(":cltv_expiry", htlc.cltv_expiry)
		.bind(":state", to_string(htlc.state))
		.bind(":created_at", htlc.created_at)
		.execute()
		;
	auto rv = std::uint64_t(0);
	auto res = tx.query("SELECT last_insert_rowid();").execute();
	for (auto& r : res)
		rv = r.get<std::uint64_t>(0);
	return rv;
}

void set_htlc_state(Sqlite3::Tx& tx, std::uint64_t id, State s) {
	tx.query(R"QRY(
	UPDATE "holdinvoice_htlcs"
	   SET state = :state
	 WHERE id = :id;
	)QRY")
		.bind(":state", to_string(s))
		.bind(":id", id)
		.execute()
		;
}

std::vector<Invoice> list(Sqlite3::Tx& tx, Filter const& f) {
	auto sql = "SELECT " + invoice_columns + " FROM \"holdinvoices\""
		   " WHERE id >= :index_start";
	if (f.payment_hash)
		sql += " AND payment_hash = :payment_hash";
	if (f.bolt11)
		sql += " AND bolt11 = :bolt11";
	sql += " ORDER BY id";
	if (f.limit != 0)
		sql += " LIMIT :limit";
	sql += ";";

	/* SQLite integers are signed, so anything larger would
	 * wrap to a negative bound.  */
	auto const max_id = std::uint64_t(std::numeric_limits<std::int64_t>::max());
	auto q = tx.query(sql);
	q.bind(":index_start", std::min(f.index_start, max_id));
	if (f.payment_hash)
		q.bind(":payment_hash", f.payment_hash->bytes());
	if (f.bolt11)
		q.bind(":bolt11", *f.bolt11);
	if (f.limit != 0)
		q.bind(":limit", std::min(f.limit, max_id));

	auto rv = std::vector<Invoice>();
	auto res = q.execute();
	for (auto& r : res)
		rv.push_back(read_invoice(r));

	auto by_id = std::map<std::uint64_t, Invoice*>();
	for (auto& inv : rv)
		by_id[inv.id] = &inv;
	load_htlcs(tx, by_id);

	return rv;
}

std::vector<Sha256::Hash>
expiring(Sqlite3::Tx& tx, std::uint32_t height_limit) {
	auto res = tx.query(R"QRY(
	SELECT DISTINCT i.payment_hash
	  FROM "holdinvoice_htlcs" h
	  JOIN "holdinvoices" i ON i.id = h.invoice_id
	 WHERE h.state = 'accepted'
	   AND h.cltv_expiry <= :height_limit
	 ORDER BY i.id;
	)QRY")
		.bind(":height_limit", height_limit)
		.execute()
		;
	auto rv = std::vector<Sha256::Hash>();
	for (auto& r : res)
		rv.push_back(Sha256::Hash::from_bytes(
			r.get<std::vector<std::uint8_t>>(0)
		));
	return rv;
}

std::uint64_t clean(Sqlite3::Tx& tx, std::uint64_t created_before) {
	tx.query(R"QRY(
	DELETE FROM "holdinvoices"
	 WHERE state = 'cancelled'
	   AND created_at <= :created_before;
	)QRY")
		.bind(":created_before", created_before)
		.execute()
		;
	auto rv = std::uint64_t(0);
	auto res = tx.query("SELECT changes();").execute();
	for (auto& r : res)
		rv = r.get<std::uint64_t>(0);
	return rv;
}

}}
