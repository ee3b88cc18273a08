#ifndef HOLD_STORE_HPP
#define HOLD_STORE_HPP

#include"Hold/Invoice.hpp"
#include<cstdint>
#include<memory>
#include<string>
#include<vector>

namespace Sqlite3 { class Tx; }

/** Hold::Store
 *
 * @brief the persistent tables of hold invoices and
 * their HTLCs.
 *
 * @desc Every function works inside a transaction the
 * caller owns, so that several changes commit as one.
 * Sqlite3 errors propagate as `std::runtime_error`.
 */
namespace Hold { namespace Store {

void create_tables(Sqlite3::Tx& tx);

/* Insert a new invoice, ignoring its `id` and
 * `htlcs`.  Returns the new id.  */
std::uint64_t add_invoice(Sqlite3::Tx& tx, Invoice const& inv);

/* Null if no such invoice.  Includes HTLCs.  */
std::unique_ptr<Invoice>
get_invoice(Sqlite3::Tx& tx, Sha256::Hash const& payment_hash);

/* Write back the state, preimage and timestamps of
 * an invoice.  */
void update_invoice(Sqlite3::Tx& tx, Invoice const& inv);

/* Returns the new row id.  */
std::uint64_t add_htlc( Sqlite3::Tx& tx
		      , std::uint64_t invoice_id
		      , Htlc const& htlc
		      );
void set_htlc_state(Sqlite3::Tx& tx, std::uint64_t id, State s);

struct Filter {
	/* At most one of these.  */
	std::unique_ptr<Sha256::Hash> payment_hash;
	std::unique_ptr<std::string> bolt11;
	/* Smallest id returned.  */
	std::uint64_t index_start;
	/* 0 for no limit.  */
	std::uint64_t limit;

	Filter() : index_start(0), limit(0) { }
};
/* In ascending id order, with HTLCs.  */
std::vector<Invoice> list(Sqlite3::Tx& tx, Filter const& f);

/* Payment hashes of invoices that have an accepted
 * HTLC at or below the given height.  */
std::vector<Sha256::Hash>
expiring(Sqlite3::Tx& tx, std::uint32_t height_limit);

/* Delete cancelled invoices created at or before the
 * given time.  Returns the number deleted.  */
std::uint64_t clean(Sqlite3::Tx& tx, std::uint64_t created_before);

}}

#endif /* !defined(HOLD_STORE_HPP) */
