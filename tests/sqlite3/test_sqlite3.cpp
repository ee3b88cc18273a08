#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<cstdint>
#include<vector>

#include<iostream>

int main() {
	auto db = Sqlite3::Db(":memory:");

	auto empty_transaction = [&]() {
		return db.transact().then([&](Sqlite3::Tx tx) {
			tx.commit();
			return Ev::lift();
		});
	};

	auto code = Ev::lift().then([&]() {

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.rollback();
		assert(!tx);

		/* Test concurrency.  */
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::concurrent(empty_transaction());
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {

		/* Test simple interface.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute("CREATE TABLE \"foo\" (c1 INTEGER, c2 TEXT);");
		tx.commit();

		/* Test full query interface.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query("INSERT INTO \"foo\" VALUES(:c1, :c2)")
			.bind(":c1", 42)
			.bind(":c2", "some text")
			.execute()
			;
		for (auto& r : res) {
			(void) r;
			/* Should have empty result!  */
			assert(false);
		}
		tx.commit();

		/* Test full query interface again.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query("SELECT c1, c2 FROM \"foo\"")
			.execute()
			;
		auto flag = false;
		for (auto& r : res) {
			/* Should have single result!  */
			assert(!flag);
			flag = true;
			/* Should be what we inserted.  */
			assert(r.get<int>(0) == 42);
			assert(r.get<std::string>(1) == "some text");
		}
		/* Should have result!  */
		assert(flag);
		tx.commit();

		/* Blobs and NULLs.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute("CREATE TABLE \"bar\" (b BLOB, n BLOB);");
		tx.query("INSERT INTO \"bar\" VALUES(:b, :n)")
			.bind(":b", std::vector<std::uint8_t>{0x00, 0x42, 0xff})
			.bind(":n", nullptr)
			.execute()
			;
		tx.query("INSERT INTO \"bar\" VALUES(:b, NULL)")
			.bind(":b", std::vector<std::uint8_t>())
			.execute()
			;
		auto count = 0;
		auto res = tx.query("SELECT b, n FROM \"bar\" ORDER BY rowid")
			.execute()
			;
		for (auto& r : res) {
			assert(r.is_null(1));
			assert(!r.is_null(0));
			auto b = r.get<std::vector<std::uint8_t>>(0);
			if (count == 0)
				assert((b == std::vector<std::uint8_t>{0x00, 0x42, 0xff}));
			else
				assert(b.empty());
			++count;
		}
		assert(count == 2);
		tx.commit();

		return Ev::lift(0);
	});

	return Ev::start(code);
}
