#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Hold/LockTable.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>
#include<vector>

int main() {
	auto locks = Hold::LockTable();
	auto h1 = Sha256::Hash(std::string(64, '1'));
	auto h2 = Sha256::Hash(std::string(64, '2'));

	auto trace = std::vector<std::string>();

	/* Holds the lock over a few turns of the loop.  */
	auto task = [&](Sha256::Hash const& h, std::string name) {
		return locks.run(h, Ev::lift().then([&trace, name]() {
			trace.push_back(name + "+");
			return Ev::yield() + Ev::yield() + Ev::yield();
		}).then([&trace, name]() {
			trace.push_back(name + "-");
			return Ev::lift();
		}));
	};

	auto code = Ev::lift().then([&]() {
		assert(locks.size() == 0);
		return Ev::concurrent(task(h1, "a"))
		     + Ev::concurrent(task(h1, "b"))
		     + Ev::concurrent(task(h2, "c"))
		     ;
	}).then([&]() {
		/* Let them all run.  */
		auto act = Ev::lift();
		for (auto i = 0; i < 20; ++i)
			act += Ev::yield();
		return act;
	}).then([&]() {
		assert(trace.size() == 6);
		auto pos = [&](std::string const& s) {
			for (auto i = std::size_t(0); i < trace.size(); ++i)
				if (trace[i] == s)
					return i;
			assert(false);
			return trace.size();
		};
		/* Same hash: one after the other, in order.  */
		assert(pos("a-") < pos("b+"));
		/* Different hash: overlaps.  */
		assert(pos("c+") < pos("a-"));
		/* Entries go away once unused.  */
		assert(locks.size() == 0);

		/* Results and exceptions pass through.  */
		return locks.run(h1, Ev::lift(42));
	}).then([&](int x) {
		assert(x == 42);
		return locks.run(h1, Ev::lift().then([]() {
			throw std::runtime_error("oops");
			return Ev::lift(1);
		})).catching<std::runtime_error>([](std::runtime_error const&) {
			return Ev::lift(2);
		});
	}).then([&](int x) {
		assert(x == 2);
		assert(locks.size() == 0);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
