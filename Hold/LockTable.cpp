#include"Hold/LockTable.hpp"
#include"Util/make_unique.hpp"
#include<unordered_map>

namespace Hold {

class LockTable::Impl {
private:
	struct Entry {
		std::unique_ptr<Ev::Semaphore> sem;
		std::size_t users;
	};
	std::unordered_map<Sha256::Hash, Entry> entries;

public:
	Ev::Semaphore& acquire(Sha256::Hash const& h) {
		auto it = entries.find(h);
		if (it == entries.end()) {
			auto& e = entries[h];
			e.sem = Util::make_unique<Ev::Semaphore>(1);
			e.users = 1;
			return *e.sem;
		}
		++it->second.users;
		return *it->second.sem;
	}
	void release(Sha256::Hash const& h) {
		auto it = entries.find(h);
		if (it == entries.end())
			return;
		--it->second.users;
		if (it->second.users == 0)
			entries.erase(it);
	}

	std::size_t size() const {
		return entries.size();
	}
};

LockTable::LockTable() : pimpl(Util::make_unique<Impl>()) { }
LockTable::LockTable(LockTable&&) =default;
LockTable::~LockTable() =default;

Ev::Io<void>
LockTable::core_run(Sha256::Hash const& h, Ev::Io<void> action) {
	auto impl = pimpl.get();
	return Ev::Io<void>([impl, h, action
			    ]( std::function<void()> pass
			     , std::function<void(std::exception_ptr)> fail
			     ) {
		auto& sem = impl->acquire(h);
		sem.run(action).run([impl, h, pass]() {
			impl->release(h);
			pass();
		}, [impl, h, fail](std::exception_ptr e) {
			impl->release(h);
			fail(e);
		});
	});
}

std::size_t LockTable::size() const {
	return pimpl->size();
}

}
