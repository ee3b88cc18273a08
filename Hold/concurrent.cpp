#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Hold/Shutdown.hpp"
#include"Hold/concurrent.hpp"

namespace Hold {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::concurrent(io.catching<Hold::Shutdown>([](Hold::Shutdown const&) {
		return Ev::lift();
	}));
}

}
