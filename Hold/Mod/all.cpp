#include"Hold/Mod/BlockTracker.hpp"
#include"Hold/Mod/CommandReceiver.hpp"
#include"Hold/Mod/HtlcGate.hpp"
#include"Hold/Mod/Initiator.hpp"
#include"Hold/Mod/InvoiceCommand.hpp"
#include"Hold/Mod/InvoiceEngine.hpp"
#include"Hold/Mod/JsonOutputter.hpp"
#include"Hold/Mod/ListCommand.hpp"
#include"Hold/Mod/Manifester.hpp"
#include"Hold/Mod/MppTimeout.hpp"
#include"Hold/Mod/PolicyHandler.hpp"
#include"Hold/Mod/ResolveCommand.hpp"
#include"Hold/Mod/TrackCommand.hpp"
#include"Hold/Mod/UpdateNotifier.hpp"
#include"Hold/Mod/Waiter.hpp"
#include"Hold/Mod/all.hpp"
#include"Net/Fd.hpp"
#include<vector>

namespace {

class All {
private:
	std::vector<std::shared_ptr<void>> modules;

public:
	template<typename M, typename... As>
	std::shared_ptr<M> install(As&&... as) {
		auto ptr = std::make_shared<M>(std::forward<As>(as)...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return ptr;
	}
};

}

namespace Hold { namespace Mod {

std::shared_ptr<void> all( std::ostream& cout
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , std::function< Net::Fd( std::string const&
						 , std::string const&
						 )
					> open_rpc_socket
			 ) {
	auto all = std::make_shared<All>();

	/* Plumbing.  */
	auto waiter = all->install<Waiter>(bus);
	all->install<JsonOutputter>(cout, bus);
	all->install<CommandReceiver>(bus);

	/* Startup.  */
	all->install<Manifester>(bus);
	all->install<Initiator>(bus, threadpool, std::move(open_rpc_socket));
	all->install<PolicyHandler>(bus);
	all->install<BlockTracker>(bus);

	/* The engine and what drives it.  */
	all->install<InvoiceEngine>(bus);
	all->install<HtlcGate>(bus);
	all->install<MppTimeout>(bus, *waiter);

	/* Commands.  */
	all->install<InvoiceCommand>(bus);
	all->install<ResolveCommand>(bus);
	all->install<ListCommand>(bus);
	all->install<TrackCommand>(bus, *waiter);

	/* Outgoing notifications.  */
	all->install<UpdateNotifier>(bus);

	return all;
}

}}
