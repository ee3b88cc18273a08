#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Hold/JsonInput.hpp"
#include"Hold/Main.hpp"
#include"Hold/Mod/all.hpp"
#include"Hold/Shutdown.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

/* For backtraces.  */
std::string g_argv0;

namespace Hold {

class Main::Impl {
private:
	std::istream& cin;
	std::ostream& cout;
	std::ostream& cerr;
	std::function< Net::Fd( std::string const&
			      , std::string const&
			      )
		     > open_rpc_socket;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Hold::JsonInput> jsoninput;
	std::shared_ptr<void> modules;

	int exit_code;

	std::string argv0;
	bool is_version;
	bool is_help;

	void usage() {
		cout << "Usage: add --plugin=" << argv0
		     << " to your lightningd command line or configuration file"
		     << std::endl
		     << std::endl
		     << "Options:" << std::endl
		     << " --version, -V      Show version." << std::endl
		     << " --help, -H         Show this help." << std::endl
		     << std::endl
		     << "Plugin options, given to lightningd:" << std::endl
		     << " --hold-database=FILE           default hold.sqlite3" << std::endl
		     << " --hold-mpp-timeout=SECONDS     default 60" << std::endl
		     << " --hold-expiry-deadline=BLOCKS  default 4, 0 disables" << std::endl
		     << " --hold-overpayment-factor=N    default 2" << std::endl
		     << " --hold-track-buffer=N          default 1024" << std::endl
		     << " --hold-min-final-cltv=BLOCKS   default 80" << std::endl
		     << std::endl
		     << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
		     ;
	}

public:
	Impl( std::vector<std::string> argv
	    , std::istream& cin_
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , std::function< Net::Fd( std::string const&
				    , std::string const&
				    )
			   > open_rpc_socket_
	    ) : cin(cin_)
	      , cout(cout_)
	      , cerr(cerr_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , exit_code(0)
	      , is_version(false)
	      , is_help(false)
	      {
		assert(argv.size() >= 1);
		argv0 = argv[0];
		g_argv0 = argv0;
		if (argv.size() >= 2) {
			auto const& argv1 = argv[1];
			if (argv1 == "--version" || argv1 == "-V")
				is_version = true;
			else if (argv1 == "--help" || argv1 == "-H")
				is_help = true;
			else if (argv1 == "--developer")
				/* lightningd passes this to plugins in
				 * developer mode.  */
				;
			else {
				cerr << argv0 << ": Unrecognized option: "
				     << argv1 << std::endl;
				is_help = true;
				exit_code = 1;
			}
		}
	}

	Ev::Io<int> run() {
		if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		} else if (is_help) {
			usage();
			return Ev::lift(exit_code);
		}

		bus = Util::make_unique<S::Bus>();
		threadpool = Util::make_unique<Ev::ThreadPool>();
		jsoninput = Util::make_unique<Hold::JsonInput>(
			*threadpool, cin, *bus
		);
		modules = Hold::Mod::all( cout
					, *bus
					, *threadpool
					, open_rpc_socket
					);

		return Ev::yield().then([this]() {
			return jsoninput->run().catching<std::exception>([this](std::exception const& e) {
				cerr << "Uncaught exception: " << e.what() << std::endl;
				exit_code = 1;
				return Ev::lift();
			});
		}).then([this]() {
			/* stdin closed: wake every waiter.  */
			return bus->raise(Hold::Shutdown());
		}).then([this]() {
			return Ev::lift(exit_code);
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& cin
	  , std::ostream& cout
	  , std::ostream& cerr
	  , std::function< Net::Fd( std::string const&
				  , std::string const&
				  )
			 > open_rpc_socket
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cin
					   , cout
					   , cerr
					   , std::move(open_rpc_socket)
					   ))
	    { }
Main::Main(Main&&) =default;
Main::~Main() =default;

Ev::Io<int> Main::run() {
	assert(pimpl);
	return pimpl->run();
}

}
