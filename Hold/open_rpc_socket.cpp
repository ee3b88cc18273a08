#include"Hold/open_rpc_socket.hpp"
#include"Net/Fd.hpp"
#include"Util/BacktraceException.hpp"
#include<errno.h>
#include<stdexcept>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>
#include<sys/un.h>
#include<unistd.h>

namespace {

Util::BacktraceException<std::runtime_error> sys_error(char const* what) {
	return Util::BacktraceException<std::runtime_error>(
		std::string("open_rpc_socket: ") + what + ": " + strerror(errno)
	);
}

}

namespace Hold {

Net::Fd open_rpc_socket( std::string const& lightning_dir
		       , std::string const& rpc_file
		       ) {
	if (chdir(lightning_dir.c_str()) < 0)
		throw sys_error("chdir");

	auto addr = sockaddr_un();
	/* Leave room for the terminator.  */
	if (rpc_file.size() >= sizeof(addr.sun_path)) {
		errno = ENAMETOOLONG;
		throw sys_error("rpc-file");
	}
	addr.sun_family = AF_UNIX;
	strncpy(addr.sun_path, rpc_file.c_str(), sizeof(addr.sun_path) - 1);

	auto fd = Net::Fd(socket(AF_UNIX, SOCK_STREAM, 0));
	if (!fd)
		throw sys_error("socket");

	auto res = int();
	do {
		res = connect( fd.get()
			     , reinterpret_cast<sockaddr const*>(&addr)
			     , sizeof(addr)
			     );
	} while (res < 0 && errno == EINTR);
	if (res < 0)
		throw sys_error("connect");

	return fd;
}

}
