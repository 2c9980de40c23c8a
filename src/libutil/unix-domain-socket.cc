#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/unix-domain-socket.hh"
#include "gcrelay/util/util.hh"

#include <cstring>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace gcrelay {

AutoCloseFD createUnixDomainSocket()
{
    AutoCloseFD fdSocket = socket(PF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (!fdSocket)
        throw SysError("cannot create Unix domain socket");
    return fdSocket;
}

AutoCloseFD createUnixDomainSocket(const std::filesystem::path & path, mode_t mode)
{
    auto fdSocket = createUnixDomainSocket();

    bind(fdSocket.get(), path);

    if (chmod(path.c_str(), mode) == -1)
        throw SysError("changing permissions on %1%", path);

    if (listen(fdSocket.get(), 100) == -1)
        throw SysError("cannot listen on socket %1%", path);

    return fdSocket;
}

static void
bindConnectHelper(std::string_view operationName, auto && operation, int fd, const std::filesystem::path & path)
{
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    auto * psaddr = reinterpret_cast<struct sockaddr *>(&addr);

    auto s = path.string();
    if (s.size() + 1 >= sizeof(addr.sun_path))
        throw Error("socket path %s is too long", path);
    memcpy(addr.sun_path, s.c_str(), s.size() + 1);
    if (operation(fd, psaddr, sizeof(addr)) == -1)
        throw SysError("cannot %s to socket at %s", operationName, path);
}

void bind(int fd, const std::filesystem::path & path)
{
    unlink(path.c_str());

    bindConnectHelper("bind", ::bind, fd, path);
}

void connect(int fd, const std::filesystem::path & path)
{
    bindConnectHelper("connect", ::connect, fd, path);
}

AutoCloseFD connect(const std::filesystem::path & path)
{
    auto fd = createUnixDomainSocket();
    connect(fd.get(), path);
    return fd;
}

} // namespace gcrelay
