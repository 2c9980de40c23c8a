#include "gcrelay/util/vsock.hh"
#include "gcrelay/util/error.hh"

#include <cstring>

#include <sys/socket.h>
#include <sys/time.h>
#include <linux/vm_sockets.h>

namespace gcrelay {

static struct sockaddr_vm makeAddress(uint32_t cid, uint32_t port)
{
    struct sockaddr_vm addr;
    memset(&addr, 0, sizeof(addr));
    addr.svm_family = AF_VSOCK;
    addr.svm_cid = cid;
    addr.svm_port = port;
    return addr;
}

AutoCloseFD createVsockSocket()
{
    AutoCloseFD fdSocket = socket(AF_VSOCK, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (!fdSocket)
        throw SysError("cannot create vsock socket");
    return fdSocket;
}

AutoCloseFD createVsockListener(uint32_t cid, uint32_t port, int backlog)
{
    auto fdSocket = createVsockSocket();

    auto addr = makeAddress(cid, port);
    if (::bind(fdSocket.get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == -1)
        throw SysError("cannot bind to vsock address %d:%d", cid, port);

    if (listen(fdSocket.get(), backlog) == -1)
        throw SysError("cannot listen on vsock address %d:%d", cid, port);

    return fdSocket;
}

AutoCloseFD connectVsock(uint32_t cid, uint32_t port, std::optional<std::chrono::milliseconds> timeout)
{
    auto fdSocket = createVsockSocket();

    if (timeout) {
        struct timeval tv;
        tv.tv_sec = timeout->count() / 1000;
        tv.tv_usec = (timeout->count() % 1000) * 1000;
        if (setsockopt(fdSocket.get(), AF_VSOCK, SO_VM_SOCKETS_CONNECT_TIMEOUT, &tv, sizeof(tv)) == -1)
            throw SysError("setting the vsock connect timeout");
    }

    auto addr = makeAddress(cid, port);
    if (::connect(fdSocket.get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == -1)
        throw SysError("cannot connect to vsock address %d:%d", cid, port);

    return fdSocket;
}

std::optional<uint32_t> getVsockPeerCid(Descriptor fd)
{
    struct sockaddr_vm addr;
    socklen_t len = sizeof(addr);
    memset(&addr, 0, sizeof(addr));
    if (getpeername(fd, reinterpret_cast<struct sockaddr *>(&addr), &len) == -1)
        throw SysError("getting peer address of socket");
    if (addr.svm_family != AF_VSOCK)
        return std::nullopt;
    return addr.svm_cid;
}

} // namespace gcrelay
