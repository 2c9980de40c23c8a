#include "gcrelay/relay/listener.hh"
#include "gcrelay/util/environment-variables.hh"
#include "gcrelay/util/finally.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"
#include "gcrelay/util/util.hh"
#include "gcrelay/util/vsock.hh"

#include <cstddef>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace gcrelay::relay {

RelayServer::RelayServer(
    RootRegistry & registry, StoreDirConfig store, ServerOptions options, std::vector<AutoCloseFD> listeners)
    : registry(registry)
    , store(std::move(store))
    , options(std::move(options))
    , listeners(std::move(listeners))
{
    shutdownPipe.create();

    for (auto & fd : this->listeners)
        if (fcntl(fd.get(), F_SETFL, fcntl(fd.get(), F_GETFL) | O_NONBLOCK) == -1)
            throw SysError("making listening socket non-blocking");
}

RelayServer::~RelayServer()
{
    try {
        drain();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

static std::string describePeer(Descriptor fd)
{
    try {
        if (auto cid = getVsockPeerCid(fd))
            return fmt("cid %d", *cid);
    } catch (SysError & e) {
        debug("cannot get the peer address of a connection: %s", e.message());
    }
    return "";
}

void RelayServer::refuse(AutoCloseFD fdClient, std::string_view message)
{
    try {
        writeFull(fdClient.get(), encodeFrame(makeErrorFrame(ErrorKind::ServerBusy, message)), false);
    } catch (SysError & e) {
        debug("cannot send ServerBusy to a refused connection: %s", e.message());
    }
}

void RelayServer::acceptConnection(Descriptor listener)
{
    AutoCloseFD fdClient = accept4(listener, nullptr, nullptr, SOCK_CLOEXEC);
    if (!fdClient) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED)
            return;
        throw SysError("accepting a connection");
    }

    /* Accepted sockets may inherit the non-blocking flag from the
       listening socket. */
    if (fcntl(fdClient.get(), F_SETFL, fcntl(fdClient.get(), F_GETFL) & ~O_NONBLOCK) == -1)
        throw SysError("making connection blocking");

    auto conns(connections.lock());

    if (conns->size() >= options.maxSessions) {
        warn("refusing a connection: %d sessions are already open", conns->size());
        refuse(std::move(fdClient), fmt("the relay already serves %d sessions", conns->size()));
        return;
    }

    auto session = std::make_shared<ClientSession>(nextSessionId++, describePeer(fdClient.get()));
    printInfo("accepted %s", session->describe());

    /* Process the connection in a separate thread. The thread cannot
       remove itself from `connections` before we have inserted it,
       since we hold the lock. */
    auto fdClient_ = fdClient.get();
    std::thread clientThread;
    try {
        clientThread = std::thread([this, session, fdClient = std::move(fdClient)]() {
            Finally cleanup([&]() {
                /* Once the lock is released, `drain()` may return and
                   the server may be destroyed. */
                auto conns(connections.lock());
                auto i = conns->find(fdClient.get());
                if (i != conns->end()) {
                    i->second.detach();
                    conns->erase(i);
                }
                connectionClosed.notify_all();
            });

            try {
                auto reason =
                    processConnection(registry, store, options.handler, *session, fdClient.get(), shuttingDown);
                printInfo("%s ended: %s", session->describe(), showTeardownReason(reason));
            } catch (Error & e) {
                logError(e.info());
            } catch (Interrupted &) {
                debug("%s interrupted", session->describe());
            }
        });
    } catch (std::system_error & e) {
        /* The connection was closed along with the thread's closure. */
        warn("dropping %s: cannot start a thread: %s", session->describe(), e.what());
        return;
    }

    conns->insert({fdClient_, std::move(clientThread)});
}

/**
 * How long to back off after a failed accept.
 */
constexpr std::chrono::milliseconds acceptRetryDelay{100};

void RelayServer::run()
{
    Finally cleanup([&]() { drain(); });

    notifyServiceManager("READY=1\nSTATUS=Accepting connections");

    while (true) {
        std::vector<struct pollfd> fds;
        fds.push_back({.fd = shutdownPipe.readSide.get(), .events = POLLIN});
        for (auto & fd : listeners)
            fds.push_back({.fd = fd.get(), .events = POLLIN});

        if (poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("waiting for connections");
        }

        if (fds[0].revents)
            /* Asked to quit. */
            break;

        for (size_t n = 1; n < fds.size(); ++n) {
            if (!fds[n].revents)
                continue;
            try {
                acceptConnection(fds[n].fd);
            } catch (Error & error) {
                auto ei = error.info();
                ei.msg = HintFmt("while accepting a connection: %1%", ei.msg.str());
                logError(ei);
                /* A pending connection that cannot be accepted (e.g. out
                   of descriptors) keeps the listener readable. */
                std::this_thread::sleep_for(acceptRetryDelay);
            }
        }
    }
}

void RelayServer::stop()
{
    writeFull(shutdownPipe.writeSide.get(), "x", false);
}

void RelayServer::drain()
{
    if (listeners.empty() && connections.lock()->empty())
        return;

    notifyServiceManager("STOPPING=1\nSTATUS=Draining sessions");

    /* Stop accepting connections. */
    listeners.clear();

    {
        auto conns(connections.lock());
        if (!conns->empty()) {
            printInfo("waiting for %d sessions to finish", conns->size());
            conns.wait_for(connectionClosed, options.shutdownTimeout, [&]() { return conns->empty(); });
        }
    }

    shuttingDown = true;

    while (true) {
        auto item = remove_begin(*connections.lock());
        if (!item)
            break;
        auto & [fd, thread] = *item;
        debug("shutting down connection %d", fd);
        shutdown(fd, SHUT_RDWR);
        thread.join();
    }
}

size_t RelayServer::sessionCount()
{
    return connections.lock()->size();
}

/**
 * The first descriptor passed by the service manager.
 */
constexpr Descriptor listenFdsStart = 3;

std::vector<AutoCloseFD> getActivatedSockets()
{
    std::vector<AutoCloseFD> fds;

    auto listenPid = getEnv("LISTEN_PID");
    auto listenFds = getEnv("LISTEN_FDS");
    if (!listenPid || !listenFds)
        return fds;

    unsetenv("LISTEN_PID");
    unsetenv("LISTEN_FDS");
    unsetenv("LISTEN_FDNAMES");

    if (string2Int<pid_t>(*listenPid) != getpid())
        throw Error("socket activation variables are meant for process %s, not for us", *listenPid);

    auto count = string2Int<unsigned int>(*listenFds);
    if (!count)
        throw Error("unexpected value '%s' of LISTEN_FDS", *listenFds);

    for (unsigned int n = 0; n < *count; ++n) {
        Descriptor fd = listenFdsStart + n;
        unix::closeOnExec(fd);
        fds.emplace_back(fd);
    }

    return fds;
}

std::vector<AutoCloseFD> openListeners(const RelaySettings & settings)
{
    auto mode = settings.listenMode.get();
    if (mode == ListenMode::Auto)
        mode = getEnv("LISTEN_FDS") ? ListenMode::Activated : ListenMode::Bound;

    std::vector<AutoCloseFD> fds;

    if (mode == ListenMode::Activated) {
        fds = getActivatedSockets();
        if (fds.empty())
            throw Error("'listen-mode' is 'activated', but the service manager did not pass any sockets");
        printInfo("using %d sockets passed by the service manager", fds.size());
    } else {
        fds.push_back(createVsockListener(settings.listenCid, settings.listenPort));
        printInfo("listening on vsock port %d", settings.listenPort.get());
    }

    return fds;
}

void notifyServiceManager(std::string_view state)
{
    auto notifySocket = getEnvNonEmpty("NOTIFY_SOCKET");
    if (!notifySocket)
        return;

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;

    if (notifySocket->size() >= sizeof(addr.sun_path)) {
        warn("ignoring NOTIFY_SOCKET '%s': path is too long", *notifySocket);
        return;
    }
    memcpy(addr.sun_path, notifySocket->data(), notifySocket->size());
    /* A leading '@' denotes an abstract socket. */
    if (addr.sun_path[0] == '@')
        addr.sun_path[0] = 0;

    AutoCloseFD fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (!fd)
        throw SysError("creating notification socket");

    auto len = offsetof(struct sockaddr_un, sun_path) + notifySocket->size();
    if (sendto(fd.get(), state.data(), state.size(), MSG_NOSIGNAL, (struct sockaddr *) &addr, len) == -1)
        warn("cannot notify the service manager: %s", strerror(errno));
}

ServerOptions getServerOptions(const RelaySettings & settings)
{
    return {
        .maxSessions = settings.maxSessions,
        .shutdownTimeout = std::chrono::seconds(settings.shutdownTimeout.get()),
        .handler =
            {
                .maxFrameSize = settings.maxFrameSize,
                .idleTimeout = settings.getIdleTimeout(),
                .strictUnregister = settings.strictUnregister,
            },
    };
}

} // namespace gcrelay::relay
