#pragma once
///@file

#include "gcrelay/relay/connection.hh"
#include "gcrelay/relay/relay-settings.hh"
#include "gcrelay/util/sync.hh"

#include <atomic>
#include <map>
#include <thread>
#include <vector>

namespace gcrelay::relay {

struct ServerOptions
{
    /**
     * Connections accepted while this many sessions are open are
     * refused with `ERROR(ServerBusy)`.
     */
    size_t maxSessions = 64;

    /**
     * How long open sessions may continue after `stop()` before their
     * connections are shut down.
     */
    std::chrono::milliseconds shutdownTimeout{10000};

    HandlerOptions handler;
};

/**
 * Accepts connections on a set of listening sockets and serves each of
 * them on its own thread.
 */
class RelayServer
{
    RootRegistry & registry;
    const StoreDirConfig store;
    const ServerOptions options;

    std::vector<AutoCloseFD> listeners;

    Pipe shutdownPipe;

    std::atomic<bool> shuttingDown{false};

    std::atomic<SessionId> nextSessionId{1};

    /**
     * The threads serving open connections, keyed by connection
     * descriptor.
     */
    Sync<std::map<Descriptor, std::thread>> connections;

    std::condition_variable connectionClosed;

    void acceptConnection(Descriptor listener);

    void refuse(AutoCloseFD fdClient, std::string_view message);

    void drain();

public:

    RelayServer(
        RootRegistry & registry, StoreDirConfig store, ServerOptions options, std::vector<AutoCloseFD> listeners);

    RelayServer(const RelayServer &) = delete;
    RelayServer & operator=(const RelayServer &) = delete;

    ~RelayServer();

    /**
     * Accept and serve connections until `stop()` is called, then
     * drain the open sessions.
     */
    void run();

    /**
     * Ask `run()` to stop accepting connections and drain. May be
     * called from any thread.
     */
    void stop();

    /**
     * The number of open sessions.
     */
    size_t sessionCount();
};

/**
 * Return the listening sockets passed by the service manager, i.e. the
 * descriptors `3` to `3 + $LISTEN_FDS - 1` if `$LISTEN_PID` is our
 * pid. The variables are removed from the environment.
 */
std::vector<AutoCloseFD> getActivatedSockets();

/**
 * Return the listening sockets selected by `listen-mode`.
 */
std::vector<AutoCloseFD> openListeners(const RelaySettings & settings);

/**
 * Send a state change (e.g. `READY=1`) to the service manager, if
 * `$NOTIFY_SOCKET` is set.
 */
void notifyServiceManager(std::string_view state);

ServerOptions getServerOptions(const RelaySettings & settings);

} // namespace gcrelay::relay
