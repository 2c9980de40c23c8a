#pragma once
///@file

#include "gcrelay/relay/relay-protocol.hh"
#include "gcrelay/relay/relay-settings.hh"
#include "gcrelay/store/store-dir-config.hh"
#include "gcrelay/util/file-descriptor.hh"
#include "gcrelay/util/sync.hh"

#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace gcrelay::relay {

/**
 * Opens a new connection to the relay.
 */
typedef std::function<AutoCloseFD()> Connector;

Connector vsockConnector(uint32_t cid, uint32_t port, std::chrono::milliseconds timeout);

struct ClientOptions
{
    /**
     * Sent in a `HELLO` frame after connecting, if set.
     */
    std::optional<std::string> clientId;

    std::chrono::milliseconds pingInterval{30000};

    /**
     * How long to wait for the reply to a request before giving up on
     * the connection.
     */
    std::chrono::milliseconds replyTimeout{10000};

    std::chrono::milliseconds retryMinDelay{1000};

    std::chrono::milliseconds retryMaxDelay{60000};

    size_t maxFrameSize = 4096;
};

ClientOptions getClientOptions(const ClientSettings & settings);

/**
 * The guest side of the relay protocol. The client remembers the set
 * of paths it has been asked to protect, so that after a lost
 * connection it can reconnect and register them again.
 *
 * Requests are sent one at a time; each waits up to `replyTimeout` for
 * the relay's reply. Failures of the connection, including a relay
 * that stops answering, never propagate to the caller: they are
 * logged, and the background thread started by `start()` reconnects
 * with exponential backoff.
 */
class RelayClient
{
public:

    using Clock = std::chrono::steady_clock;

private:

    const StoreDirConfig store;
    Connector connector;
    const ClientOptions options;

    struct State
    {
        AutoCloseFD fd;
        std::unique_ptr<FdSource> from;
        bool connected = false;

        StorePathSet desired;

        std::chrono::milliseconds retryDelay{0};
        Clock::time_point nextAttempt;
        Clock::time_point lastActivity;

        bool quit = false;
    };

    Sync<State> state_;

    std::condition_variable wakeup;

    std::thread keeperThread;

    bool connectLocked(State & state);

    void disconnectLocked(State & state, std::string_view reason);

    /**
     * Send `request` and wait for the reply, which must be of type
     * `expected` or `ERROR`. Returns `std::nullopt` if not connected or
     * if the connection failed.
     */
    std::optional<Frame> exchange(State & state, const Frame & request, FrameType expected);

    void keeper();

    void stopKeeper();

public:

    RelayClient(StoreDirConfig store, Connector connector, ClientOptions options);

    RelayClient(const RelayClient &) = delete;
    RelayClient & operator=(const RelayClient &) = delete;

    ~RelayClient();

    /**
     * Connect to the relay, send `HELLO` if a client identifier is
     * configured, and register the paths protected so far.
     *
     * @return whether the connection succeeded.
     */
    bool connect();

    bool isConnected();

    /**
     * Ask the relay to keep `path` alive.
     *
     * @throws RelayError if the relay refuses the request. The path is
     * then no longer considered protected.
     */
    void protect(const StorePath & path);

    /**
     * Ask the relay to stop keeping `path` alive.
     *
     * @throws RelayError if the relay refuses the request.
     */
    void unprotect(const StorePath & path);

    /**
     * Protect exactly `paths`: register the paths that are new and
     * unregister the ones that are gone. Refused requests are logged.
     */
    void update(const StorePathSet & paths);

    /**
     * Send a `PING`.
     *
     * @return whether the relay answered.
     */
    bool ping();

    StorePathSet protectedPaths();

    /**
     * Start the thread that keeps the connection alive and reconnects
     * after failures.
     */
    void start();

    /**
     * Stop the background thread and send `CLOSE`, which makes the
     * relay release every path of this client.
     */
    void close();
};

} // namespace gcrelay::relay
