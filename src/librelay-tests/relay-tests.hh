#pragma once
///@file

#include <gtest/gtest.h>

#include "gcrelay/relay/connection.hh"
#include "gcrelay/relay/listener.hh"
#include "gcrelay/store/tests/libstore.hh"

#include <future>

namespace gcrelay::relay {

/**
 * Poll `cond` until it holds or `timeout` expires.
 */
template<typename F>
bool waitFor(F cond, std::chrono::milliseconds timeout = std::chrono::seconds(10))
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!cond()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

/**
 * A connected pair of Unix domain stream sockets.
 */
std::pair<AutoCloseFD, AutoCloseFD> makeSocketPair();

class RelayTest : public LibStoreTest
{
protected:
    std::filesystem::path rootsDir = tmpDir.path() / "roots";

    RootMaterializer materializer{store, rootsDir};

    std::string printed(const StorePath & path) const
    {
        return store.printStorePath(path);
    }
};

/**
 * The client end of a socket pair whose other end is served by
 * `processConnection()` on a separate thread.
 */
class TestConnection
{
    AutoCloseFD fd;
    FdSource from;
    std::future<TeardownReason> result;

public:

    ClientSession session;

    TestConnection(
        RootRegistry & registry,
        const StoreDirConfig & store,
        const HandlerOptions & options,
        SessionId id,
        const std::atomic<bool> & shuttingDown);

    TestConnection(const TestConnection &) = delete;

    ~TestConnection();

    void sendRaw(std::string_view data);

    void send(const Frame & frame);

    Frame receive();

    /**
     * Send a frame and return the reply.
     */
    Frame request(FrameType type, std::string payload = "");

    /**
     * Return the error kind of an `ERROR` reply, or `std::nullopt` for
     * any other reply.
     */
    std::optional<ErrorKind> requestError(FrameType type, std::string payload = "");

    /**
     * Close our end of the connection and wait for the handler to
     * finish.
     */
    TeardownReason disconnect();

    /**
     * Wait for the handler to finish without closing our end.
     */
    TeardownReason wait();
};

/**
 * A `RelayServer` listening on a Unix domain socket, running on a
 * separate thread.
 */
class TestServer
{
    RelayServer server;
    std::thread thread;

public:

    const std::filesystem::path socketPath;

    TestServer(
        RootRegistry & registry,
        const StoreDirConfig & store,
        ServerOptions options,
        const std::filesystem::path & socketPath);

    TestServer(const TestServer &) = delete;

    ~TestServer();

    RelayServer * operator->()
    {
        return &server;
    }

    /**
     * Stop the server and wait for it to drain.
     */
    void stop();
};

} // namespace gcrelay::relay
