#include <gtest/gtest.h>

#include "relay-tests.hh"

#include "gcrelay/util/environment-variables.hh"
#include "gcrelay/util/finally.hh"
#include "gcrelay/util/signals.hh"
#include "gcrelay/util/unix-domain-socket.hh"

#include <cstdlib>

#include <sys/socket.h>
#include <unistd.h>

namespace gcrelay::relay {

class ListenerTest : public RelayTest
{
protected:
    std::filesystem::path socketPath = tmpDir.path() / "relay.sock";

    RootRegistry registry{materializer, {}};

    ServerOptions options{
        .maxSessions = 2,
        .shutdownTimeout = std::chrono::milliseconds(100),
    };

    /**
     * Connect to the server and wait for a reply to a PING, so that
     * the connection is known to have been accepted.
     */
    std::pair<AutoCloseFD, std::unique_ptr<FdSource>> connectAndPing()
    {
        auto fd = gcrelay::connect(socketPath);
        auto from = std::make_unique<FdSource>(fd.get());
        writeFull(fd.get(), encodeFrame({.type = FrameType::Ping}));
        auto reply = readFrame(*from, 4096);
        if (reply.type != FrameType::Pong)
            throw Error("unexpected reply %s", showFrameType(reply.type));
        return {std::move(fd), std::move(from)};
    }
};

TEST_F(ListenerTest, servesConnections)
{
    TestServer server(registry, store, options, socketPath);
    auto path = addStorePath("hello");

    auto [fd, from] = connectAndPing();
    writeFull(fd.get(), encodeFrame({.type = FrameType::Register, .payload = printed(path)}));
    ASSERT_EQ(readFrame(*from, 4096).type, FrameType::Ack);
    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(server->sessionCount(), 1u);

    fd.close();
    ASSERT_TRUE(waitFor([&]() { return server->sessionCount() == 0; }));
    ASSERT_FALSE(materializer.exists(path));
}

TEST_F(ListenerTest, sessionsGetDistinctIds)
{
    TestServer server(registry, store, options, socketPath);
    auto path = addStorePath("hello");

    auto [fd1, from1] = connectAndPing();
    auto [fd2, from2] = connectAndPing();
    writeFull(fd1.get(), encodeFrame({.type = FrameType::Register, .payload = printed(path)}));
    ASSERT_EQ(readFrame(*from1, 4096).type, FrameType::Ack);
    writeFull(fd2.get(), encodeFrame({.type = FrameType::Register, .payload = printed(path)}));
    ASSERT_EQ(readFrame(*from2, 4096).type, FrameType::Ack);

    ASSERT_EQ(registry.owners(path).size(), 2u);
}

TEST_F(ListenerTest, refusesWhenBusy)
{
    TestServer server(registry, store, options, socketPath);

    auto [fd1, from1] = connectAndPing();
    auto [fd2, from2] = connectAndPing();

    auto fd3 = gcrelay::connect(socketPath);
    FdSource from3(fd3.get());
    auto reply = readFrame(from3, 4096);
    ASSERT_EQ(parseErrorFrame(reply).kind, ErrorKind::ServerBusy);
    ASSERT_THROW(readFrame(from3, 4096), EndOfFile);
    ASSERT_EQ(server->sessionCount(), 2u);

    /* A slot frees up when a session ends. */
    fd1.close();
    ASSERT_TRUE(waitFor([&]() { return server->sessionCount() == 1; }));
    ASSERT_NO_THROW(connectAndPing());
}

TEST_F(ListenerTest, acceptFailureKeepsServing)
{
    /* A readable descriptor that is not a socket: accepting on it
       always fails. */
    Pipe broken;
    broken.create();
    writeFull(broken.writeSide.get(), "x");

    std::vector<AutoCloseFD> fds;
    fds.push_back(std::move(broken.readSide));
    fds.push_back(createUnixDomainSocket(socketPath, 0600));

    RelayServer server(registry, store, options, std::move(fds));

    std::atomic<bool> failed{false};
    std::thread runner([&]() {
        try {
            server.run();
        } catch (Error &) {
            failed = true;
        }
    });
    Finally stopServer([&]() {
        server.stop();
        runner.join();
    });

    ASSERT_NO_THROW(connectAndPing());
    ASSERT_NO_THROW(connectAndPing());
    ASSERT_FALSE(failed);
}

TEST_F(ListenerTest, stopDrainsAndKeepsMarkers)
{
    auto path = addStorePath("hello");

    TestServer server(registry, store, options, socketPath);

    auto [fd, from] = connectAndPing();
    writeFull(fd.get(), encodeFrame({.type = FrameType::Register, .payload = printed(path)}));
    ASSERT_EQ(readFrame(*from, 4096).type, FrameType::Ack);

    /* The session stays open until the drain timeout, then the
       connection is shut down. */
    server.stop();

    ASSERT_THROW(readFrame(*from, 4096), EndOfFile);
    ASSERT_EQ(server->sessionCount(), 0u);
    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(registry.size(), 0u);
}

TEST_F(ListenerTest, stopWaitsForClosingSessions)
{
    auto path = addStorePath("hello");
    options.shutdownTimeout = std::chrono::seconds(30);

    TestServer server(registry, store, options, socketPath);

    auto [fd, from] = connectAndPing();
    writeFull(fd.get(), encodeFrame({.type = FrameType::Register, .payload = printed(path)}));
    ASSERT_EQ(readFrame(*from, 4096).type, FrameType::Ack);

    std::thread stopper([&]() { server.stop(); });

    /* The session is still served while the relay drains. */
    writeFull(fd.get(), encodeFrame({.type = FrameType::Close}));
    ASSERT_EQ(readFrame(*from, 4096).type, FrameType::Ack);

    stopper.join();
    ASSERT_FALSE(materializer.exists(path));
}

TEST_F(ListenerTest, interruptedDrainServesSessions)
{
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    options.shutdownTimeout = std::chrono::seconds(30);

    TestServer server(registry, store, options, socketPath);

    auto [fd, from] = connectAndPing();
    from->allowInterrupts = false;
    for (auto & path : {a, b}) {
        writeFull(fd.get(), encodeFrame({.type = FrameType::Register, .payload = printed(path)}));
        ASSERT_EQ(readFrame(*from, 4096).type, FrameType::Ack);
    }

    /* What SIGTERM does to the relay. */
    Finally resetInterrupt([]() { setInterrupted(false); });
    unix::triggerInterrupt();
    server->stop();

    writeFull(fd.get(), encodeFrame({.type = FrameType::Unregister, .payload = printed(a)}), false);
    ASSERT_EQ(readFrame(*from, 4096).type, FrameType::Ack);
    ASSERT_FALSE(materializer.exists(a));

    writeFull(fd.get(), encodeFrame({.type = FrameType::Close}), false);
    ASSERT_EQ(readFrame(*from, 4096).type, FrameType::Ack);

    server.stop();
    ASSERT_FALSE(materializer.exists(b));
    ASSERT_EQ(registry.size(), 0u);
}

/* ----------------------------------------------------------------------------
 * Service manager integration
 * --------------------------------------------------------------------------*/

TEST_F(ListenerTest, notifyServiceManager)
{
    auto notifyPath = tmpDir.path() / "notify.sock";

    AutoCloseFD fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    ASSERT_TRUE(fd);
    gcrelay::bind(fd.get(), notifyPath);

    setEnv("NOTIFY_SOCKET", notifyPath.c_str());
    notifyServiceManager("READY=1");
    unsetenv("NOTIFY_SOCKET");

    char buf[64];
    auto n = recv(fd.get(), buf, sizeof(buf), MSG_DONTWAIT);
    ASSERT_EQ(std::string(buf, n > 0 ? n : 0), "READY=1");
}

TEST_F(ListenerTest, notifyWithoutSocket)
{
    unsetenv("NOTIFY_SOCKET");
    ASSERT_NO_THROW(notifyServiceManager("READY=1"));
}

TEST_F(ListenerTest, noActivatedSockets)
{
    unsetenv("LISTEN_PID");
    unsetenv("LISTEN_FDS");
    ASSERT_TRUE(getActivatedSockets().empty());
}

TEST_F(ListenerTest, activatedSocketsForOtherProcess)
{
    setEnv("LISTEN_PID", std::to_string(getpid() + 1).c_str());
    setEnv("LISTEN_FDS", "1");
    ASSERT_THROW(getActivatedSockets(), Error);
    ASSERT_FALSE(getEnv("LISTEN_FDS"));
}

} // namespace gcrelay::relay
