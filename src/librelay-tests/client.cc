#include <gtest/gtest.h>

#include "relay-tests.hh"

#include "gcrelay/relay/client.hh"
#include "gcrelay/util/unix-domain-socket.hh"

namespace gcrelay::relay {

class RelayClientTest : public RelayTest
{
protected:
    std::filesystem::path socketPath = tmpDir.path() / "relay.sock";

    RootRegistry registry{materializer, {}};

    ServerOptions serverOptions{.shutdownTimeout = std::chrono::milliseconds(100)};

    ClientOptions clientOptions{
        .pingInterval = std::chrono::milliseconds(20),
        .retryMinDelay = std::chrono::milliseconds(10),
        .retryMaxDelay = std::chrono::milliseconds(50),
    };

    Connector connector()
    {
        return [socketPath = socketPath]() { return gcrelay::connect(socketPath); };
    }
};

TEST_F(RelayClientTest, protect)
{
    TestServer server(registry, store, serverOptions, socketPath);
    RelayClient client(store, connector(), clientOptions);
    auto path = addStorePath("hello");

    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.isConnected());

    client.protect(path);
    ASSERT_EQ(registry.size(), 1u);
    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(client.protectedPaths(), StorePathSet{path});

    client.unprotect(path);
    ASSERT_EQ(registry.size(), 0u);
    ASSERT_FALSE(materializer.exists(path));
    ASSERT_TRUE(client.protectedPaths().empty());
}

TEST_F(RelayClientTest, protectRefused)
{
    TestServer server(registry, store, serverOptions, socketPath);
    RelayClient client(store, connector(), clientOptions);
    auto missing = makeStorePath("missing");

    ASSERT_TRUE(client.connect());

    try {
        client.protect(missing);
        FAIL() << "protecting a missing path should fail";
    } catch (RelayError & e) {
        ASSERT_EQ(e.kind, ErrorKind::PathNotFound);
    }

    ASSERT_TRUE(client.protectedPaths().empty());
    ASSERT_TRUE(client.isConnected());
}

TEST_F(RelayClientTest, update)
{
    TestServer server(registry, store, serverOptions, socketPath);
    RelayClient client(store, connector(), clientOptions);
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    auto c = addStorePath("c");

    ASSERT_TRUE(client.connect());

    client.update({a, b});
    ASSERT_TRUE(materializer.exists(a));
    ASSERT_TRUE(materializer.exists(b));

    /* Refused paths are skipped. */
    client.update({b, c, makeStorePath("missing")});
    ASSERT_FALSE(materializer.exists(a));
    ASSERT_TRUE(materializer.exists(b));
    ASSERT_TRUE(materializer.exists(c));
    ASSERT_EQ(client.protectedPaths(), (StorePathSet{b, c}));
    ASSERT_EQ(registry.size(), 2u);
}

TEST_F(RelayClientTest, ping)
{
    TestServer server(registry, store, serverOptions, socketPath);
    RelayClient client(store, connector(), clientOptions);

    ASSERT_FALSE(client.ping());
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.ping());
}

TEST_F(RelayClientTest, hello)
{
    TestServer server(registry, store, serverOptions, socketPath);
    clientOptions.clientId = "builder-vm";
    RelayClient client(store, connector(), clientOptions);

    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(client.ping());
}

TEST_F(RelayClientTest, closeReleasesEverything)
{
    TestServer server(registry, store, serverOptions, socketPath);
    RelayClient client(store, connector(), clientOptions);
    auto a = addStorePath("a");
    auto b = addStorePath("b");

    ASSERT_TRUE(client.connect());
    client.protect(a);
    client.protect(b);

    client.close();
    ASSERT_FALSE(client.isConnected());
    ASSERT_EQ(registry.size(), 0u);
    ASSERT_FALSE(materializer.exists(a));
    ASSERT_FALSE(materializer.exists(b));
}

TEST_F(RelayClientTest, relayUnavailable)
{
    RelayClient client(store, connector(), clientOptions);
    auto path = addStorePath("hello");

    ASSERT_FALSE(client.connect());
    ASSERT_FALSE(client.isConnected());

    /* The path is remembered and registered once the relay is up. */
    ASSERT_NO_THROW(client.protect(path));
    ASSERT_EQ(client.protectedPaths(), StorePathSet{path});

    TestServer server(registry, store, serverOptions, socketPath);
    ASSERT_TRUE(client.connect());
    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(registry.size(), 1u);
}

TEST_F(RelayClientTest, relayBusy)
{
    serverOptions.maxSessions = 1;
    TestServer server(registry, store, serverOptions, socketPath);
    auto a = addStorePath("a");
    auto b = addStorePath("b");

    RelayClient first(store, connector(), clientOptions);
    ASSERT_TRUE(first.connect());
    first.protect(a);

    /* A refused connection is a failed connection, not a refused
       path. */
    RelayClient second(store, connector(), clientOptions);
    second.protect(b);
    ASSERT_FALSE(second.connect());
    ASSERT_FALSE(second.isConnected());
    ASSERT_EQ(second.protectedPaths(), StorePathSet{b});

    first.close();
    ASSERT_TRUE(waitFor([&]() { return server->sessionCount() == 0; }));
    ASSERT_TRUE(second.connect());
    ASSERT_TRUE(materializer.exists(b));
}

TEST_F(RelayClientTest, silentRelay)
{
    auto path = addStorePath("hello");
    clientOptions.replyTimeout = std::chrono::milliseconds(100);

    /* A peer that accepts the connection but never answers. */
    auto [ours, theirs] = makeSocketPair();
    auto peer = std::make_shared<AutoCloseFD>(std::move(ours));
    RelayClient client(store, [peer]() { return std::move(*peer); }, clientOptions);
    FdSource from(theirs.get());

    ASSERT_TRUE(client.connect());

    auto start = std::chrono::steady_clock::now();
    ASSERT_NO_THROW(client.protect(path));
    ASSERT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

    ASSERT_FALSE(client.isConnected());
    ASSERT_EQ(client.protectedPaths(), StorePathSet{path});
    ASSERT_FALSE(client.ping());

    auto request = readFrame(from, 4096);
    ASSERT_EQ(request.type, FrameType::Register);
    ASSERT_EQ(request.payload, printed(path));
}

TEST_F(RelayClientTest, reconnectsAfterRelayRestart)
{
    auto path = addStorePath("hello");

    auto first = std::make_unique<TestServer>(registry, store, serverOptions, socketPath);

    RelayClient client(store, connector(), clientOptions);
    ASSERT_TRUE(client.connect());
    client.protect(path);
    client.start();

    /* The relay goes away; its markers stay behind. */
    first.reset();
    ASSERT_TRUE(waitFor([&]() { return !client.isConnected(); }));
    ASSERT_TRUE(materializer.exists(path));

    RootRegistry restarted(materializer, {.gracePeriod = std::chrono::hours(1)});
    restarted.reconcile();
    ASSERT_EQ(restarted.sweepBacklog(), 1u);

    TestServer second(restarted, store, serverOptions, socketPath);

    ASSERT_TRUE(waitFor([&]() { return restarted.size() == 1; }));
    ASSERT_TRUE(client.isConnected());
    ASSERT_EQ(restarted.sweepBacklog(), 0u);

    client.close();
    ASSERT_FALSE(materializer.exists(path));
}

TEST_F(RelayClientTest, keepAlive)
{
    serverOptions.handler.idleTimeout = std::chrono::milliseconds(200);
    TestServer server(registry, store, serverOptions, socketPath);
    auto path = addStorePath("hello");

    RelayClient client(store, connector(), clientOptions);
    ASSERT_TRUE(client.connect());
    client.protect(path);
    client.start();

    /* Pings keep the session from idling out. */
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    ASSERT_TRUE(client.isConnected());
    ASSERT_EQ(server->sessionCount(), 1u);
    ASSERT_TRUE(materializer.exists(path));
}

} // namespace gcrelay::relay
