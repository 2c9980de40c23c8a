#include <gtest/gtest.h>

#include "relay-tests.hh"

#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/finally.hh"
#include "gcrelay/util/signals.hh"

using namespace std::string_literals;

namespace gcrelay::relay {

class ConnectionTest : public RelayTest
{
protected:
    HandlerOptions options;

    std::atomic<bool> shuttingDown{false};

    RootRegistry registry{materializer, {}};

    std::unique_ptr<TestConnection> connect(SessionId id)
    {
        return std::make_unique<TestConnection>(registry, store, options, id, shuttingDown);
    }
};

/* ----------------------------------------------------------------------------
 * Scenarios
 * --------------------------------------------------------------------------*/

TEST_F(ConnectionTest, registerThenDisconnect)
{
    auto path = addStorePath("hello");
    auto conn = connect(1);

    ASSERT_EQ(conn->request(FrameType::Register, printed(path)).type, FrameType::Ack);
    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(registry.owners(path), SessionIds{1});

    ASSERT_EQ(conn->disconnect(), TeardownReason::EndOfFile);
    ASSERT_FALSE(materializer.exists(path));
    ASSERT_EQ(registry.size(), 0u);
    ASSERT_EQ(conn->session.state, SessionState::Closed);
}

TEST_F(ConnectionTest, sharedPathAcrossSessions)
{
    auto path = addStorePath("hello");
    auto a = connect(1);
    auto b = connect(2);

    ASSERT_EQ(a->request(FrameType::Register, printed(path)).type, FrameType::Ack);
    ASSERT_EQ(b->request(FrameType::Register, printed(path)).type, FrameType::Ack);
    ASSERT_EQ(registry.owners(path), (SessionIds{1, 2}));

    a->disconnect();
    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(registry.owners(path), SessionIds{2});

    b->disconnect();
    ASSERT_FALSE(materializer.exists(path));
}

TEST_F(ConnectionTest, invalidThenValidRegister)
{
    auto path = addStorePath("hello");
    auto conn = connect(1);

    ASSERT_EQ(conn->requestError(FrameType::Register, "not a store path"), ErrorKind::PathInvalid);
    ASSERT_EQ(conn->requestError(FrameType::Register, "/etc/passwd"), ErrorKind::PathInvalid);
    ASSERT_EQ(conn->requestError(FrameType::Register, printed(path) + "/bin"), ErrorKind::PathInvalid);

    /* The session survives per-request errors. */
    ASSERT_EQ(conn->request(FrameType::Register, printed(path)).type, FrameType::Ack);
    ASSERT_EQ(registry.heldBy(1), StorePathSet{path});
}

TEST_F(ConnectionTest, restartWithStaleMarkers)
{
    auto kept = addStorePath("kept");
    auto dropped = addStorePath("dropped");

    /* Markers of a relay that went away without cleaning up. */
    materializer.create(kept);
    materializer.create(dropped);

    RootRegistry restarted(materializer, {.gracePeriod = std::chrono::hours(1)});
    restarted.reconcile();

    auto conn = std::make_unique<TestConnection>(restarted, store, options, 1, shuttingDown);
    ASSERT_EQ(conn->request(FrameType::Register, printed(kept)).type, FrameType::Ack);

    restarted.sweep(RootRegistry::Clock::now() + std::chrono::hours(2));
    ASSERT_TRUE(materializer.exists(kept));
    ASSERT_FALSE(materializer.exists(dropped));

    conn->disconnect();
    ASSERT_FALSE(materializer.exists(kept));
}

/* ----------------------------------------------------------------------------
 * Requests
 * --------------------------------------------------------------------------*/

TEST_F(ConnectionTest, registerMissingPath)
{
    auto conn = connect(1);
    ASSERT_EQ(conn->requestError(FrameType::Register, printed(makeStorePath("missing"))), ErrorKind::PathNotFound);
    ASSERT_EQ(registry.size(), 0u);
}

TEST_F(ConnectionTest, registerWhenFull)
{
    RootRegistry small(materializer, {.maxRoots = 1});
    auto a = addStorePath("a");
    auto b = addStorePath("b");

    auto conn = std::make_unique<TestConnection>(small, store, options, 1, shuttingDown);
    ASSERT_EQ(conn->request(FrameType::Register, printed(a)).type, FrameType::Ack);
    ASSERT_EQ(conn->requestError(FrameType::Register, printed(b)), ErrorKind::RegistryFull);
    ASSERT_EQ(conn->request(FrameType::Register, printed(a)).type, FrameType::Ack);
    conn->disconnect();
}

TEST_F(ConnectionTest, registerWhenMaterializationFails)
{
    createDirs(rootsDir.parent_path());
    writeFile(rootsDir.string(), "not a directory");

    auto conn = connect(1);
    ASSERT_EQ(
        conn->requestError(FrameType::Register, printed(addStorePath("hello"))), ErrorKind::MaterializationError);
    ASSERT_EQ(conn->request(FrameType::Ping).type, FrameType::Pong);
}

TEST_F(ConnectionTest, unregister)
{
    auto path = addStorePath("hello");
    auto conn = connect(1);

    conn->request(FrameType::Register, printed(path));
    ASSERT_EQ(conn->request(FrameType::Unregister, printed(path)).type, FrameType::Ack);
    ASSERT_FALSE(materializer.exists(path));
    ASSERT_TRUE(registry.heldBy(1).empty());
}

TEST_F(ConnectionTest, unregisterNotHeld)
{
    auto path = addStorePath("hello");
    auto conn = connect(1);

    ASSERT_EQ(conn->request(FrameType::Unregister, printed(path)).type, FrameType::Ack);
    ASSERT_EQ(conn->requestError(FrameType::Unregister, "bogus"), ErrorKind::PathInvalid);
}

TEST_F(ConnectionTest, unregisterNotHeldStrict)
{
    options.strictUnregister = true;
    auto path = addStorePath("hello");
    auto other = connect(2);
    auto conn = connect(1);

    other->request(FrameType::Register, printed(path));

    /* Another session's hold does not count. */
    ASSERT_EQ(conn->requestError(FrameType::Unregister, printed(path)), ErrorKind::PathNotHeld);
    ASSERT_TRUE(materializer.exists(path));

    conn->request(FrameType::Register, printed(path));
    ASSERT_EQ(conn->request(FrameType::Unregister, printed(path)).type, FrameType::Ack);
}

TEST_F(ConnectionTest, ping)
{
    auto conn = connect(1);
    auto reply = conn->request(FrameType::Ping);
    ASSERT_EQ(reply.type, FrameType::Pong);
    ASSERT_EQ(reply.payload, "");
}

TEST_F(ConnectionTest, hello)
{
    auto conn = connect(1);
    ASSERT_EQ(conn->request(FrameType::Hello, "builder-vm").type, FrameType::Ack);
    conn->disconnect();
    ASSERT_EQ(conn->session.clientId, "builder-vm");
}

TEST_F(ConnectionTest, close)
{
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    auto conn = connect(1);

    conn->request(FrameType::Register, printed(a));
    conn->request(FrameType::Register, printed(b));

    ASSERT_EQ(conn->request(FrameType::Close).type, FrameType::Ack);
    ASSERT_EQ(conn->wait(), TeardownReason::Close);
    ASSERT_FALSE(materializer.exists(a));
    ASSERT_FALSE(materializer.exists(b));
    ASSERT_THROW(conn->receive(), EndOfFile);
}

/* ----------------------------------------------------------------------------
 * Teardown
 * --------------------------------------------------------------------------*/

TEST_F(ConnectionTest, crashReleasesEverything)
{
    StorePaths paths;
    auto conn = connect(1);
    for (int n = 0; n < 10; ++n) {
        paths.push_back(addStorePath(fmt("path-%d", n)));
        conn->request(FrameType::Register, printed(paths.back()));
    }
    ASSERT_EQ(registry.size(), 10u);

    /* The guest vanishes without sending CLOSE. */
    conn->disconnect();

    ASSERT_EQ(registry.size(), 0u);
    for (auto & path : paths)
        ASSERT_FALSE(materializer.exists(path));
}

TEST_F(ConnectionTest, unknownFrameType)
{
    auto path = addStorePath("hello");
    auto conn = connect(1);
    conn->request(FrameType::Register, printed(path));

    conn->sendRaw("\x63\x00\x00\x00\x00"s);
    auto reply = conn->receive();
    ASSERT_EQ(parseErrorFrame(reply).kind, ErrorKind::ProtocolError);

    ASSERT_EQ(conn->wait(), TeardownReason::ProtocolError);
    ASSERT_FALSE(materializer.exists(path));
}

TEST_F(ConnectionTest, oversizedFrame)
{
    options.maxFrameSize = 64;
    auto conn = connect(1);

    conn->send({.type = FrameType::Register, .payload = std::string(65, 'x')});
    ASSERT_EQ(parseErrorFrame(conn->receive()).kind, ErrorKind::ProtocolError);
    ASSERT_EQ(conn->wait(), TeardownReason::ProtocolError);
}

TEST_F(ConnectionTest, relayFrameFromClient)
{
    auto conn = connect(1);

    conn->send({.type = FrameType::Ack});
    ASSERT_EQ(parseErrorFrame(conn->receive()).kind, ErrorKind::ProtocolError);
    ASSERT_EQ(conn->wait(), TeardownReason::ProtocolError);
}

TEST_F(ConnectionTest, truncatedFrame)
{
    auto path = addStorePath("hello");
    auto conn = connect(1);
    conn->request(FrameType::Register, printed(path));

    conn->sendRaw("\x01\x40\x00\x00\x00/nix"s);
    ASSERT_EQ(conn->disconnect(), TeardownReason::ProtocolError);
    ASSERT_FALSE(materializer.exists(path));
}

TEST_F(ConnectionTest, idleTimeout)
{
    options.idleTimeout = std::chrono::milliseconds(50);
    auto path = addStorePath("hello");
    auto conn = connect(1);
    conn->request(FrameType::Register, printed(path));

    ASSERT_EQ(conn->wait(), TeardownReason::IdleTimeout);
    ASSERT_FALSE(materializer.exists(path));
}

TEST_F(ConnectionTest, activityResetsIdleTimeout)
{
    options.idleTimeout = std::chrono::milliseconds(500);
    auto conn = connect(1);

    for (int n = 0; n < 5; ++n) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        ASSERT_EQ(conn->request(FrameType::Ping).type, FrameType::Pong);
    }
}

TEST_F(ConnectionTest, shutdownKeepsMarkers)
{
    auto path = addStorePath("hello");
    auto conn = connect(1);
    conn->request(FrameType::Register, printed(path));

    shuttingDown = true;
    ASSERT_EQ(conn->disconnect(), TeardownReason::Shutdown);

    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(registry.size(), 0u);
}

TEST_F(ConnectionTest, interruptDoesNotEndSession)
{
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    auto conn = connect(1);
    ASSERT_EQ(conn->request(FrameType::Register, printed(a)).type, FrameType::Ack);
    ASSERT_EQ(conn->request(FrameType::Register, printed(b)).type, FrameType::Ack);

    Finally resetInterrupt([]() { setInterrupted(false); });
    unix::triggerInterrupt();

    ASSERT_EQ(conn->request(FrameType::Unregister, printed(a)).type, FrameType::Ack);
    ASSERT_FALSE(materializer.exists(a));
    ASSERT_EQ(conn->request(FrameType::Ping).type, FrameType::Pong);

    /* Without `shuttingDown`, a disconnect still releases everything. */
    ASSERT_EQ(conn->disconnect(), TeardownReason::EndOfFile);
    ASSERT_FALSE(materializer.exists(b));
    ASSERT_EQ(registry.size(), 0u);
}

} // namespace gcrelay::relay
