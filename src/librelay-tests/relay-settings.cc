#include <gtest/gtest.h>

#include "relay-tests.hh"

#include "gcrelay/relay/client.hh"
#include "gcrelay/relay/relay-settings.hh"
#include "gcrelay/util/environment-variables.hh"
#include "gcrelay/util/file-system.hh"

#include <cstdlib>

namespace gcrelay::relay {

TEST(RelaySettings, defaults)
{
    RelaySettings settings;

    ASSERT_EQ(settings.listenMode.get(), ListenMode::Auto);
    ASSERT_EQ(settings.listenPort.get(), 25565u);
    ASSERT_EQ(settings.storeDir.get(), "/nix/store");
    ASSERT_EQ(settings.maxFrameSize.get(), 4096u);
    ASSERT_FALSE(settings.strictUnregister.get());
}

TEST(RelaySettings, listenMode)
{
    RelaySettings settings;

    ASSERT_TRUE(settings.set("listen-mode", "bound"));
    ASSERT_EQ(settings.listenMode.get(), ListenMode::Bound);
    ASSERT_TRUE(settings.set("listen-mode", "activated"));
    ASSERT_EQ(settings.listenMode.get(), ListenMode::Activated);

    ASSERT_THROW(settings.set("listen-mode", "tcp"), UsageError);

    std::map<std::string, AbstractConfig::SettingInfo> all;
    settings.getSettings(all);
    ASSERT_EQ(all["listen-mode"].value, "activated");
}

TEST(RelaySettings, applyConfig)
{
    RelaySettings settings;

    settings.applyConfig(
        "listen-port = 1234\n"
        "roots-dir = /var/lib/relay//roots/\n"
        "strict-unregister = true\n"
        "idle-timeout = 5\n");

    ASSERT_EQ(settings.listenPort.get(), 1234u);
    ASSERT_EQ(settings.rootsDir.get(), "/var/lib/relay/roots");
    ASSERT_TRUE(settings.strictUnregister.get());
    ASSERT_EQ(settings.getIdleTimeout(), std::chrono::seconds(5));
}

TEST(RelaySettings, invalidValues)
{
    RelaySettings settings;

    ASSERT_THROW(settings.set("listen-port", "port"), UsageError);
    ASSERT_THROW(settings.set("roots-dir", ""), UsageError);
    ASSERT_FALSE(settings.set("no-such-setting", "1"));
}

TEST(RelaySettings, getServerOptions)
{
    RelaySettings settings;
    settings.applyConfig(
        "max-sessions = 3\n"
        "shutdown-timeout = 7\n"
        "max-frame-size = 512\n"
        "idle-timeout = 0\n"
        "strict-unregister = true\n");

    auto options = getServerOptions(settings);
    ASSERT_EQ(options.maxSessions, 3u);
    ASSERT_EQ(options.shutdownTimeout, std::chrono::seconds(7));
    ASSERT_EQ(options.handler.maxFrameSize, 512u);
    ASSERT_EQ(options.handler.idleTimeout.count(), 0);
    ASSERT_TRUE(options.handler.strictUnregister);
}

TEST(ClientSettings, getClientOptions)
{
    ClientSettings settings;

    auto options = getClientOptions(settings);
    ASSERT_FALSE(options.clientId);
    ASSERT_EQ(options.pingInterval, std::chrono::seconds(30));
    ASSERT_EQ(options.replyTimeout, std::chrono::seconds(10));
    ASSERT_EQ(options.retryMinDelay, std::chrono::seconds(1));
    ASSERT_EQ(options.retryMaxDelay, std::chrono::seconds(60));

    settings.applyConfig(
        "client-id = vm-42\n"
        "ping-interval = 10\n"
        "reply-timeout = 3\n");
    options = getClientOptions(settings);
    ASSERT_EQ(options.clientId, "vm-42");
    ASSERT_EQ(options.pingInterval, std::chrono::seconds(10));
    ASSERT_EQ(options.replyTimeout, std::chrono::seconds(3));
}

TEST(ClientSettings, defaults)
{
    ClientSettings settings;

    ASSERT_EQ(settings.relayCid.get(), vsockCidHost);
    ASSERT_EQ(settings.relayPort.get(), defaultRelayPort);
    ASSERT_EQ(settings.gcrootsDir.get(), "/nix/var/nix/gcroots");
}

/* ----------------------------------------------------------------------------
 * Configuration files
 * --------------------------------------------------------------------------*/

class ConfFileTest : public ::testing::Test
{
protected:
    AutoDelete tmpDir{createTempDir("", "gcrelay-conf")};

    ConfFileTest()
    {
        setEnv("GCROOT_RELAY_CONF_DIR", tmpDir.path().c_str());
    }

    ~ConfFileTest()
    {
        unsetenv("GCROOT_RELAY_CONF_DIR");
    }
};

TEST_F(ConfFileTest, getConfDir)
{
    ASSERT_EQ(getConfDir(), tmpDir.path().string());
}

TEST_F(ConfFileTest, loadConfFile)
{
    writeFile((tmpDir.path() / "relay.conf").string(), "max-roots = 10\n");

    RelaySettings settings;
    loadConfFile(settings, "relay.conf");
    ASSERT_EQ(settings.maxRoots.get(), 10u);
}

TEST_F(ConfFileTest, missingConfFile)
{
    ClientSettings settings;
    ASSERT_NO_THROW(loadConfFile(settings, "client.conf"));
    ASSERT_EQ(settings.scanInterval.get(), 300u);
}

TEST_F(ConfFileTest, invalidConfFile)
{
    writeFile((tmpDir.path() / "relay.conf").string(), "max-roots = lots\n");

    RelaySettings settings;
    ASSERT_THROW(loadConfFile(settings, "relay.conf"), UsageError);
}

} // namespace gcrelay::relay
