#include "gcrelay/main/shared.hh"
#include "gcrelay/relay/listener.hh"
#include "gcrelay/relay/relay-settings.hh"
#include "gcrelay/relay/root-registry.hh"
#include "gcrelay/store/root-materializer.hh"
#include "gcrelay/util/config-global.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"

#include <iostream>

using namespace gcrelay;
using namespace gcrelay::relay;

static GlobalConfig::Register rRelaySettings(&relaySettings);

static void showHelp()
{
    std::cout << "Usage: gcroot-relay [--option NAME VALUE]... [-v]... [-q]...\n"
                 "\n"
                 "Keep store paths alive on behalf of virtual machines. Guests connect over\n"
                 "vsock and register the store paths they use; the relay holds a GC root for\n"
                 "every path registered by at least one connected guest.\n"
                 "\n"
                 "Settings are read from "
              << getConfDir()
              << "/relay.conf. Use --show-config to print them.\n";
    throw Exit();
}

static void mainRelay(int argc, char ** argv)
{
    loadConfFile(globalConfig, "relay.conf");

    parseCmdLine(argc, argv, [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help")
            showHelp();
        else
            return false;
        return true;
    });

    globalConfig.warnUnknownSettings();

    initRelayProcess();
    applyJSONLogger();

    StoreDirConfig store(relaySettings.storeDir);

    RootMaterializer materializer(store, relaySettings.rootsDir.get());

    RootRegistry registry(
        materializer,
        {
            .maxRoots = relaySettings.maxRoots,
            .gracePeriod = std::chrono::seconds(relaySettings.reconcileGracePeriod.get()),
        });

    registry.reconcile();
    registry.startSweeper(std::chrono::seconds(relaySettings.sweepInterval.get()));

    RelayServer server(registry, store, getServerOptions(relaySettings), openListeners(relaySettings));

    auto stopOnInterrupt = createInterruptCallback([&]() { server.stop(); });

    server.run();

    printInfo("relay stopped, %d paths still held", registry.size());
}

int main(int argc, char ** argv)
{
    return handleExceptions(argv[0], [&]() { mainRelay(argc, argv); });
}
