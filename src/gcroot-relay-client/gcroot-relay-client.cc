#include "gcrelay/main/shared.hh"
#include "gcrelay/relay/client.hh"
#include "gcrelay/relay/relay-settings.hh"
#include "gcrelay/store/roots.hh"
#include "gcrelay/util/config-global.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"
#include "gcrelay/util/sync.hh"

#include <iostream>

using namespace gcrelay;
using namespace gcrelay::relay;

static GlobalConfig::Register rClientSettings(&clientSettings);

static void showHelp()
{
    std::cout << "Usage: gcroot-relay-client [--once] [--option NAME VALUE]... [-v]... [-q]...\n"
                 "\n"
                 "Register the store paths rooted in this machine's GC roots directory with\n"
                 "the gcroot-relay running on the host, and keep them registered while they\n"
                 "stay rooted. With --once, register the current roots, then close the\n"
                 "connection and exit.\n"
                 "\n"
                 "Settings are read from "
              << getConfDir()
              << "/client.conf. Use --show-config to print them.\n";
    throw Exit();
}

static void mainClient(int argc, char ** argv)
{
    bool once = false;

    loadConfFile(globalConfig, "client.conf");

    parseCmdLine(argc, argv, [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help")
            showHelp();
        else if (*arg == "--once")
            once = true;
        else
            return false;
        return true;
    });

    globalConfig.warnUnknownSettings();

    initRelayProcess();
    applyJSONLogger();

    StoreDirConfig store(clientSettings.storeDir);
    std::filesystem::path gcrootsDir(clientSettings.gcrootsDir.get());

    auto options = getClientOptions(clientSettings);

    RelayClient client(
        store, vsockConnector(clientSettings.relayCid, clientSettings.relayPort, options.replyTimeout), options);

    if (!client.connect() && once)
        throw Error(
            "cannot connect to the relay at vsock %d:%d", clientSettings.relayCid.get(), clientSettings.relayPort.get());

    auto scan = [&]() {
        auto paths = roots::findRootPaths(store, gcrootsDir);
        debug("found %d rooted store paths in '%s'", paths.size(), gcrootsDir.string());
        client.update(paths);
    };

    if (once) {
        scan();
        client.close();
        return;
    }

    client.start();

    struct State
    {
        bool quit = false;
    };

    Sync<State> state_;
    std::condition_variable wakeup;

    auto wakeOnInterrupt = createInterruptCallback([&]() {
        state_.lock()->quit = true;
        wakeup.notify_all();
    });

    auto interval = std::chrono::seconds(clientSettings.scanInterval.get());

    while (true) {
        scan();

        auto state(state_.lock());
        state.wait_for(wakeup, interval, [&]() { return state->quit; });
        if (state->quit)
            break;
    }

    printInfo("shutting down, releasing %d paths", client.protectedPaths().size());

    /* Otherwise the CLOSE exchange would be interrupted. */
    setInterrupted(false);
    client.close();
}

int main(int argc, char ** argv)
{
    return handleExceptions(argv[0], [&]() { mainClient(argc, argv); });
}
