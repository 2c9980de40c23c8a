#include "gcrelay/relay/client.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"
#include "gcrelay/util/util.hh"
#include "gcrelay/util/vsock.hh"

namespace gcrelay::relay {

Connector vsockConnector(uint32_t cid, uint32_t port, std::chrono::milliseconds timeout)
{
    return [cid, port, timeout]() { return connectVsock(cid, port, timeout); };
}

ClientOptions getClientOptions(const ClientSettings & settings)
{
    ClientOptions options{
        .pingInterval = std::chrono::seconds(settings.pingInterval.get()),
        .replyTimeout = std::chrono::seconds(settings.replyTimeout.get()),
        .retryMinDelay = std::chrono::seconds(settings.retryMinDelay.get()),
        .retryMaxDelay = std::chrono::seconds(settings.retryMaxDelay.get()),
    };
    if (!settings.clientId.get().empty())
        options.clientId = settings.clientId.get();
    return options;
}

RelayClient::RelayClient(StoreDirConfig store, Connector connector, ClientOptions options)
    : store(std::move(store))
    , connector(std::move(connector))
    , options(std::move(options))
{
    auto state(state_.lock());
    state->retryDelay = this->options.retryMinDelay;
}

RelayClient::~RelayClient()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void RelayClient::disconnectLocked(State & state, std::string_view reason)
{
    warn("lost the connection to the relay: %s", reason);
    state.from.reset();
    state.fd.close();
    state.connected = false;
    state.nextAttempt = Clock::now() + state.retryDelay;
}

std::optional<Frame> RelayClient::exchange(State & state, const Frame & request, FrameType expected)
{
    if (!state.connected)
        return std::nullopt;

    try {
        writeFull(state.fd.get(), encodeFrame(request));

        if (!state.from->hasData() && !waitForInput(state.fd.get(), options.replyTimeout))
            throw Error(
                "the relay did not answer %s within %d ms", showFrameType(request.type), options.replyTimeout.count());

        auto reply = readFrame(*state.from, options.maxFrameSize);
        if (reply.type == FrameType::Error) {
            auto e = parseErrorFrame(reply);
            /* A busy relay closes the connection right away. */
            if (e.kind == ErrorKind::ServerBusy)
                throw e;
        } else if (reply.type != expected)
            throw BadFrame(
                "relay replied %s to %s instead of %s",
                showFrameType(reply.type),
                showFrameType(request.type),
                showFrameType(expected));

        state.lastActivity = Clock::now();
        return reply;
    } catch (Error & e) {
        disconnectLocked(state, e.message());
        return std::nullopt;
    }
}

bool RelayClient::connectLocked(State & state)
{
    try {
        state.fd = connector();
    } catch (Error & e) {
        warn("cannot connect to the relay: %s", e.message());
        state.nextAttempt = Clock::now() + state.retryDelay;
        state.retryDelay = std::min(state.retryDelay * 2, options.retryMaxDelay);
        return false;
    }

    state.from = std::make_unique<FdSource>(state.fd.get());
    state.connected = true;
    state.lastActivity = Clock::now();

    if (options.clientId) {
        auto reply = exchange(state, {.type = FrameType::Hello, .payload = *options.clientId}, FrameType::Ack);
        if (reply && reply->type == FrameType::Error)
            warn("the relay refused our client identifier: %s", parseErrorFrame(*reply).message());
    }

    for (auto i = state.desired.begin(); state.connected && i != state.desired.end();) {
        auto reply = exchange(
            state, {.type = FrameType::Register, .payload = store.printStorePath(*i)}, FrameType::Ack);
        if (reply && reply->type == FrameType::Error) {
            warn("the relay refused to protect '%s': %s", store.printStorePath(*i), parseErrorFrame(*reply).message());
            i = state.desired.erase(i);
        } else
            ++i;
    }

    if (!state.connected) {
        state.retryDelay = std::min(state.retryDelay * 2, options.retryMaxDelay);
        return false;
    }

    state.retryDelay = options.retryMinDelay;
    printInfo("connected to the relay, %d paths protected", state.desired.size());
    return true;
}

bool RelayClient::connect()
{
    auto state(state_.lock());
    if (state->connected)
        return true;
    return connectLocked(*state);
}

bool RelayClient::isConnected()
{
    return state_.lock()->connected;
}

void RelayClient::protect(const StorePath & path)
{
    auto state(state_.lock());

    state->desired.insert(path);

    auto reply =
        exchange(*state, {.type = FrameType::Register, .payload = store.printStorePath(path)}, FrameType::Ack);
    if (reply && reply->type == FrameType::Error) {
        state->desired.erase(path);
        auto e = parseErrorFrame(*reply);
        e.addTrace("while protecting '%s'", store.printStorePath(path));
        throw e;
    }
}

void RelayClient::unprotect(const StorePath & path)
{
    auto state(state_.lock());

    state->desired.erase(path);

    auto reply =
        exchange(*state, {.type = FrameType::Unregister, .payload = store.printStorePath(path)}, FrameType::Ack);
    if (reply && reply->type == FrameType::Error) {
        auto e = parseErrorFrame(*reply);
        e.addTrace("while unprotecting '%s'", store.printStorePath(path));
        throw e;
    }
}

void RelayClient::update(const StorePathSet & paths)
{
    auto current = protectedPaths();

    for (auto & path : current) {
        if (paths.count(path))
            continue;
        debug("unprotecting '%s'", store.printStorePath(path));
        try {
            unprotect(path);
        } catch (RelayError & e) {
            logWarning(e.info());
        }
    }

    for (auto & path : paths) {
        if (current.count(path))
            continue;
        debug("protecting '%s'", store.printStorePath(path));
        try {
            protect(path);
        } catch (RelayError & e) {
            logWarning(e.info());
        }
    }
}

bool RelayClient::ping()
{
    auto state(state_.lock());
    auto reply = exchange(*state, {.type = FrameType::Ping}, FrameType::Pong);
    return reply && reply->type == FrameType::Pong;
}

StorePathSet RelayClient::protectedPaths()
{
    return state_.lock()->desired;
}

void RelayClient::keeper()
{
    while (true) {
        auto state(state_.lock());
        if (state->quit)
            break;

        auto deadline = state->connected ? state->lastActivity + options.pingInterval : state->nextAttempt;
        if (Clock::now() < deadline) {
            state.wait_until(wakeup, deadline);
            continue;
        }

        if (state->connected)
            exchange(*state, {.type = FrameType::Ping}, FrameType::Pong);
        else
            connectLocked(*state);
    }
}

void RelayClient::start()
{
    {
        auto state(state_.lock());
        state->quit = false;
    }

    keeperThread = std::thread([this]() {
        try {
            keeper();
        } catch (Interrupted &) {
            debug("relay client keep-alive thread interrupted");
        } catch (Error & e) {
            logError(e.info());
        }
    });
}

void RelayClient::stopKeeper()
{
    {
        auto state(state_.lock());
        state->quit = true;
    }
    wakeup.notify_all();
    if (keeperThread.joinable())
        keeperThread.join();
}

void RelayClient::close()
{
    stopKeeper();

    auto state(state_.lock());
    if (!state->connected)
        return;

    auto reply = exchange(*state, {.type = FrameType::Close}, FrameType::Ack);
    if (reply && reply->type == FrameType::Error)
        warn("the relay rejected CLOSE: %s", parseErrorFrame(*reply).message());

    state->from.reset();
    state->fd.close();
    state->connected = false;
}

} // namespace gcrelay::relay
