#include "relay-tests.hh"

#include "gcrelay/util/logging.hh"
#include "gcrelay/util/unix-domain-socket.hh"
#include "gcrelay/util/util.hh"

#include <sys/socket.h>

namespace gcrelay::relay {

std::pair<AutoCloseFD, AutoCloseFD> makeSocketPair()
{
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1)
        throw SysError("creating socket pair");
    return {AutoCloseFD{fds[0]}, AutoCloseFD{fds[1]}};
}

TestConnection::TestConnection(
    RootRegistry & registry,
    const StoreDirConfig & store,
    const HandlerOptions & options,
    SessionId id,
    const std::atomic<bool> & shuttingDown)
    : session(id, "test")
{
    auto [client, server] = makeSocketPair();
    fd = std::move(client);
    from.fd = fd.get();
    from.allowInterrupts = false;

    result = std::async(
        std::launch::async,
        [&registry, &store, &options, &shuttingDown, this, server = std::move(server)]() mutable {
            auto reason = processConnection(registry, store, options, session, server.get(), shuttingDown);
            server.close();
            return reason;
        });
}

TestConnection::~TestConnection()
{
    try {
        fd.close();
        if (result.valid())
            result.wait();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void TestConnection::sendRaw(std::string_view data)
{
    writeFull(fd.get(), data, false);
}

void TestConnection::send(const Frame & frame)
{
    sendRaw(encodeFrame(frame));
}

Frame TestConnection::receive()
{
    return readFrame(from, 1 << 20);
}

Frame TestConnection::request(FrameType type, std::string payload)
{
    send({.type = type, .payload = std::move(payload)});
    return receive();
}

std::optional<ErrorKind> TestConnection::requestError(FrameType type, std::string payload)
{
    auto reply = request(type, std::move(payload));
    if (reply.type != FrameType::Error)
        return std::nullopt;
    return parseErrorFrame(reply).kind;
}

TeardownReason TestConnection::disconnect()
{
    fd.close();
    return wait();
}

TeardownReason TestConnection::wait()
{
    return result.get();
}

TestServer::TestServer(
    RootRegistry & registry,
    const StoreDirConfig & store,
    ServerOptions options,
    const std::filesystem::path & socketPath)
    : server(registry, store, std::move(options), [&]() {
        std::vector<AutoCloseFD> fds;
        fds.push_back(createUnixDomainSocket(socketPath, 0600));
        return fds;
    }())
    , socketPath(socketPath)
{
    thread = std::thread([this]() {
        try {
            server.run();
        } catch (Error & e) {
            logError(e.info());
        }
    });
}

TestServer::~TestServer()
{
    try {
        stop();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void TestServer::stop()
{
    if (!thread.joinable())
        return;
    server.stop();
    thread.join();
}

} // namespace gcrelay::relay
