#include "gcrelay/relay/connection.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"

namespace gcrelay::relay {

std::string_view showTeardownReason(TeardownReason reason)
{
    switch (reason) {
    case TeardownReason::Close:
        return "closed by client";
    case TeardownReason::EndOfFile:
        return "connection closed";
    case TeardownReason::TransportError:
        return "transport error";
    case TeardownReason::ProtocolError:
        return "protocol error";
    case TeardownReason::IdleTimeout:
        return "idle timeout";
    case TeardownReason::Shutdown:
        return "relay shutdown";
    case TeardownReason::InternalError:
        return "internal error";
    }
    unreachable();
}

std::string ClientSession::describe() const
{
    auto s = fmt("session %d", id);
    if (clientId)
        s += fmt(" (%s)", *clientId);
    if (!peer.empty())
        s += fmt(" from %s", peer);
    return s;
}

namespace {

struct Connection
{
    RootRegistry & registry;
    const StoreDirConfig & store;
    const HandlerOptions & options;
    ClientSession & session;
    Descriptor fd;

    FdSource from;
    FdSink to;

    Connection(
        RootRegistry & registry,
        const StoreDirConfig & store,
        const HandlerOptions & options,
        ClientSession & session,
        Descriptor fd)
        : registry(registry)
        , store(store)
        , options(options)
        , session(session)
        , fd(fd)
        , from(fd)
        , to(fd)
    {
        /* Sessions keep being served while the relay drains; only
           `shuttingDown` ends them. */
        from.allowInterrupts = false;
        to.allowInterrupts = false;
    }

    void reply(const Frame & frame)
    {
        vomit("%s: sending %s", session.describe(), showFrameType(frame.type));
        writeFrame(to, frame);
        to.flush();
    }

    void replyError(ErrorKind kind, std::string_view message)
    {
        debug("%s: replying %s: %s", session.describe(), showErrorKind(kind), message);
        reply(makeErrorFrame(kind, message));
    }

    std::optional<StorePath> parsePath(const std::string & payload)
    {
        try {
            return store.parseStorePath(payload);
        } catch (BadStorePath & e) {
            replyError(ErrorKind::PathInvalid, e.message());
            return std::nullopt;
        }
    }

    void handleRegister(const std::string & payload)
    {
        auto path = parsePath(payload);
        if (!path)
            return;

        auto printed = store.printStorePath(*path);

        try {
            if (!pathExists(printed)) {
                replyError(ErrorKind::PathNotFound, fmt("path '%s' does not exist", printed));
                return;
            }
        } catch (SysError & e) {
            replyError(ErrorKind::PathNotFound, e.message());
            return;
        }

        try {
            registry.acquire(*path, session.id);
        } catch (RegistryFull & e) {
            replyError(ErrorKind::RegistryFull, e.message());
            return;
        } catch (MaterializationError & e) {
            logError(e.info());
            replyError(ErrorKind::MaterializationError, e.message());
            return;
        }

        debug("%s: registered '%s'", session.describe(), printed);
        reply({.type = FrameType::Ack});
    }

    void handleUnregister(const std::string & payload)
    {
        auto path = parsePath(payload);
        if (!path)
            return;

        auto printed = store.printStorePath(*path);

        if (!registry.release(*path, session.id) && options.strictUnregister) {
            replyError(ErrorKind::PathNotHeld, fmt("path '%s' is not held by this session", printed));
            return;
        }

        debug("%s: unregistered '%s'", session.describe(), printed);
        reply({.type = FrameType::Ack});
    }

    /**
     * Process frames until the session ends.
     */
    TeardownReason serve(const std::atomic<bool> & shuttingDown)
    {
        while (true) {
            try {
                if (options.idleTimeout.count() > 0 && !from.hasData() && !waitForInput(fd, options.idleTimeout))
                    return TeardownReason::IdleTimeout;

                auto frame = readFrame(from, options.maxFrameSize);
                vomit("%s: received %s", session.describe(), showFrameType(frame.type));

                if (!isClientFrame(frame.type))
                    throw BadFrame("unexpected %s frame from a client", showFrameType(frame.type));

                switch (frame.type) {

                case FrameType::Hello:
                    session.clientId = frame.payload;
                    printInfo("%s: client identified itself", session.describe());
                    reply({.type = FrameType::Ack});
                    break;

                case FrameType::Register:
                    handleRegister(frame.payload);
                    break;

                case FrameType::Unregister:
                    handleUnregister(frame.payload);
                    break;

                case FrameType::Ping:
                    reply({.type = FrameType::Pong});
                    break;

                case FrameType::Close:
                    session.state = SessionState::Closing;
                    registry.releaseAll(session.id);
                    try {
                        reply({.type = FrameType::Ack});
                    } catch (SysError & e) {
                        debug("%s: cannot acknowledge CLOSE: %s", session.describe(), e.message());
                    }
                    return TeardownReason::Close;

                default:
                    unreachable();
                }

            } catch (EndOfFile &) {
                return shuttingDown ? TeardownReason::Shutdown : TeardownReason::EndOfFile;
            } catch (BadFrame & e) {
                warn("%s: protocol error: %s", session.describe(), e.message());
                try {
                    replyError(ErrorKind::ProtocolError, e.message());
                } catch (Error & e2) {
                    debug("%s: cannot report the protocol error: %s", session.describe(), e2.message());
                }
                return TeardownReason::ProtocolError;
            } catch (SysError & e) {
                if (shuttingDown)
                    return TeardownReason::Shutdown;
                debug("%s: %s", session.describe(), e.message());
                return TeardownReason::TransportError;
            }
        }
    }
};

} // namespace

TeardownReason processConnection(
    RootRegistry & registry,
    const StoreDirConfig & store,
    const HandlerOptions & options,
    ClientSession & session,
    Descriptor fd,
    const std::atomic<bool> & shuttingDown)
{
    Connection conn(registry, store, options, session, fd);

    session.state = SessionState::Active;

    TeardownReason reason;
    try {
        reason = conn.serve(shuttingDown);
    } catch (Interrupted &) {
        reason = TeardownReason::Shutdown;
    } catch (Error & e) {
        logError(e.info());
        reason = TeardownReason::InternalError;
    }

    /* A CLOSE has already released everything. */
    if (reason != TeardownReason::Close) {
        session.state = SessionState::Closing;
        if (reason == TeardownReason::Shutdown)
            registry.forgetSession(session.id);
        else
            registry.releaseAll(session.id);
    }

    session.state = SessionState::Closed;

    debug("%s ended: %s", session.describe(), showTeardownReason(reason));

    return reason;
}

} // namespace gcrelay::relay
