#pragma once
///@file

#include "gcrelay/relay/relay-protocol.hh"
#include "gcrelay/relay/root-registry.hh"
#include "gcrelay/util/file-descriptor.hh"

#include <atomic>
#include <chrono>
#include <optional>

namespace gcrelay::relay {

enum struct SessionState {
    Connected,
    Active,
    Closing,
    Closed,
};

/**
 * Why a session ended.
 */
enum struct TeardownReason {
    /**
     * The client sent `CLOSE`.
     */
    Close,
    EndOfFile,
    TransportError,
    ProtocolError,
    IdleTimeout,
    /**
     * The relay is shutting down. The session's markers are kept.
     */
    Shutdown,
    InternalError,
};

std::string_view showTeardownReason(TeardownReason reason);

struct HandlerOptions
{
    size_t maxFrameSize = 4096;

    /**
     * Close sessions that send nothing for this long. 0 disables the
     * timeout.
     */
    std::chrono::milliseconds idleTimeout{0};

    /**
     * Reply `ERROR(PathNotHeld)` to an `UNREGISTER` of a path the
     * session does not hold.
     */
    bool strictUnregister = false;
};

/**
 * One client connection, as seen by the relay.
 */
struct ClientSession
{
    const SessionId id;

    /**
     * Human-readable description of the peer, e.g. `cid 3`.
     */
    std::string peer;

    /**
     * Identifier announced by the client with `HELLO`.
     */
    std::optional<std::string> clientId;

    SessionState state = SessionState::Connected;

    ClientSession(SessionId id, std::string peer = "")
        : id(id)
        , peer(std::move(peer))
    {
    }

    std::string describe() const;
};

/**
 * Serve the connection `fd` until the client closes it, the connection
 * fails or idles out, the client violates the protocol, or the relay
 * shuts down. Whatever the reason, the paths held by the session are
 * released before this function returns, except when the connection
 * ends after `shuttingDown` has been set, in which case the session is
 * forgotten and its markers are kept.
 *
 * A user interrupt does not end the session: the relay keeps serving
 * it until the drain deadline sets `shuttingDown` and shuts the
 * connection down.
 *
 * A request that fails is answered with an `ERROR` frame and does not
 * end the session.
 */
TeardownReason processConnection(
    RootRegistry & registry,
    const StoreDirConfig & store,
    const HandlerOptions & options,
    ClientSession & session,
    Descriptor fd,
    const std::atomic<bool> & shuttingDown);

} // namespace gcrelay::relay
