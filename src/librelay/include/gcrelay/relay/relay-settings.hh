#pragma once
///@file

#include "gcrelay/relay/relay-protocol.hh"
#include "gcrelay/util/configuration.hh"
#include "gcrelay/util/vsock.hh"

#include <chrono>

namespace gcrelay::relay {

/**
 * Where the relay gets its listening sockets from.
 */
enum struct ListenMode {
    /**
     * `Activated` if the service manager passed sockets, `Bound`
     * otherwise.
     */
    Auto,
    /**
     * Use the sockets passed through `LISTEN_FDS`.
     */
    Activated,
    /**
     * Bind a vsock socket to `listen-cid`:`listen-port`.
     */
    Bound,
};

} // namespace gcrelay::relay

namespace gcrelay {

template<>
relay::ListenMode BaseSetting<relay::ListenMode>::parse(const std::string & str) const;
template<>
std::string BaseSetting<relay::ListenMode>::to_string() const;

} // namespace gcrelay

namespace gcrelay::relay {

/**
 * Settings of the host-side relay, read from `relay.conf`.
 */
struct RelaySettings : public Config
{
    RelaySettings();

    Setting<ListenMode> listenMode{
        this,
        ListenMode::Auto,
        "listen-mode",
        R"(
          Where to get the listening sockets from: `activated` uses the
          sockets passed by the service manager (`LISTEN_FDS`), `bound`
          binds a vsock socket to `listen-cid` and `listen-port`, and
          `auto` picks `activated` if sockets were passed.
        )"};

    Setting<unsigned int> listenCid{
        this,
        vsockCidAny,
        "listen-cid",
        R"(
          The context identifier to bind to in `bound` mode. The default
          accepts connections on any CID.
        )"};

    Setting<unsigned int> listenPort{
        this, defaultRelayPort, "listen-port", "The vsock port to bind to in `bound` mode."};

    PathSetting storeDir{
        this,
        "/nix/store",
        "store-dir",
        R"(
          The store directory of the host. Only direct children of this
          directory can be registered.
        )"};

    PathSetting rootsDir{
        this,
        "/nix/var/nix/gcroots/gcroot-relay",
        "roots-dir",
        R"(
          The directory in which root markers are created. It must be
          scanned by the host's garbage collector, i.e. it must lie below
          the collector's `gcroots` directory. The relay owns this
          directory: markers it does not know about are removed after
          `reconcile-grace-period`.
        )"};

    Setting<size_t> maxSessions{
        this,
        64,
        "max-sessions",
        R"(
          The maximum number of concurrent client sessions. Connections
          beyond this limit are answered with a `ServerBusy` error and
          closed.
        )"};

    Setting<size_t> maxRoots{
        this,
        65536,
        "max-roots",
        R"(
          The maximum number of distinct store paths the relay holds at
          the same time. Registering a new path beyond this limit fails
          with `RegistryFull`. 0 means no limit.
        )"};

    Setting<unsigned int> idleTimeout{
        this,
        120,
        "idle-timeout",
        R"(
          Number of seconds after which a session that has sent no frame
          is closed and its roots released. 0 disables the timeout.
        )"};

    Setting<unsigned int> reconcileGracePeriod{
        this,
        600,
        "reconcile-grace-period",
        R"(
          Number of seconds during which root markers left over from a
          previous run are kept, giving reconnecting clients the chance
          to register them again.
        )"};

    Setting<unsigned int> sweepInterval{
        this,
        60,
        "sweep-interval",
        R"(
          Number of seconds between runs of the background sweep that
          reclaims stale markers and retries failed removals.
        )"};

    Setting<unsigned int> shutdownTimeout{
        this,
        10,
        "shutdown-timeout",
        R"(
          Number of seconds that open sessions are given to finish after
          the relay is asked to stop, before their connections are shut
          down.
        )"};

    Setting<size_t> maxFrameSize{
        this,
        4096,
        "max-frame-size",
        R"(
          The maximum payload size of a frame, in bytes. Larger frames are
          a protocol error.
        )"};

    Setting<bool> strictUnregister{
        this,
        false,
        "strict-unregister",
        R"(
          If set, unregistering a path that the session does not hold is
          answered with a `PathNotHeld` error instead of being silently
          acknowledged.
        )"};

    std::chrono::seconds getIdleTimeout() const
    {
        return std::chrono::seconds(idleTimeout.get());
    }
};

/**
 * Settings of the guest-side client, read from `client.conf`.
 */
struct ClientSettings : public Config
{
    Setting<unsigned int> relayCid{
        this, vsockCidHost, "relay-cid", "The context identifier of the relay. The default is the host."};

    Setting<unsigned int> relayPort{this, defaultRelayPort, "relay-port", "The vsock port of the relay."};

    PathSetting storeDir{this, "/nix/store", "store-dir", "The store directory shared with the host."};

    PathSetting gcrootsDir{
        this,
        "/nix/var/nix/gcroots",
        "gcroots-dir",
        R"(
          The guest's GC roots directory. Every store path reachable from
          a symlink below it is registered with the relay.
        )"};

    Setting<std::string> clientId{
        this,
        "",
        "client-id",
        R"(
          An identifier sent to the relay in a `HELLO` frame, such as the
          UUID of the virtual machine. It only appears in the relay's
          logs. Empty means no `HELLO` is sent.
        )"};

    Setting<unsigned int> pingInterval{
        this,
        30,
        "ping-interval",
        R"(
          Number of seconds between keep-alive `PING` frames. Must be
          lower than the relay's `idle-timeout`.
        )"};

    Setting<unsigned int> replyTimeout{
        this,
        10,
        "reply-timeout",
        R"(
          Number of seconds to wait for the relay to accept a connection
          or to answer a request. A relay that does not answer in time is
          treated as unreachable, and the client reconnects.
        )"};

    Setting<unsigned int> scanInterval{
        this, 300, "scan-interval", "Number of seconds between rescans of `gcroots-dir`."};

    Setting<unsigned int> retryMinDelay{
        this, 1, "retry-min-delay", "Initial delay in seconds before reconnecting to the relay."};

    Setting<unsigned int> retryMaxDelay{
        this,
        60,
        "retry-max-delay",
        R"(
          Maximum delay in seconds between reconnection attempts. The
          delay doubles after every failed attempt up to this value.
        )"};
};

extern RelaySettings relaySettings;

extern ClientSettings clientSettings;

/**
 * The directory containing `relay.conf` and `client.conf`:
 * `$GCROOT_RELAY_CONF_DIR`, or `/etc/gcroot-relay`.
 */
Path getConfDir();

/**
 * Apply the configuration file `fileName` in the configuration
 * directory to `config`, if it exists.
 */
void loadConfFile(AbstractConfig & config, std::string_view fileName);

} // namespace gcrelay::relay
