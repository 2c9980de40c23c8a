#pragma once
///@file

#include "gcrelay/store/root-materializer.hh"
#include "gcrelay/util/sync.hh"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <set>
#include <thread>

namespace gcrelay::relay {

/**
 * Identifies a client session. Assigned in increasing order when a
 * connection is accepted.
 */
typedef uint64_t SessionId;

typedef std::set<SessionId> SessionIds;

/**
 * The registry already holds `max-roots` distinct paths.
 */
MakeError(RegistryFull, Error);

/**
 * The in-memory record of which sessions hold which store paths, and
 * the only component that creates or removes root markers.
 *
 * A path has a marker exactly while at least one session holds it,
 * except for markers left behind by `forgetSession()` and removals
 * that failed and are waiting to be retried by the sweep.
 *
 * All operations on the same path are serialized: while the marker of
 * a path is being created or removed, other operations on that path
 * wait. Operations on different paths proceed in parallel.
 */
class RootRegistry
{
public:

    using Clock = std::chrono::steady_clock;

    struct Options
    {
        /**
         * Maximum number of distinct held paths. 0 means no limit.
         */
        size_t maxRoots = 0;

        /**
         * How long markers found by `reconcile()` are kept before the
         * sweep removes them.
         */
        std::chrono::milliseconds gracePeriod{0};
    };

private:

    RootMaterializer & materializer;
    const Options options;

    struct State
    {
        std::map<StorePath, SessionIds> entries;
        std::map<SessionId, StorePathSet> sessions;

        /**
         * Names of markers with a filesystem operation in flight.
         */
        std::set<std::string> pending;

        /**
         * Number of paths whose marker is being created, and which
         * therefore count against `maxRoots` without being in
         * `entries` yet.
         */
        size_t creating = 0;

        /**
         * Markers from a previous run, and the time after which the
         * sweep removes them.
         */
        std::map<std::string, Clock::time_point> staleMarkers;

        /**
         * Markers whose removal failed.
         */
        std::set<std::string> failedRemovals;

        bool quit = false;
    };

    Sync<State> state_;

    /**
     * Signalled whenever a marker leaves `pending`.
     */
    std::condition_variable pendingDone;

    std::condition_variable wakeup;

    std::thread sweeperThread;

    void waitUntilIdle(Sync<State>::WriteLock & state, const std::string & name);

    void clearPending(const std::string & name);

public:

    RootRegistry(RootMaterializer & materializer, Options options);

    RootRegistry(const RootRegistry &) = delete;
    RootRegistry & operator=(const RootRegistry &) = delete;

    ~RootRegistry();

    /**
     * Make `session` an owner of `path`. If `path` had no owners, its
     * marker is created first; if that fails, nothing is recorded.
     * Acquiring a path that the session already holds has no effect.
     *
     * @throws RegistryFull if `path` is not held and `maxRoots` paths
     * already are.
     * @throws MaterializationError if the marker cannot be created.
     */
    void acquire(const StorePath & path, SessionId session);

    /**
     * Remove `session` from the owners of `path`. When the last owner
     * goes away the marker is removed. A failed removal is logged and
     * retried by the sweep.
     *
     * @return whether `session` held `path`.
     */
    bool release(const StorePath & path, SessionId session);

    /**
     * Release every path held by `session`.
     */
    void releaseAll(SessionId session);

    /**
     * Drop `session` from every entry without removing any markers.
     * Used when the relay shuts down, so that the markers survive
     * until the next start reconciles them.
     */
    void forgetSession(SessionId session);

    SessionIds owners(const StorePath & path) const;

    StorePathSet heldBy(SessionId session) const;

    /**
     * The number of distinct held paths.
     */
    size_t size() const;

    /**
     * The number of stale markers and failed removals waiting for the
     * sweep.
     */
    size_t sweepBacklog() const;

    /**
     * Adopt the state of the roots directory at startup: temporary
     * links are deleted, and every marker becomes a stale candidate
     * that the sweep removes after the grace period unless a session
     * acquires its path first.
     */
    void reconcile();

    /**
     * Remove the stale markers whose grace period has expired, and
     * retry failed removals.
     */
    void sweep(Clock::time_point now = Clock::now());

    /**
     * Start a thread that calls `sweep()` every `interval`.
     */
    void startSweeper(std::chrono::milliseconds interval);

    void stopSweeper();
};

} // namespace gcrelay::relay
