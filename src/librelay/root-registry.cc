#include "gcrelay/relay/root-registry.hh"
#include "gcrelay/util/finally.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"
#include "gcrelay/util/util.hh"

namespace gcrelay::relay {

RootRegistry::RootRegistry(RootMaterializer & materializer, Options options)
    : materializer(materializer)
    , options(std::move(options))
{
}

RootRegistry::~RootRegistry()
{
    try {
        stopSweeper();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void RootRegistry::waitUntilIdle(Sync<State>::WriteLock & state, const std::string & name)
{
    while (state->pending.count(name))
        state.wait(pendingDone);
}

void RootRegistry::clearPending(const std::string & name)
{
    {
        auto state(state_.lock());
        state->pending.erase(name);
    }
    pendingDone.notify_all();
}

void RootRegistry::acquire(const StorePath & path, SessionId session)
{
    auto name = materializer.markerName(path);
    std::optional<Clock::time_point> staleDeadline;

    {
        auto state(state_.lock());
        waitUntilIdle(state, name);

        if (auto owners = get(state->entries, path)) {
            if (owners->insert(session).second)
                state->sessions[session].insert(path);
            return;
        }

        if (options.maxRoots && state->entries.size() + state->creating >= options.maxRoots)
            throw RegistryFull(
                "cannot hold '%s': the limit of %d held paths has been reached",
                materializer.getStoreConfig().printStorePath(path),
                options.maxRoots);

        state->pending.insert(name);
        state->creating++;

        if (auto deadline = get(state->staleMarkers, name)) {
            staleDeadline = *deadline;
            state->staleMarkers.erase(name);
        }
        state->failedRemovals.erase(name);
    }

    Finally done([&]() {
        {
            auto state(state_.lock());
            state->creating--;
        }
        clearPending(name);
    });

    try {
        materializer.create(path);
    } catch (...) {
        /* Leave a marker adopted from a previous run to the sweep. */
        if (staleDeadline) {
            auto state(state_.lock());
            state->staleMarkers.emplace(name, *staleDeadline);
        }
        throw;
    }

    if (staleDeadline)
        debug("adopted root marker %s for '%s'", name, materializer.getStoreConfig().printStorePath(path));

    auto state(state_.lock());
    state->entries[path].insert(session);
    state->sessions[session].insert(path);
}

bool RootRegistry::release(const StorePath & path, SessionId session)
{
    auto name = materializer.markerName(path);

    {
        auto state(state_.lock());
        waitUntilIdle(state, name);

        auto i = state->entries.find(path);
        if (i == state->entries.end() || !i->second.erase(session))
            return false;

        if (auto held = get(state->sessions, session)) {
            held->erase(path);
            if (held->empty())
                state->sessions.erase(session);
        }

        if (!i->second.empty())
            return true;

        state->entries.erase(i);
        state->pending.insert(name);
    }

    Finally done([&]() { clearPending(name); });

    try {
        materializer.remove(path);
    } catch (Error & e) {
        warn(
            "failed to remove the root marker of '%s', will retry: %s",
            materializer.getStoreConfig().printStorePath(path),
            e.msg());
        auto state(state_.lock());
        state->failedRemovals.insert(name);
    }

    return true;
}

void RootRegistry::releaseAll(SessionId session)
{
    for (auto & path : heldBy(session))
        release(path, session);
}

void RootRegistry::forgetSession(SessionId session)
{
    auto state(state_.lock());

    auto i = state->sessions.find(session);
    if (i == state->sessions.end())
        return;

    for (auto & path : i->second) {
        auto j = state->entries.find(path);
        if (j == state->entries.end())
            continue;
        j->second.erase(session);
        if (j->second.empty())
            state->entries.erase(j);
    }

    state->sessions.erase(i);
}

SessionIds RootRegistry::owners(const StorePath & path) const
{
    auto state(state_.readLock());
    auto i = state->entries.find(path);
    return i == state->entries.end() ? SessionIds{} : i->second;
}

StorePathSet RootRegistry::heldBy(SessionId session) const
{
    auto state(state_.readLock());
    auto i = state->sessions.find(session);
    return i == state->sessions.end() ? StorePathSet{} : i->second;
}

size_t RootRegistry::size() const
{
    return state_.readLock()->entries.size();
}

size_t RootRegistry::sweepBacklog() const
{
    auto state(state_.readLock());
    return state->staleMarkers.size() + state->failedRemovals.size();
}

void RootRegistry::reconcile()
{
    auto & rootsDir = materializer.getRootsDir();

    if (auto removed = materializer.removeTempLinks())
        printInfo("removed %d temporary links from %s", removed, rootsDir);

    auto markers = materializer.listMarkers();
    auto deadline = Clock::now() + options.gracePeriod;
    size_t found = 0;

    {
        auto state(state_.lock());

        std::set<std::string> held;
        for (auto & [path, owners] : state->entries)
            held.insert(materializer.markerName(path));

        for (auto & [name, target] : markers) {
            if (held.count(name) || state->pending.count(name))
                continue;
            vomit("root marker %s -> '%s' is a stale candidate", name, target);
            if (state->staleMarkers.emplace(name, deadline).second)
                found++;
        }
    }

    if (found)
        printInfo(
            "found %d root markers from a previous run in %s; they are removed in %d seconds unless registered again",
            found,
            rootsDir,
            std::chrono::duration_cast<std::chrono::seconds>(options.gracePeriod).count());
}

void RootRegistry::sweep(Clock::time_point now)
{
    std::vector<std::string> toRemove;

    {
        auto state(state_.lock());

        for (auto i = state->staleMarkers.begin(); i != state->staleMarkers.end();) {
            if (i->second <= now && !state->pending.count(i->first)) {
                toRemove.push_back(i->first);
                state->pending.insert(i->first);
                i = state->staleMarkers.erase(i);
            } else
                ++i;
        }

        for (auto i = state->failedRemovals.begin(); i != state->failedRemovals.end();) {
            if (!state->pending.count(*i)) {
                toRemove.push_back(*i);
                state->pending.insert(*i);
                i = state->failedRemovals.erase(i);
            } else
                ++i;
        }
    }

    for (auto & name : toRemove) {
        Finally done([&]() { clearPending(name); });
        try {
            materializer.removeMarker(name);
            debug("swept root marker %s", name);
        } catch (Error & e) {
            warn("failed to remove root marker %s, will retry: %s", name, e.msg());
            auto state(state_.lock());
            state->failedRemovals.insert(name);
        }
    }
}

void RootRegistry::startSweeper(std::chrono::milliseconds interval)
{
    {
        auto state(state_.lock());
        state->quit = false;
    }

    sweeperThread = std::thread([this, interval]() {
        while (true) {
            {
                auto state(state_.lock());
                if (state->quit)
                    break;
                state.wait_for(wakeup, interval, [&]() { return state->quit; });
                if (state->quit)
                    break;
            }
            try {
                sweep();
            } catch (Interrupted &) {
                break;
            } catch (Error & e) {
                logError(e.info());
            }
        }
    });
}

void RootRegistry::stopSweeper()
{
    {
        auto state(state_.lock());
        state->quit = true;
    }
    wakeup.notify_all();
    if (sweeperThread.joinable())
        sweeperThread.join();
}

} // namespace gcrelay::relay
