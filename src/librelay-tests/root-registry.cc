#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "relay-tests.hh"

#include "gcrelay/relay/root-registry.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/finally.hh"

#include <thread>

namespace gcrelay::relay {

/**
 * A materializer whose operations can be made to fail, and which
 * records whether two operations on the same marker ever overlapped.
 */
class TestMaterializer : public RootMaterializer
{
    Sync<std::set<std::string>> busy;

    void enter(const std::string & name)
    {
        if (!busy.lock()->insert(name).second)
            overlapped = true;
    }

    void leave(const std::string & name)
    {
        busy.lock()->erase(name);
    }

public:

    using RootMaterializer::RootMaterializer;

    std::atomic<bool> failCreate{false};
    std::atomic<bool> failRemove{false};
    std::atomic<bool> overlapped{false};
    std::atomic<size_t> creates{0};

    void create(const StorePath & path) override
    {
        auto name = markerName(path);
        enter(name);
        Finally done([&]() { leave(name); });
        if (failCreate)
            throw MaterializationError(EACCES, "creating root marker for '%s'", getStoreConfig().printStorePath(path));
        creates++;
        RootMaterializer::create(path);
    }

    void remove(const StorePath & path) override
    {
        auto name = markerName(path);
        enter(name);
        Finally done([&]() { leave(name); });
        if (failRemove)
            throw MaterializationError(EACCES, "removing root marker %s", name);
        RootMaterializer::removeMarker(name);
    }

    void removeMarker(std::string_view name) override
    {
        if (failRemove)
            throw MaterializationError(EACCES, "removing root marker %s", name);
        RootMaterializer::removeMarker(name);
    }
};

class RootRegistryTest : public RelayTest
{
protected:
    TestMaterializer testMaterializer{store, rootsDir};
};

/* ----------------------------------------------------------------------------
 * acquire / release
 * --------------------------------------------------------------------------*/

TEST_F(RootRegistryTest, acquireCreatesMarker)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("hello");

    registry.acquire(path, 1);

    ASSERT_TRUE(testMaterializer.exists(path));
    ASSERT_EQ(registry.size(), 1u);
    ASSERT_EQ(registry.owners(path), SessionIds{1});
    ASSERT_EQ(registry.heldBy(1), StorePathSet{path});
}

TEST_F(RootRegistryTest, acquireIsIdempotent)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("hello");

    registry.acquire(path, 1);
    registry.acquire(path, 1);

    ASSERT_EQ(testMaterializer.creates, 1u);
    ASSERT_EQ(registry.owners(path), SessionIds{1});

    /* One release undoes any number of acquires. */
    ASSERT_TRUE(registry.release(path, 1));
    ASSERT_FALSE(testMaterializer.exists(path));
}

TEST_F(RootRegistryTest, sharedPath)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("hello");

    registry.acquire(path, 1);
    registry.acquire(path, 2);
    ASSERT_EQ(testMaterializer.creates, 1u);
    ASSERT_EQ(registry.owners(path), (SessionIds{1, 2}));

    ASSERT_TRUE(registry.release(path, 1));
    ASSERT_TRUE(testMaterializer.exists(path));
    ASSERT_EQ(registry.owners(path), SessionIds{2});

    ASSERT_TRUE(registry.release(path, 2));
    ASSERT_FALSE(testMaterializer.exists(path));
    ASSERT_EQ(registry.size(), 0u);
}

TEST_F(RootRegistryTest, releaseNotHeld)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("hello");

    ASSERT_FALSE(registry.release(path, 1));

    registry.acquire(path, 1);
    ASSERT_FALSE(registry.release(path, 2));
    ASSERT_TRUE(testMaterializer.exists(path));
}

TEST_F(RootRegistryTest, releaseAll)
{
    RootRegistry registry(testMaterializer, {});
    auto a = addStorePath("a");
    auto b = addStorePath("b");

    registry.acquire(a, 1);
    registry.acquire(b, 1);
    registry.acquire(b, 2);

    registry.releaseAll(1);

    ASSERT_FALSE(testMaterializer.exists(a));
    ASSERT_TRUE(testMaterializer.exists(b));
    ASSERT_TRUE(registry.heldBy(1).empty());
    ASSERT_EQ(registry.owners(b), SessionIds{2});
}

TEST_F(RootRegistryTest, registryFull)
{
    RootRegistry registry(testMaterializer, {.maxRoots = 2});
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    auto c = addStorePath("c");

    registry.acquire(a, 1);
    registry.acquire(b, 1);
    ASSERT_THROW(registry.acquire(c, 1), RegistryFull);
    ASSERT_FALSE(testMaterializer.exists(c));

    /* Sharing a held path does not count against the limit. */
    registry.acquire(a, 2);
    ASSERT_EQ(registry.owners(a), (SessionIds{1, 2}));

    registry.release(b, 1);
    registry.acquire(c, 1);
    ASSERT_EQ(registry.size(), 2u);
}

TEST_F(RootRegistryTest, failedCreateRecordsNothing)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("hello");

    testMaterializer.failCreate = true;
    ASSERT_THROW(registry.acquire(path, 1), MaterializationError);
    ASSERT_EQ(registry.size(), 0u);
    ASSERT_TRUE(registry.heldBy(1).empty());

    testMaterializer.failCreate = false;
    registry.acquire(path, 1);
    ASSERT_TRUE(testMaterializer.exists(path));
}

TEST_F(RootRegistryTest, failedRemoveIsRetried)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("hello");

    registry.acquire(path, 1);

    testMaterializer.failRemove = true;
    ASSERT_TRUE(registry.release(path, 1));
    ASSERT_EQ(registry.size(), 0u);
    ASSERT_TRUE(testMaterializer.exists(path));
    ASSERT_EQ(registry.sweepBacklog(), 1u);

    registry.sweep();
    ASSERT_EQ(registry.sweepBacklog(), 1u);

    testMaterializer.failRemove = false;
    registry.sweep();
    ASSERT_EQ(registry.sweepBacklog(), 0u);
    ASSERT_FALSE(testMaterializer.exists(path));
}

TEST_F(RootRegistryTest, reacquireCancelsFailedRemoval)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("hello");

    registry.acquire(path, 1);
    testMaterializer.failRemove = true;
    registry.release(path, 1);
    testMaterializer.failRemove = false;

    registry.acquire(path, 2);
    ASSERT_EQ(registry.sweepBacklog(), 0u);

    registry.sweep();
    ASSERT_TRUE(testMaterializer.exists(path));
}

/* ----------------------------------------------------------------------------
 * forgetSession / reconcile / sweep
 * --------------------------------------------------------------------------*/

TEST_F(RootRegistryTest, forgetSessionKeepsMarkers)
{
    RootRegistry registry(testMaterializer, {});
    auto a = addStorePath("a");
    auto b = addStorePath("b");

    registry.acquire(a, 1);
    registry.acquire(b, 1);
    registry.acquire(b, 2);

    registry.forgetSession(1);

    ASSERT_TRUE(registry.heldBy(1).empty());
    ASSERT_TRUE(registry.owners(a).empty());
    ASSERT_EQ(registry.owners(b), SessionIds{2});
    ASSERT_EQ(registry.size(), 1u);
    ASSERT_TRUE(testMaterializer.exists(a));
    ASSERT_TRUE(testMaterializer.exists(b));
}

TEST_F(RootRegistryTest, reconcileAndSweep)
{
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    testMaterializer.create(a);
    testMaterializer.create(b);
    auto tempLink = rootsDir / (".0_" + testMaterializer.markerName(a));
    createSymlink(printed(a), tempLink.string());

    RootRegistry registry(testMaterializer, {.gracePeriod = std::chrono::hours(1)});
    registry.reconcile();

    ASSERT_FALSE(pathExists(tempLink));
    ASSERT_EQ(registry.sweepBacklog(), 2u);
    ASSERT_EQ(registry.size(), 0u);

    /* Within the grace period nothing is removed. */
    registry.sweep();
    ASSERT_TRUE(testMaterializer.exists(a));
    ASSERT_TRUE(testMaterializer.exists(b));

    registry.sweep(RootRegistry::Clock::now() + std::chrono::hours(2));
    ASSERT_FALSE(testMaterializer.exists(a));
    ASSERT_FALSE(testMaterializer.exists(b));
    ASSERT_EQ(registry.sweepBacklog(), 0u);
}

TEST_F(RootRegistryTest, acquireAdoptsStaleMarker)
{
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    testMaterializer.create(a);
    testMaterializer.create(b);

    RootRegistry registry(testMaterializer, {.gracePeriod = std::chrono::hours(1)});
    registry.reconcile();
    ASSERT_EQ(registry.sweepBacklog(), 2u);

    registry.acquire(a, 1);
    ASSERT_EQ(registry.sweepBacklog(), 1u);

    registry.sweep(RootRegistry::Clock::now() + std::chrono::hours(2));
    ASSERT_TRUE(testMaterializer.exists(a));
    ASSERT_FALSE(testMaterializer.exists(b));
}

TEST_F(RootRegistryTest, reconcileSkipsHeldPaths)
{
    RootRegistry registry(testMaterializer, {});
    auto a = addStorePath("a");

    registry.acquire(a, 1);
    registry.reconcile();
    ASSERT_EQ(registry.sweepBacklog(), 0u);

    registry.sweep(RootRegistry::Clock::now() + std::chrono::hours(2));
    ASSERT_TRUE(testMaterializer.exists(a));
}

TEST_F(RootRegistryTest, markersSurviveRestart)
{
    auto a = addStorePath("a");

    {
        RootRegistry registry(testMaterializer, {});
        registry.acquire(a, 1);
        registry.forgetSession(1);
    }

    RootRegistry registry(testMaterializer, {.gracePeriod = std::chrono::hours(1)});
    registry.reconcile();
    ASSERT_EQ(registry.sweepBacklog(), 1u);
    ASSERT_TRUE(testMaterializer.exists(a));
}

TEST_F(RootRegistryTest, sweeperThread)
{
    auto a = addStorePath("a");
    testMaterializer.create(a);

    RootRegistry registry(testMaterializer, {});
    registry.reconcile();
    registry.startSweeper(std::chrono::milliseconds(10));

    ASSERT_TRUE(waitFor([&]() { return registry.sweepBacklog() == 0 && !testMaterializer.exists(a); }));

    registry.stopSweeper();
}

/* ----------------------------------------------------------------------------
 * Concurrency
 * --------------------------------------------------------------------------*/

TEST_F(RootRegistryTest, concurrentSessions)
{
    RootRegistry registry(testMaterializer, {});

    StorePaths paths;
    for (int n = 0; n < 4; ++n)
        paths.push_back(addStorePath(fmt("path-%d", n)));

    std::vector<std::thread> threads;
    for (SessionId session = 1; session <= 8; ++session)
        threads.emplace_back([&, session]() {
            for (int round = 0; round < 200; ++round) {
                auto & path = paths[(session + round) % paths.size()];
                registry.acquire(path, session);
                if (round % 3 == 0)
                    registry.releaseAll(session);
                else
                    registry.release(path, session);
            }
        });

    for (auto & thread : threads)
        thread.join();

    ASSERT_FALSE(testMaterializer.overlapped);
    ASSERT_EQ(registry.size(), 0u);
    ASSERT_TRUE(testMaterializer.listMarkers().empty());
}

TEST_F(RootRegistryTest, concurrentSharedPath)
{
    RootRegistry registry(testMaterializer, {});
    auto path = addStorePath("shared");

    /* Session 0 holds the path throughout, so its marker must never
       disappear. */
    registry.acquire(path, 0);

    std::vector<std::thread> threads;
    for (SessionId session = 1; session <= 8; ++session)
        threads.emplace_back([&, session]() {
            for (int round = 0; round < 200; ++round) {
                registry.acquire(path, session);
                registry.release(path, session);
            }
        });

    for (auto & thread : threads)
        thread.join();

    ASSERT_FALSE(testMaterializer.overlapped);
    ASSERT_EQ(registry.owners(path), SessionIds{0});
    ASSERT_TRUE(testMaterializer.exists(path));
    ASSERT_EQ(testMaterializer.creates, 1u);
}

#ifndef COVERAGE

RC_GTEST_FIXTURE_PROP(
    RootRegistryTest, prop_ownership_matches_model, (const std::vector<std::tuple<bool, uint8_t, uint8_t>> & ops))
{
    RootRegistry registry(testMaterializer, {});

    StorePaths paths;
    for (int n = 0; n < 3; ++n)
        paths.push_back(addStorePath(fmt("path-%d", n)));

    std::map<StorePath, SessionIds> model;

    for (auto & [acquire, s, p] : ops) {
        SessionId session = s % 3;
        auto & path = paths[p % paths.size()];
        if (acquire) {
            registry.acquire(path, session);
            model[path].insert(session);
        } else {
            bool held = model[path].erase(session);
            RC_ASSERT(registry.release(path, session) == held);
        }
    }

    for (auto & path : paths) {
        RC_ASSERT(registry.owners(path) == model[path]);
        RC_ASSERT(testMaterializer.exists(path) == !model[path].empty());
    }
}

#endif

} // namespace gcrelay::relay
