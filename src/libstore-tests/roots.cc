#include <gtest/gtest.h>

#include "gcrelay/store/roots.hh"
#include "gcrelay/store/tests/libstore.hh"
#include "gcrelay/util/file-system.hh"

namespace gcrelay {

class RootsTest : public LibStoreTest
{
protected:
    std::filesystem::path gcrootsDir = tmpDir.path() / "gcroots";

    RootsTest()
    {
        createDirs(gcrootsDir);
    }

    std::string link(const std::string & name, const std::string & target)
    {
        auto path = gcrootsDir / name;
        createDirs(path.parent_path());
        createSymlink(target, path.string());
        return path.string();
    }
};

TEST_F(RootsTest, emptyDir)
{
    ASSERT_TRUE(roots::findRoots(store, gcrootsDir).empty());
}

TEST_F(RootsTest, missingDir)
{
    ASSERT_TRUE(roots::findRootPaths(store, tmpDir.path() / "does-not-exist").empty());
}

TEST_F(RootsTest, directLink)
{
    auto path = addStorePath("hello");
    auto l = link("hello", store.printStorePath(path));

    auto found = roots::findRoots(store, gcrootsDir);
    ASSERT_EQ(found.size(), 1u);
    ASSERT_EQ(found.begin()->first, path);
    ASSERT_EQ(found.begin()->second, StringSet{l});
}

TEST_F(RootsTest, linkIntoStoreObject)
{
    auto path = addStorePath("hello");
    link("hello-bin", store.printStorePath(path) + "/bin/hello");

    ASSERT_EQ(roots::findRootPaths(store, gcrootsDir), StorePathSet{path});
}

TEST_F(RootsTest, relativeLink)
{
    auto path = addStorePath("hello");
    link("hello", "../store/" + std::string(path.to_string()));

    ASSERT_EQ(roots::findRootPaths(store, gcrootsDir), StorePathSet{path});
}

TEST_F(RootsTest, linkChain)
{
    auto path = addStorePath("hello");
    auto profiles = tmpDir.path() / "profiles";
    createDirs(profiles);
    createSymlink(store.printStorePath(path), (profiles / "profile-1-link").string());
    createSymlink("profile-1-link", (profiles / "profile").string());
    link("profile", (profiles / "profile").string());

    ASSERT_EQ(roots::findRootPaths(store, gcrootsDir), StorePathSet{path});
}

TEST_F(RootsTest, subdirectories)
{
    auto a = addStorePath("a");
    auto b = addStorePath("b");
    link("auto/one", store.printStorePath(a));
    link("per-user/root/two", store.printStorePath(b));

    ASSERT_EQ(roots::findRootPaths(store, gcrootsDir), (StorePathSet{a, b}));
}

TEST_F(RootsTest, sharedPathHasAllLinks)
{
    auto path = addStorePath("hello");
    auto l1 = link("one", store.printStorePath(path));
    auto l2 = link("two", store.printStorePath(path));

    auto found = roots::findRoots(store, gcrootsDir);
    ASSERT_EQ(found.size(), 1u);
    ASSERT_EQ(found[path], (StringSet{l1, l2}));
}

TEST_F(RootsTest, ignoresDanglingLinks)
{
    link("dangling", (tmpDir.path() / "nowhere").string());

    ASSERT_TRUE(roots::findRootPaths(store, gcrootsDir).empty());
}

TEST_F(RootsTest, ignoresLinksOutsideStore)
{
    auto file = tmpDir.path() / "file";
    writeFile(file.string(), "");
    link("file", file.string());
    link("dir", tmpDir.path().string());

    ASSERT_TRUE(roots::findRootPaths(store, gcrootsDir).empty());
}

TEST_F(RootsTest, ignoresInvalidStorePaths)
{
    link("bogus", store.storeDir + "/not-a-store-path");

    ASSERT_TRUE(roots::findRootPaths(store, gcrootsDir).empty());
}

TEST_F(RootsTest, ignoresRegularFiles)
{
    writeFile((gcrootsDir / "regular").string(), store.printStorePath(makeStorePath("hello")));

    ASSERT_TRUE(roots::findRootPaths(store, gcrootsDir).empty());
}

TEST_F(RootsTest, ignoresCycles)
{
    auto path = addStorePath("hello");
    link("good", store.printStorePath(path));
    link("a", (gcrootsDir / "b").string());
    link("b", (gcrootsDir / "a").string());

    ASSERT_EQ(roots::findRootPaths(store, gcrootsDir), StorePathSet{path});
}

TEST_F(RootsTest, followLinksToStorePath)
{
    auto path = addStorePath("hello");
    auto l = link("hello", store.printStorePath(path));

    auto res = roots::followLinksToStorePath(store, l);
    ASSERT_TRUE(res);
    ASSERT_EQ(*res, path);

    auto dangling = link("dangling", (tmpDir.path() / "nowhere").string());
    ASSERT_FALSE(roots::followLinksToStorePath(store, dangling));
}

TEST_F(RootsTest, followLinksGivesUp)
{
    auto path = addStorePath("hello");
    createSymlink(store.printStorePath(path), (tmpDir.path() / "l0").string());
    for (int i = 1; i <= 3; ++i)
        createSymlink(
            (tmpDir.path() / ("l" + std::to_string(i - 1))).string(),
            (tmpDir.path() / ("l" + std::to_string(i))).string());

    ASSERT_TRUE(roots::followLinksToStorePath(store, tmpDir.path() / "l3", 3));
    ASSERT_FALSE(roots::followLinksToStorePath(store, tmpDir.path() / "l3", 2));
}

} // namespace gcrelay
