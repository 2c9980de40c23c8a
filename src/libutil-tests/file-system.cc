#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/util.hh"
#include "gcrelay/util/types.hh"

#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

namespace gcrelay {

/* ----------- tests for file-system.hh -------------------------------------*/

/* ----------------------------------------------------------------------------
 * absPath
 * --------------------------------------------------------------------------*/

TEST(absPath, doesntChangeRoot)
{
    auto p = absPath("/");

    ASSERT_EQ(p, "/");
}

TEST(absPath, usesOptionalBasePathWhenGiven)
{
    auto p = absPath("foo", "/some/dir");

    ASSERT_EQ(p, "/some/dir/foo");
}

TEST(absPath, pathIsCanonicalised)
{
    auto p = absPath("/some/path/with/trailing/dot/.");

    ASSERT_EQ(p, "/some/path/with/trailing/dot");
}

/* ----------------------------------------------------------------------------
 * canonPath
 * --------------------------------------------------------------------------*/

TEST(canonPath, removesTrailingSlashes)
{
    ASSERT_EQ(canonPath("/this/is/a/path//"), "/this/is/a/path");
}

TEST(canonPath, removesDots)
{
    ASSERT_EQ(canonPath("/this/./is/a/path/./"), "/this/is/a/path");
}

TEST(canonPath, removesDots2)
{
    ASSERT_EQ(canonPath("/this/a/../is/a////path/foo/.."), "/this/is/a/path");
}

TEST(canonPath, requiresAbsolutePath)
{
    ASSERT_ANY_THROW(canonPath("."));
    ASSERT_ANY_THROW(canonPath(".."));
    ASSERT_ANY_THROW(canonPath("../"));
}

/* ----------------------------------------------------------------------------
 * dirOf
 * --------------------------------------------------------------------------*/

TEST(dirOf, returnsEmptyStringForRoot)
{
    auto p = dirOf("/");

    ASSERT_EQ(p, "/");
}

TEST(dirOf, returnsFirstPathComponent)
{
    auto p1 = dirOf("/dir/");
    ASSERT_EQ(p1, "/dir");
    auto p2 = dirOf("/dir");
    ASSERT_EQ(p2, "/");
    auto p3 = dirOf("/dir/..");
    ASSERT_EQ(p3, "/dir");
    auto p4 = dirOf("/dir/../");
    ASSERT_EQ(p4, "/dir/..");
}

/* ----------------------------------------------------------------------------
 * baseNameOf
 * --------------------------------------------------------------------------*/

TEST(baseNameOf, emptyPath)
{
    auto p1 = baseNameOf("");
    ASSERT_EQ(p1, "");
}

TEST(baseNameOf, pathOnRoot)
{
    auto p1 = baseNameOf("/dir");
    ASSERT_EQ(p1, "dir");
}

TEST(baseNameOf, relativePath)
{
    auto p1 = baseNameOf("dir/foo");
    ASSERT_EQ(p1, "foo");
}

TEST(baseNameOf, pathWithTrailingSlashRoot)
{
    auto p1 = baseNameOf("/");
    ASSERT_EQ(p1, "");
}

TEST(baseNameOf, trailingSlash)
{
    auto p1 = baseNameOf("/dir/");
    ASSERT_EQ(p1, "dir");
}

/* ----------------------------------------------------------------------------
 * pathExists
 * --------------------------------------------------------------------------*/

TEST(pathExists, rootExists)
{
    ASSERT_TRUE(pathExists("/"));
}

TEST(pathExists, bogusPathDoesNotExist)
{
    ASSERT_FALSE(pathExists("/schnitzel/darmstadt/pommes"));
}

/* ----------------------------------------------------------------------------
 * replaceSymlink
 * --------------------------------------------------------------------------*/

TEST(replaceSymlink, createsAndReplacesLink)
{
    AutoDelete tmpDir(createTempDir());
    auto link = tmpDir.path() / "link";

    replaceSymlink("/first/target", link);
    ASSERT_EQ(readLink(link.string()), "/first/target");

    replaceSymlink("/second/target", link);
    ASSERT_EQ(readLink(link.string()), "/second/target");
}

TEST(replaceSymlink, leavesNoTemporaryLinks)
{
    AutoDelete tmpDir(createTempDir());
    auto link = tmpDir.path() / "link";

    replaceSymlink("/target", link);
    replaceSymlink("/target", link);

    size_t entries = 0;
    for (auto & entry : DirectoryIterator(tmpDir.path())) {
        EXPECT_EQ(entry.path().filename().string(), "link");
        ++entries;
    }
    ASSERT_EQ(entries, 1u);
}

TEST(replaceSymlink, removesTemporaryLinkOnFailure)
{
    AutoDelete tmpDir(createTempDir());
    auto link = tmpDir.path() / "link";

    /* A symlink cannot be renamed over a directory. */
    createDirs(link);
    ASSERT_THROW(replaceSymlink("/target", link), SysError);

    size_t entries = 0;
    for (auto & entry : DirectoryIterator(tmpDir.path())) {
        EXPECT_EQ(entry.path().filename().string(), "link");
        ++entries;
    }
    ASSERT_EQ(entries, 1u);
}

TEST(replaceSymlink, failsInMissingDirectory)
{
    AutoDelete tmpDir(createTempDir());

    ASSERT_THROW(replaceSymlink("/target", tmpDir.path() / "missing" / "link"), SysError);
}

/* ----------------------------------------------------------------------------
 * AutoDelete
 * --------------------------------------------------------------------------*/

TEST(AutoDelete, deletesRecursively)
{
    Path dir;
    {
        AutoDelete tmpDir(createTempDir());
        dir = tmpDir.path().string();
        createDirs(tmpDir.path() / "a" / "b");
        writeFile((tmpDir.path() / "a" / "b" / "file").string(), "contents");
        ASSERT_TRUE(pathExists(dir));
    }
    ASSERT_FALSE(pathExists(dir));
}

} // namespace gcrelay
