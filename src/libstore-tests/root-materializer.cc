#include <gtest/gtest.h>

#include "gcrelay/store/root-materializer.hh"
#include "gcrelay/store/tests/libstore.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/hash.hh"

namespace gcrelay {

class RootMaterializerTest : public LibStoreTest
{
protected:
    std::filesystem::path rootsDir = tmpDir.path() / "gcroots" / "relay";

    RootMaterializer materializer{store, rootsDir};
};

/* ----------------------------------------------------------------------------
 * create / remove
 * --------------------------------------------------------------------------*/

TEST_F(RootMaterializerTest, markerName)
{
    auto path = makeStorePath("hello");
    auto expected =
        hashString(HashAlgorithm::SHA1, store.printStorePath(path)).to_string(HashFormat::Nix32, false);
    ASSERT_EQ(materializer.markerName(path), expected);
    ASSERT_EQ(materializer.markerPath(path), rootsDir / expected);
    ASSERT_TRUE(RootMaterializer::isMarkerName(expected));
}

TEST_F(RootMaterializerTest, createPointsAtStorePath)
{
    auto path = addStorePath("hello");

    ASSERT_FALSE(materializer.exists(path));
    materializer.create(path);
    ASSERT_TRUE(materializer.exists(path));

    ASSERT_EQ(readLink(materializer.markerPath(path).string()), store.printStorePath(path));
}

TEST_F(RootMaterializerTest, createsRootsDir)
{
    ASSERT_FALSE(pathExists(rootsDir.string()));
    materializer.create(addStorePath("hello"));
    ASSERT_TRUE(pathExists(rootsDir.string()));
}

TEST_F(RootMaterializerTest, createIsIdempotent)
{
    auto path = addStorePath("hello");

    materializer.create(path);
    materializer.create(path);

    auto markers = materializer.listMarkers();
    ASSERT_EQ(markers.size(), 1u);
    ASSERT_EQ(markers.begin()->first, materializer.markerName(path));
    ASSERT_EQ(markers.begin()->second, store.printStorePath(path));
}

TEST_F(RootMaterializerTest, createLeavesNoTempLinks)
{
    materializer.create(addStorePath("hello"));
    materializer.create(addStorePath("world"));

    for (auto & i : DirectoryIterator{rootsDir})
        ASSERT_FALSE(RootMaterializer::isTempName(i.path().filename().string()));
    ASSERT_EQ(materializer.removeTempLinks(), 0u);
}

TEST_F(RootMaterializerTest, removeIsIdempotent)
{
    auto path = addStorePath("hello");

    materializer.create(path);
    materializer.remove(path);
    ASSERT_FALSE(materializer.exists(path));

    ASSERT_NO_THROW(materializer.remove(path));
    ASSERT_TRUE(materializer.listMarkers().empty());
}

TEST_F(RootMaterializerTest, removeKeepsOtherMarkers)
{
    auto a = addStorePath("a");
    auto b = addStorePath("b");

    materializer.create(a);
    materializer.create(b);
    materializer.remove(a);

    ASSERT_FALSE(materializer.exists(a));
    ASSERT_TRUE(materializer.exists(b));
}

TEST_F(RootMaterializerTest, createFailsWhenRootsDirIsAFile)
{
    createDirs(rootsDir.parent_path());
    writeFile(rootsDir.string(), "not a directory");

    ASSERT_THROW(materializer.create(addStorePath("hello")), MaterializationError);
}

/* ----------------------------------------------------------------------------
 * names
 * --------------------------------------------------------------------------*/

TEST(RootMaterializerNames, isMarkerName)
{
    ASSERT_TRUE(RootMaterializer::isMarkerName("kpcd173cq987hw957sx6m0868wv3x6d9"));
    ASSERT_FALSE(RootMaterializer::isMarkerName(""));
    ASSERT_FALSE(RootMaterializer::isMarkerName("kpcd173cq987hw957sx6m0868wv3x6d"));
    ASSERT_FALSE(RootMaterializer::isMarkerName("kpcd173cq987hw957sx6m0868wv3x6d9a"));
    // 'e' is not in the Nix32 alphabet.
    ASSERT_FALSE(RootMaterializer::isMarkerName("kpcd173cq987hw957sx6m0868wv3x6de"));
    ASSERT_FALSE(RootMaterializer::isMarkerName(".0_kpcd173cq987hw957sx6m0868wv3x6d9"));
}

TEST(RootMaterializerNames, isTempName)
{
    ASSERT_TRUE(RootMaterializer::isTempName(".0_kpcd173cq987hw957sx6m0868wv3x6d9"));
    ASSERT_TRUE(RootMaterializer::isTempName(".17_kpcd173cq987hw957sx6m0868wv3x6d9"));
    ASSERT_FALSE(RootMaterializer::isTempName("._kpcd173cq987hw957sx6m0868wv3x6d9"));
    ASSERT_FALSE(RootMaterializer::isTempName(".x_kpcd173cq987hw957sx6m0868wv3x6d9"));
    ASSERT_FALSE(RootMaterializer::isTempName("0_kpcd173cq987hw957sx6m0868wv3x6d9"));
    ASSERT_FALSE(RootMaterializer::isTempName(".0_foo"));
    ASSERT_FALSE(RootMaterializer::isTempName("kpcd173cq987hw957sx6m0868wv3x6d9"));
}

/* ----------------------------------------------------------------------------
 * listMarkers / removeTempLinks
 * --------------------------------------------------------------------------*/

TEST_F(RootMaterializerTest, listMarkersOfMissingDir)
{
    ASSERT_TRUE(materializer.listMarkers().empty());
    ASSERT_EQ(materializer.removeTempLinks(), 0u);
}

TEST_F(RootMaterializerTest, listMarkersIgnoresForeignEntries)
{
    auto path = addStorePath("hello");
    materializer.create(path);

    createSymlink("/tmp", (rootsDir / "not-a-marker").string());
    writeFile((rootsDir / "kpcd173cq987hw957sx6m0868wv3x6d9").string(), "regular file");

    auto markers = materializer.listMarkers();
    ASSERT_EQ(markers.size(), 1u);
    ASSERT_TRUE(markers.contains(materializer.markerName(path)));
}

TEST_F(RootMaterializerTest, removeTempLinks)
{
    auto path = addStorePath("hello");
    materializer.create(path);

    auto name = materializer.markerName(path);
    createSymlink(store.printStorePath(path), (rootsDir / (".0_" + name)).string());
    createSymlink(store.printStorePath(path), (rootsDir / (".3_" + name)).string());

    ASSERT_EQ(materializer.removeTempLinks(), 2u);
    ASSERT_FALSE(pathExists((rootsDir / (".0_" + name)).string()));
    ASSERT_TRUE(materializer.exists(path));
    ASSERT_EQ(materializer.listMarkers().size(), 1u);
}

TEST_F(RootMaterializerTest, removeMarkerByName)
{
    auto path = addStorePath("hello");
    materializer.create(path);

    materializer.removeMarker(materializer.markerName(path));
    ASSERT_FALSE(materializer.exists(path));
    ASSERT_NO_THROW(materializer.removeMarker(materializer.markerName(path)));
}

} // namespace gcrelay
