#include "gcrelay/store/tests/libstore.hh"
#include "gcrelay/util/hash.hh"

namespace gcrelay {

LibStoreTest::LibStoreTest()
    : tmpDir(createTempDir("", "gcrelay-test"))
    , store(tmpDir.path().string() + "/store")
{
    createDirs(store.storeDir);
}

StorePath LibStoreTest::makeStorePath(std::string_view name) const
{
    return StorePath(hashString(HashAlgorithm::SHA1, name), name);
}

StorePath LibStoreTest::addStorePath(std::string_view name) const
{
    auto path = makeStorePath(name);
    createDirs(store.printStorePath(path));
    return path;
}

} // namespace gcrelay
