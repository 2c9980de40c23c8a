#pragma once
///@file

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "gcrelay/store/store-dir-config.hh"
#include "gcrelay/util/file-system.hh"

namespace gcrelay {

/**
 * A fixture providing a private store directory, so that tests can
 * create the store objects they register.
 */
class LibStoreTest : public virtual ::testing::Test
{
protected:
    AutoDelete tmpDir;

    StoreDirConfig store;

    LibStoreTest();

    /**
     * A store path with a hash derived from `name`. The store object is
     * not created.
     */
    StorePath makeStorePath(std::string_view name) const;

    /**
     * Like `makeStorePath()`, but also create the store object.
     */
    StorePath addStorePath(std::string_view name) const;
};

} // namespace gcrelay
