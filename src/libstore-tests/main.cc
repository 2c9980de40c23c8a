#include <gtest/gtest.h>

#include "gcrelay/store/tests/test-main.hh"

using namespace gcrelay;

int main(int argc, char ** argv)
{
    auto res = testMainInit(argc, argv);
    if (res)
        return res;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
