#pragma once

///@file

namespace gcrelay {

/**
 * Process-wide set-up shared by the test executables. Call before
 * `RUN_ALL_TESTS()`.
 */
int testMainInit(int argc, char ** argv);

} // namespace gcrelay
