#include <cstdlib>
#include <csignal>

#include "gcrelay/util/environment-variables.hh"
#include "gcrelay/util/logging.hh"

#include "gcrelay/store/tests/test-main.hh"

namespace gcrelay {

int testMainInit(int argc, char ** argv)
{
    // Writes to sockets whose peer has gone away must fail with EPIPE
    // instead of killing the test runner.
    signal(SIGPIPE, SIG_IGN);

    // Keep the expected warnings out of the test output.
    if (!getEnv("_GCRELAY_TEST_VERBOSE"))
        verbosity = lvlError;

    return EXIT_SUCCESS;
}

} // namespace gcrelay
