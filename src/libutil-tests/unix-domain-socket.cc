#include <gtest/gtest.h>

#include "gcrelay/util/file-descriptor.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/serialise.hh"
#include "gcrelay/util/unix-domain-socket.hh"

#include <sys/socket.h>

namespace gcrelay {

/* ----------------------------------------------------------------------------
 * createUnixDomainSocket / connect
 * --------------------------------------------------------------------------*/

TEST(UnixDomainSocket, connectAndExchange)
{
    AutoDelete tmpDir(createTempDir());
    auto socketPath = tmpDir.path() / "socket";

    auto listener = createUnixDomainSocket(socketPath, 0600);
    ASSERT_TRUE(pathExists(socketPath));

    auto client = connect(socketPath);

    AutoCloseFD server(accept(listener.get(), nullptr, nullptr));
    ASSERT_TRUE(server);

    writeFull(client.get(), "hello\n");
    FdSource from(server.get());
    std::string buf(6, '\0');
    from(buf.data(), buf.size());
    ASSERT_EQ(buf, "hello\n");
}

TEST(UnixDomainSocket, bindReplacesStaleSocket)
{
    AutoDelete tmpDir(createTempDir());
    auto socketPath = tmpDir.path() / "socket";

    {
        auto listener = createUnixDomainSocket(socketPath, 0600);
    }

    ASSERT_NO_THROW(createUnixDomainSocket(socketPath, 0600));
}

TEST(UnixDomainSocket, connectToMissingSocketFails)
{
    AutoDelete tmpDir(createTempDir());

    ASSERT_THROW(connect(tmpDir.path() / "missing"), SysError);
}

TEST(UnixDomainSocket, pathTooLong)
{
    auto socketPath = std::filesystem::path("/tmp") / std::string(200, 'x');

    ASSERT_THROW(connect(socketPath), Error);
}

} // namespace gcrelay
