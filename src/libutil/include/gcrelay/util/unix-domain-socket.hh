#pragma once
///@file

#include "gcrelay/util/types.hh"
#include "gcrelay/util/file-descriptor.hh"

#include <unistd.h>

#include <filesystem>

namespace gcrelay {

/**
 * Create a Unix domain socket.
 */
AutoCloseFD createUnixDomainSocket();

/**
 * Create a Unix domain socket in listen mode.
 */
AutoCloseFD createUnixDomainSocket(const std::filesystem::path & path, mode_t mode);

/**
 * Bind a Unix domain socket to a path.
 */
void bind(Descriptor fd, const std::filesystem::path & path);

/**
 * Connect to a Unix domain socket.
 */
void connect(Descriptor fd, const std::filesystem::path & path);

/**
 * Connect to a Unix domain socket.
 */
AutoCloseFD connect(const std::filesystem::path & path);

} // namespace gcrelay
