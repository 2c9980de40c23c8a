#pragma once
///@file

#include "gcrelay/util/types.hh"
#include "gcrelay/util/error.hh"

#include <chrono>

#include <unistd.h>

namespace gcrelay {

struct Sink;
struct Source;

using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

/**
 * Read the contents of a file into a string.
 */
std::string readFile(Descriptor fd);

/**
 * Wrapper around write() that writes exactly the requested number of
 * bytes.
 */
void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts = true);

/**
 * Write a line to a file descriptor.
 */
void writeLine(Descriptor fd, std::string s);

/**
 * Read a file descriptor until EOF occurs.
 */
void drainFD(Descriptor fd, Sink & sink, bool block = true);

/**
 * Wait until `fd` is readable (including end-of-file or a hangup), or
 * until `timeout` has elapsed.
 *
 * @return false if the timeout elapsed.
 */
bool waitForInput(Descriptor fd, std::chrono::milliseconds timeout);

[[gnu::always_inline]]
inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

[[gnu::always_inline]]
inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

/**
 * Automatic cleanup of resources.
 */
class AutoCloseFD
{
    Descriptor fd;
public:
    AutoCloseFD();
    AutoCloseFD(Descriptor fd);
    AutoCloseFD(const AutoCloseFD & fd) = delete;
    AutoCloseFD(AutoCloseFD && fd) noexcept;
    ~AutoCloseFD();
    AutoCloseFD & operator=(const AutoCloseFD & fd) = delete;
    AutoCloseFD & operator=(AutoCloseFD && fd);
    Descriptor get() const;
    explicit operator bool() const;
    Descriptor release();
    void close();
};

class Pipe
{
public:
    AutoCloseFD readSide, writeSide;
    void create();
    void close();
};

namespace unix {

/**
 * Set the close-on-exec flag for the given file descriptor.
 */
void closeOnExec(Descriptor fd);

} // namespace unix

MakeError(EndOfFile, Error);

} // namespace gcrelay
