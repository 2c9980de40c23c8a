#pragma once
/**
 * @file
 *
 * Stream sockets over AF_VSOCK, the transport between a virtual
 * machine and its host. Peers are addressed by a context identifier
 * (CID) and a port.
 */

#include "gcrelay/util/types.hh"
#include "gcrelay/util/file-descriptor.hh"

#include <chrono>
#include <cstdint>
#include <optional>

namespace gcrelay {

/**
 * Well-known context identifiers.
 */
constexpr uint32_t vsockCidAny = 0xFFFFFFFF;
constexpr uint32_t vsockCidHypervisor = 0;
constexpr uint32_t vsockCidLocal = 1;
constexpr uint32_t vsockCidHost = 2;

/**
 * Create an AF_VSOCK stream socket.
 */
AutoCloseFD createVsockSocket();

/**
 * Create an AF_VSOCK socket bound to `cid`:`port` in listen mode.
 */
AutoCloseFD createVsockListener(uint32_t cid, uint32_t port, int backlog = 100);

/**
 * Connect to `cid`:`port`, giving up after `timeout` if set.
 */
AutoCloseFD
connectVsock(uint32_t cid, uint32_t port, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/**
 * Return the CID of the peer of a connected AF_VSOCK socket, or
 * std::nullopt if `fd` is not an AF_VSOCK socket.
 */
std::optional<uint32_t> getVsockPeerCid(Descriptor fd);

} // namespace gcrelay
