#pragma once
///@file

#include "gcrelay/util/error.hh"
#include "gcrelay/util/serialise.hh"

#include <cstdint>
#include <optional>

namespace gcrelay::relay {

/**
 * Default vsock port of the relay.
 */
constexpr uint32_t defaultRelayPort = 25565;

/**
 * Size of a frame header: one type byte and a little-endian 32-bit
 * payload length.
 */
constexpr size_t frameHeaderSize = 5;

enum struct FrameType : uint8_t {
    Register = 1,
    Unregister = 2,
    Ping = 3,
    Pong = 4,
    Ack = 5,
    Error = 6,
    Close = 7,
    Hello = 8,
};

/**
 * The error kinds carried by an `ERROR` frame.
 */
enum struct ErrorKind : uint8_t {
    ProtocolError = 1,
    PathInvalid = 2,
    PathNotFound = 3,
    RegistryFull = 4,
    MaterializationError = 5,
    TransportError = 6,
    ServerBusy = 7,
    PathNotHeld = 8,
};

std::string_view showFrameType(FrameType type);

std::string_view showErrorKind(ErrorKind kind);

std::optional<FrameType> parseFrameType(uint8_t n);

std::optional<ErrorKind> parseErrorKind(uint8_t n);

/**
 * Whether frames of this type are sent by the client (as opposed to
 * replies sent by the relay).
 */
bool isClientFrame(FrameType type);

struct Frame
{
    FrameType type;
    std::string payload;

    bool operator==(const Frame &) const = default;
};

/**
 * A frame that could not be decoded: an unknown type, a payload
 * exceeding the size limit, or a stream ending in the middle of a
 * frame.
 */
MakeError(BadFrame, Error);

/**
 * An error reported by the relay in an `ERROR` frame, or a failure of
 * the transport to the relay.
 */
class RelayError : public Error
{
public:
    ErrorKind kind;

    template<typename... Args>
    RelayError(ErrorKind kind, const Args &... args)
        : Error(args...)
        , kind(kind)
    {
    }
};

/**
 * Read one frame.
 *
 * @throws EndOfFile if the stream ends before the first byte of the
 * frame.
 * @throws BadFrame if the frame is malformed or its payload exceeds
 * `maxFrameSize` bytes.
 */
Frame readFrame(Source & source, size_t maxFrameSize);

/**
 * Write one frame. The sink is not flushed.
 */
void writeFrame(Sink & sink, const Frame & frame);

std::string encodeFrame(const Frame & frame);

Frame makeErrorFrame(ErrorKind kind, std::string_view message);

/**
 * Decode the payload of an `ERROR` frame into a `RelayError`.
 */
RelayError parseErrorFrame(const Frame & frame);

} // namespace gcrelay::relay
