#include "gcrelay/relay/relay-protocol.hh"
#include "gcrelay/util/util.hh"

namespace gcrelay::relay {

std::string_view showFrameType(FrameType type)
{
    switch (type) {
    case FrameType::Register:
        return "REGISTER";
    case FrameType::Unregister:
        return "UNREGISTER";
    case FrameType::Ping:
        return "PING";
    case FrameType::Pong:
        return "PONG";
    case FrameType::Ack:
        return "ACK";
    case FrameType::Error:
        return "ERROR";
    case FrameType::Close:
        return "CLOSE";
    case FrameType::Hello:
        return "HELLO";
    }
    unreachable();
}

std::string_view showErrorKind(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::ProtocolError:
        return "ProtocolError";
    case ErrorKind::PathInvalid:
        return "PathInvalid";
    case ErrorKind::PathNotFound:
        return "PathNotFound";
    case ErrorKind::RegistryFull:
        return "RegistryFull";
    case ErrorKind::MaterializationError:
        return "MaterializationError";
    case ErrorKind::TransportError:
        return "TransportError";
    case ErrorKind::ServerBusy:
        return "ServerBusy";
    case ErrorKind::PathNotHeld:
        return "PathNotHeld";
    }
    unreachable();
}

std::optional<FrameType> parseFrameType(uint8_t n)
{
    if (n < (uint8_t) FrameType::Register || n > (uint8_t) FrameType::Hello)
        return std::nullopt;
    return static_cast<FrameType>(n);
}

std::optional<ErrorKind> parseErrorKind(uint8_t n)
{
    if (n < (uint8_t) ErrorKind::ProtocolError || n > (uint8_t) ErrorKind::PathNotHeld)
        return std::nullopt;
    return static_cast<ErrorKind>(n);
}

bool isClientFrame(FrameType type)
{
    switch (type) {
    case FrameType::Register:
    case FrameType::Unregister:
    case FrameType::Ping:
    case FrameType::Close:
    case FrameType::Hello:
        return true;
    default:
        return false;
    }
}

Frame readFrame(Source & source, size_t maxFrameSize)
{
    unsigned char header[frameHeaderSize];

    /* End-of-file before the type byte is a clean close; anywhere
       later it is a truncated frame. */
    source((char *) header, 1);

    try {
        source((char *) header + 1, frameHeaderSize - 1);
    } catch (EndOfFile &) {
        throw BadFrame("connection closed in the middle of a frame header");
    }

    auto type = parseFrameType(header[0]);
    if (!type)
        throw BadFrame("unknown frame type %d", (unsigned int) header[0]);

    auto len = readLittleEndian<uint32_t>(header + 1);
    if (len > maxFrameSize)
        throw BadFrame(
            "%s frame payload of %d bytes exceeds the limit of %d bytes", showFrameType(*type), len, maxFrameSize);

    Frame frame{.type = *type};
    frame.payload.resize(len);
    try {
        source(frame.payload.data(), len);
    } catch (EndOfFile &) {
        throw BadFrame("connection closed in the middle of a %s frame", showFrameType(*type));
    }

    return frame;
}

void writeFrame(Sink & sink, const Frame & frame)
{
    if (frame.payload.size() > UINT32_MAX)
        throw BadFrame("%s frame payload is too large", showFrameType(frame.type));

    unsigned char header[frameHeaderSize];
    header[0] = (uint8_t) frame.type;
    writeLittleEndian<uint32_t>(frame.payload.size(), header + 1);

    sink({(char *) header, frameHeaderSize});
    sink(frame.payload);
}

std::string encodeFrame(const Frame & frame)
{
    StringSink sink;
    writeFrame(sink, frame);
    return std::move(sink.s);
}

Frame makeErrorFrame(ErrorKind kind, std::string_view message)
{
    Frame frame{.type = FrameType::Error};
    frame.payload.reserve(1 + message.size());
    frame.payload.push_back((char) kind);
    frame.payload.append(message);
    return frame;
}

RelayError parseErrorFrame(const Frame & frame)
{
    if (frame.type != FrameType::Error)
        throw BadFrame("expected an ERROR frame, got %s", showFrameType(frame.type));
    if (frame.payload.empty())
        throw BadFrame("ERROR frame without an error kind");
    auto kind = parseErrorKind((uint8_t) frame.payload[0]);
    if (!kind)
        throw BadFrame("ERROR frame with unknown error kind %d", (unsigned int) (uint8_t) frame.payload[0]);
    return RelayError(*kind, "%s: %s", showErrorKind(*kind), Uncolored(frame.payload.substr(1)));
}

} // namespace gcrelay::relay
