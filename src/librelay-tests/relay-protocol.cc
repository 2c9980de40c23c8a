#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "gcrelay/relay/relay-protocol.hh"

namespace rc {
using namespace gcrelay::relay;

template<>
struct Arbitrary<Frame>
{
    static Gen<Frame> arbitrary()
    {
        return gen::apply(
            [](FrameType type, std::string payload) { return Frame{.type = type, .payload = std::move(payload)}; },
            gen::element(
                FrameType::Register,
                FrameType::Unregister,
                FrameType::Ping,
                FrameType::Pong,
                FrameType::Ack,
                FrameType::Error,
                FrameType::Close,
                FrameType::Hello),
            gen::arbitrary<std::string>());
    }
};

} // namespace rc

namespace gcrelay::relay {

using namespace std::string_literals;

/* ----------------------------------------------------------------------------
 * writeFrame
 * --------------------------------------------------------------------------*/

TEST(writeFrame, layout)
{
    ASSERT_EQ(encodeFrame({.type = FrameType::Register, .payload = "abc"}), "\x01\x03\x00\x00\x00"s "abc");
}

TEST(writeFrame, emptyPayload)
{
    ASSERT_EQ(encodeFrame({.type = FrameType::Ping}), "\x03\x00\x00\x00\x00"s);
}

TEST(writeFrame, lengthIsLittleEndian)
{
    auto s = encodeFrame({.type = FrameType::Hello, .payload = std::string(0x0102, 'x')});
    ASSERT_EQ(s.size(), frameHeaderSize + 0x0102);
    ASSERT_EQ(s.substr(0, frameHeaderSize), "\x08\x02\x01\x00\x00"s);
}

/* ----------------------------------------------------------------------------
 * readFrame
 * --------------------------------------------------------------------------*/

TEST(readFrame, sequence)
{
    auto data = encodeFrame({.type = FrameType::Register, .payload = "/nix/store/foo"})
                + encodeFrame({.type = FrameType::Ping}) + encodeFrame({.type = FrameType::Close});
    StringSource source{data};

    ASSERT_EQ(readFrame(source, 4096), (Frame{.type = FrameType::Register, .payload = "/nix/store/foo"}));
    ASSERT_EQ(readFrame(source, 4096), (Frame{.type = FrameType::Ping}));
    ASSERT_EQ(readFrame(source, 4096), (Frame{.type = FrameType::Close}));
    ASSERT_THROW(readFrame(source, 4096), EndOfFile);
}

TEST(readFrame, truncatedHeader)
{
    auto data = "\x01\x03\x00"s;
    StringSource source{data};
    ASSERT_THROW(readFrame(source, 4096), BadFrame);
}

TEST(readFrame, truncatedPayload)
{
    auto data = "\x01\x05\x00\x00\x00"s "abc";
    StringSource source{data};
    ASSERT_THROW(readFrame(source, 4096), BadFrame);
}

TEST(readFrame, unknownType)
{
    for (auto type : {"\x00"s, "\x09"s, "\xff"s}) {
        auto data = type + "\x00\x00\x00\x00"s;
        StringSource source{data};
        ASSERT_THROW(readFrame(source, 4096), BadFrame);
    }
}

TEST(readFrame, payloadLimit)
{
    auto atLimit = encodeFrame({.type = FrameType::Register, .payload = std::string(16, 'x')});
    StringSource source1{atLimit};
    ASSERT_EQ(readFrame(source1, 16).payload.size(), 16u);

    auto overLimit = encodeFrame({.type = FrameType::Register, .payload = std::string(17, 'x')});
    StringSource source2{overLimit};
    ASSERT_THROW(readFrame(source2, 16), BadFrame);
}

TEST(readFrame, hugeLengthIsRejectedBeforeReading)
{
    auto data = "\x01\xff\xff\xff\xff"s;
    StringSource source{data};
    ASSERT_THROW(readFrame(source, 4096), BadFrame);
}

/* ----------------------------------------------------------------------------
 * Error frames
 * --------------------------------------------------------------------------*/

TEST(errorFrame, roundTrip)
{
    auto frame = makeErrorFrame(ErrorKind::PathNotFound, "path '/nix/store/foo' does not exist");
    ASSERT_EQ(frame.type, FrameType::Error);
    ASSERT_EQ(frame.payload[0], (char) ErrorKind::PathNotFound);

    auto e = parseErrorFrame(frame);
    ASSERT_EQ(e.kind, ErrorKind::PathNotFound);
    ASSERT_NE(e.message().find("does not exist"), std::string::npos);
    ASSERT_NE(e.message().find("PathNotFound"), std::string::npos);
}

TEST(errorFrame, emptyMessage)
{
    auto e = parseErrorFrame(makeErrorFrame(ErrorKind::ServerBusy, ""));
    ASSERT_EQ(e.kind, ErrorKind::ServerBusy);
}

TEST(errorFrame, malformed)
{
    ASSERT_THROW(parseErrorFrame({.type = FrameType::Error}), BadFrame);
    ASSERT_THROW(parseErrorFrame({.type = FrameType::Error, .payload = "\x00oops"s}), BadFrame);
    ASSERT_THROW(parseErrorFrame({.type = FrameType::Error, .payload = "\x09oops"s}), BadFrame);
    ASSERT_THROW(parseErrorFrame({.type = FrameType::Ack}), BadFrame);
}

/* ----------------------------------------------------------------------------
 * Type tables
 * --------------------------------------------------------------------------*/

TEST(frameType, parse)
{
    ASSERT_FALSE(parseFrameType(0));
    ASSERT_EQ(parseFrameType(1), FrameType::Register);
    ASSERT_EQ(parseFrameType(8), FrameType::Hello);
    ASSERT_FALSE(parseFrameType(9));
}

TEST(frameType, show)
{
    ASSERT_EQ(showFrameType(FrameType::Unregister), "UNREGISTER");
    ASSERT_EQ(showFrameType(FrameType::Pong), "PONG");
}

TEST(frameType, isClientFrame)
{
    ASSERT_TRUE(isClientFrame(FrameType::Register));
    ASSERT_TRUE(isClientFrame(FrameType::Unregister));
    ASSERT_TRUE(isClientFrame(FrameType::Ping));
    ASSERT_TRUE(isClientFrame(FrameType::Close));
    ASSERT_TRUE(isClientFrame(FrameType::Hello));
    ASSERT_FALSE(isClientFrame(FrameType::Pong));
    ASSERT_FALSE(isClientFrame(FrameType::Ack));
    ASSERT_FALSE(isClientFrame(FrameType::Error));
}

TEST(errorKind, parse)
{
    ASSERT_FALSE(parseErrorKind(0));
    ASSERT_EQ(parseErrorKind(1), ErrorKind::ProtocolError);
    ASSERT_EQ(parseErrorKind(8), ErrorKind::PathNotHeld);
    ASSERT_FALSE(parseErrorKind(9));
    ASSERT_EQ(showErrorKind(ErrorKind::RegistryFull), "RegistryFull");
}

#ifndef COVERAGE

RC_GTEST_PROP(readFrame, prop_concatenated_frames, (const std::vector<Frame> & frames))
{
    std::string data;
    for (auto & frame : frames)
        data += encodeFrame(frame);

    StringSource source{data};
    for (auto & frame : frames)
        RC_ASSERT(readFrame(source, UINT32_MAX) == frame);
    RC_ASSERT_THROWS_AS(readFrame(source, UINT32_MAX), EndOfFile);
}

#endif

} // namespace gcrelay::relay
