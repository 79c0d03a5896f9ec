// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <pipeline/StreamPipeline.hpp>
#include <sprite/Palette.hpp>
#include <sprite/SpriteBlock.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "TestSupport.hpp"

using namespace framecast;
using framecast::test::RecordingTransport;
using framecast::test::SentMessage;
using framecast::test::SyntheticDecoder;

namespace
{
    /// @brief Alternates black and white on every second source frame, so that
    /// with a stride of 2 consecutive emitted frames alternate.
    auto alternatingDecoder(int frames, double fps) -> std::unique_ptr<SyntheticDecoder>
    {
        auto decoder = std::make_unique<SyntheticDecoder>(frames, fps, 32, 24);
        decoder->shade = [](int ordinal) -> std::uint8_t { return (ordinal / 2) % 2 == 0 ? 0 : 255; };
        return decoder;
    }

    /// @brief Checks that messages form complete [header, line 1..k] groups.
    /// @return The number of complete frames.
    auto checkFrameGroups(std::vector<SentMessage> const& messages) -> std::size_t
    {
        auto frames = std::size_t { 0 };
        auto i = std::size_t { 0 };
        while (i < messages.size())
        {
            REQUIRE(messages[i].tag == SpriteBlockMessageId);
            REQUIRE(messages[i].isHeader());
            auto const header = parseHeader(messages[i].payload);
            REQUIRE(header.has_value());
            ++i;

            auto rows = 0;
            for (auto expected = 1; expected <= header->lineCount; ++expected, ++i)
            {
                REQUIRE(i < messages.size());
                REQUIRE(messages[i].tag == SpriteBlockMessageId);
                auto const line = parseLine(messages[i].payload);
                REQUIRE(line.has_value());
                CHECK(line->index == expected);
                rows += line->rows.height;
            }
            CHECK(rows == header->height);
            ++frames;
        }
        return frames;
    }
} // namespace

TEST_CASE("Streaming a 2 second 30 FPS clip at 15 FPS sends 30 alternating sprites", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 4, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};

    auto source = FrameSource::fromDecoder(alternatingDecoder(60, 30.0), 15.0);
    REQUIRE(source.has_value());
    REQUIRE(source->stride() == 2);

    auto const capture = log::ScopedCapture(log::Level::Info);
    auto pipeline = StreamPipeline(*source, packetizer, transport);
    auto const result = pipeline.run();
    REQUIRE(result.has_value());

    CHECK(capture.contains("Streaming stopped after 30 frame(s)"));
    CHECK(pipeline.state() == PipelineState::Stopped);
    CHECK(pipeline.framesSent() == 30);
    CHECK(pipeline.packetsSent() == 60);
    CHECK(transport.connectCalls == 1);
    CHECK(transport.disconnectCalls == 1);

    auto const messages = transport.messages();
    REQUIRE(messages.size() == 60);
    CHECK(checkFrameGroups(messages) == 30);

    for (auto frame = std::size_t { 0 }; frame < 30; ++frame)
    {
        auto const line = parseLine(messages[frame * 2 + 1].payload);
        REQUIRE(line.has_value());
        CHECK(line->rows.paletteData.size() == 12);
        auto const expected = std::uint8_t { frame % 2 == 0 ? std::uint8_t { 0x00 } : std::uint8_t { 0xFF } };
        CHECK(line->rows.pixelData == std::vector<std::uint8_t>(4, expected));
    }
}

TEST_CASE("Frames are sent header first with lines in increasing order", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 8, .height = 8, .lineHeight = 2 }, palette);
    auto transport = RecordingTransport {};

    auto source = FrameSource::fromDecoder(std::make_unique<SyntheticDecoder>(12, 30.0), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport, { .queueCapacity = 2 });
    REQUIRE(pipeline.run().has_value());

    auto const messages = transport.messages();
    CHECK(messages.size() == 12 * 5);
    CHECK(checkFrameGroups(messages) == 12);
}

TEST_CASE("A failed connect starts no tasks and never disconnects", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 4, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};
    transport.failConnect = true;

    auto decoder = std::make_unique<SyntheticDecoder>(10, 30.0);
    auto const state = decoder->state();
    auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport);
    auto const result = pipeline.run();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);

    CHECK(pipeline.state() == PipelineState::Stopped);
    CHECK(transport.connectCalls == 1);
    CHECK(transport.disconnectCalls == 0);
    CHECK(transport.messages().empty());
    CHECK(state->framesRead == 0);
    CHECK(state->releaseCount == 1);
}

TEST_CASE("A send failure aborts the session and releases the transport", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 4, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};
    transport.failAfterMessages = 5;

    auto decoder = std::make_unique<SyntheticDecoder>(1000, 30.0);
    auto const state = decoder->state();
    auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport);
    auto const result = pipeline.run();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);

    CHECK(pipeline.state() == PipelineState::Stopped);
    CHECK(pipeline.framesSent() == 2);
    CHECK(transport.disconnectCalls == 1);
    CHECK(state->framesRead < 1000);
    CHECK(state->releaseCount == 1);
}

TEST_CASE("An encoding failure aborts the session before anything is sent", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 0, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};

    auto source = FrameSource::fromDecoder(std::make_unique<SyntheticDecoder>(10, 30.0), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport);
    auto const result = pipeline.run();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::EncodingError);
    CHECK(transport.messages().empty());
    CHECK(transport.disconnectCalls == 1);
}

TEST_CASE("Stopping mid-stream never leaves a frame half sent", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 8, .height = 8, .lineHeight = 2 }, palette);
    auto transport = RecordingTransport {};

    auto decoder = std::make_unique<SyntheticDecoder>(1000, 30.0);
    auto const state = decoder->state();
    auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport);

    // Stop while the third frame is in flight (5 packets per frame).
    transport.onMessage = [&pipeline](std::size_t count) {
        if (count == 12)
            pipeline.requestStop();
    };

    auto const result = pipeline.run();
    REQUIRE(result.has_value());

    auto const messages = transport.messages();
    CHECK(messages.size() == 15);
    CHECK(checkFrameGroups(messages) == 3);
    CHECK(pipeline.framesSent() == 3);
    CHECK(pipeline.state() == PipelineState::Stopped);
    CHECK(transport.cancelCalls == 0);
    CHECK(transport.disconnectCalls == 1);
    CHECK(state->framesRead < 1000);
    CHECK(state->releaseCount == 1);
}

TEST_CASE("A stop requested before run ends the session cleanly", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 4, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};

    auto source = FrameSource::fromDecoder(std::make_unique<SyntheticDecoder>(10, 30.0), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport);
    pipeline.requestStop();
    REQUIRE(pipeline.run().has_value());
    CHECK(transport.messages().empty());
    CHECK(transport.connectCalls == 1);
    CHECK(transport.disconnectCalls == 1);

    auto const again = pipeline.run();
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("The producer never runs more than capacity + 1 frames ahead", "[pipeline]")
{
    constexpr auto Capacity = std::size_t { 2 };

    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 4, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};

    auto decoder = std::make_unique<SyntheticDecoder>(40, 30.0);
    auto const state = decoder->state();
    auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport, { .queueCapacity = Capacity });

    auto violations = std::atomic<int> { 0 };
    transport.onMessage = [&](std::size_t count) {
        // Two packets per frame: after `count` packets the consumer has taken (count + 1) / 2 frames.
        auto const taken = static_cast<int>((count + 1) / 2);
        if (state->framesRead > taken + static_cast<int>(Capacity) + 1)
            ++violations;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    };

    REQUIRE(pipeline.run().has_value());
    CHECK(violations == 0);
    CHECK(pipeline.framesSent() == 40);
    CHECK(pipeline.peakQueueDepth() <= Capacity);
}

TEST_CASE("A stop request ends a session whose link stopped answering", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 4, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};
    // The line packet of the second frame never gets an answer.
    transport.stallAfterMessages = 3;

    auto decoder = std::make_unique<SyntheticDecoder>(1000, 30.0);
    auto const state = decoder->state();
    auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source,
                                   packetizer,
                                   transport,
                                   { .queueCapacity = 4,
                                     .reportInterval = std::chrono::seconds(1),
                                     .stopTimeout = std::chrono::milliseconds(50) });
    transport.onMessage = [&pipeline](std::size_t count) {
        if (count == 3)
            pipeline.requestStop();
    };

    auto const result = pipeline.run();
    REQUIRE(result.has_value());

    CHECK(transport.cancelCalls == 1);
    CHECK(transport.disconnectCalls == 1);
    CHECK(transport.messages().size() == 3);
    CHECK(pipeline.framesSent() == 1);
    CHECK(pipeline.state() == PipelineState::Stopped);
    CHECK(state->releaseCount == 1);
}

TEST_CASE("An exception thrown by the transport fails the session cleanly", "[pipeline]")
{
    auto const palette = Palette::grayscale();
    auto const packetizer = SpritePacketizer({ .width = 4, .height = 4, .lineHeight = 0 }, palette);
    auto transport = RecordingTransport {};
    transport.onMessage = [](std::size_t count) {
        if (count == 2)
            throw std::runtime_error("link driver crashed");
    };

    auto decoder = std::make_unique<SyntheticDecoder>(100, 30.0);
    auto const state = decoder->state();
    auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
    REQUIRE(source.has_value());

    auto pipeline = StreamPipeline(*source, packetizer, transport);
    auto const result = pipeline.run();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::Unknown);
    CHECK(result.error().message.find("link driver crashed") != std::string::npos);

    CHECK(pipeline.framesSent() == 0);
    CHECK(pipeline.state() == PipelineState::Stopped);
    CHECK(transport.disconnectCalls == 1);
    CHECK(state->releaseCount == 1);
}
