// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <video/FrameSource.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>
#include <limits>

#include "TestSupport.hpp"

using namespace framecast;
using framecast::test::SyntheticDecoder;

TEST_CASE("decimationStride rounds the rate ratio", "[source]")
{
    CHECK(decimationStride(30.0, 14.0) == 2);
    CHECK(decimationStride(30.0, 15.0) == 2);
    CHECK(decimationStride(30.0, 30.0) == 1);
    CHECK(decimationStride(30.0, 60.0) == 1);
    CHECK(decimationStride(60.0, 14.0) == 4);
    CHECK(decimationStride(29.97, 10.0) == 3);
}

TEST_CASE("decimationStride rounds halfway cases to even", "[source]")
{
    CHECK(decimationStride(25.0, 10.0) == 2);
    CHECK(decimationStride(35.0, 10.0) == 4);
}

TEST_CASE("decimationStride assumes 30 FPS when the source reports none", "[source]")
{
    CHECK(decimationStride(0.0, 14.0) == 2);
    CHECK(decimationStride(std::numeric_limits<double>::quiet_NaN(), 10.0) == 3);
}

TEST_CASE("FrameSource emits every stride-th frame as grayscale", "[source]")
{
    auto decoder = std::make_unique<SyntheticDecoder>(60, 30.0, 8, 6);
    decoder->shade = [](int ordinal) { return static_cast<std::uint8_t>(ordinal); };

    auto source = FrameSource::fromDecoder(std::move(decoder), 14.0);
    REQUIRE(source.has_value());
    CHECK(source->stride() == 2);
    CHECK(source->nativeFps() == 30.0);
    CHECK(source->achievedFps() == 15.0);

    auto count = 0;
    while (auto frame = source->next())
    {
        CHECK(frame->width == 8);
        CHECK(frame->height == 6);
        REQUIRE(frame->consistent());
        CHECK(frame->ordinal == static_cast<std::uint64_t>(count * 2));
        // Solid gray stays the same value through BGR -> gray conversion.
        CHECK(frame->pixels.front() == static_cast<std::uint8_t>(count * 2));
        ++count;
    }

    CHECK(count == 30);
    CHECK(source->framesDecoded() == 60);
    CHECK(source->framesEmitted() == 30);
}

TEST_CASE("FrameSource falls back to 30 FPS for an unknown rate", "[source]")
{
    auto const capture = log::ScopedCapture {};
    auto source = FrameSource::fromDecoder(std::make_unique<SyntheticDecoder>(3, 0.0), 10.0);
    REQUIRE(source.has_value());
    CHECK(source->nativeFps() == 30.0);
    CHECK(source->stride() == 3);
    CHECK(capture.contains("assuming 30 FPS"));
    CHECK(capture.contains("Processing every 3 frame(s)"));
}

TEST_CASE("FrameSource is not restartable and releases the decoder once", "[source]")
{
    auto decoder = std::make_unique<SyntheticDecoder>(4, 30.0);
    auto const state = decoder->state();

    auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
    REQUIRE(source.has_value());

    for (auto i = 0; i < 4; ++i)
        REQUIRE(source->next().has_value());

    CHECK(!source->next().has_value());
    CHECK(!source->isOpen());
    CHECK(state->releaseCount == 1);

    CHECK(!source->next().has_value());
    source->close();
    CHECK(state->releaseCount == 1);
}

TEST_CASE("FrameSource releases the decoder on early close and on destruction", "[source]")
{
    SECTION("close")
    {
        auto decoder = std::make_unique<SyntheticDecoder>(10, 30.0);
        auto const state = decoder->state();
        auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
        REQUIRE(source.has_value());
        REQUIRE(source->next().has_value());
        source->close();
        CHECK(state->releaseCount == 1);
        CHECK(!source->next().has_value());
        CHECK(state->framesRead == 1);
    }

    SECTION("destruction")
    {
        auto decoder = std::make_unique<SyntheticDecoder>(10, 30.0);
        auto const state = decoder->state();
        {
            auto source = FrameSource::fromDecoder(std::move(decoder), 30.0);
            REQUIRE(source.has_value());
            REQUIRE(source->next().has_value());
        }
        CHECK(state->releaseCount == 1);
    }
}

TEST_CASE("FrameSource::open reports SourceUnavailable for a missing file", "[source]")
{
    auto const result = FrameSource::open("/nonexistent/framecast/video.mp4", 14.0);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SourceUnavailable);
}

TEST_CASE("FrameSource rejects a non-positive target rate", "[source]")
{
    auto const result = FrameSource::fromDecoder(std::make_unique<SyntheticDecoder>(1, 30.0), 0.0);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("FrameSource decodes a real video file to grayscale", "[source]")
{
    auto const path = std::filesystem::temp_directory_path() / "framecast_test_source.avi";
    // Changes every second frame, so the frames kept at stride 2 alternate.
    REQUIRE(test::writeTestClip(path, 30, 30.0, 64, 48, [](int ordinal) -> std::uint8_t {
        return (ordinal / 2) % 2 == 0 ? 0 : 255;
    }));

    {
        auto source = FrameSource::open(path.string(), 15.0);
        REQUIRE(source.has_value());
        CHECK(std::abs(source->nativeFps() - 30.0) < 0.5);
        CHECK(source->stride() == 2);

        auto emitted = 0;
        while (auto frame = source->next())
        {
            CHECK(frame->width == 64);
            CHECK(frame->height == 48);
            REQUIRE(frame->consistent());
            CHECK(frame->pixels.size() == 64 * 48);

            // MJPG is lossy, a solid frame stays close to its level.
            auto const center = frame->pixels[24 * 64 + 32];
            if (emitted % 2 == 0)
                CHECK(center < 16);
            else
                CHECK(center > 239);
            ++emitted;
        }

        CHECK(emitted == 15);
        CHECK(source->framesDecoded() == 30);
        CHECK(!source->isOpen());
    }

    std::filesystem::remove(path);
}
