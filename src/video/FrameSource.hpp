// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <video/RawFrame.hpp>
#include <video/VideoDecoder.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace framecast
{

/// @brief Frame rate assumed when the container does not report one.
constexpr auto DefaultSourceFrameRate = 30.0;

/// @brief Returns the fixed decimation stride: max(1, round(nativeFps / targetFps)).
///
/// Halfway cases round to even. This is a nearest-rate downsampler, so the
/// achieved rate (nativeFps / stride) may differ from targetFps.
[[nodiscard]] auto decimationStride(double nativeFps, double targetFps) noexcept -> int;

/// @brief Finite, non-restartable sequence of grayscale frames decimated to a target rate.
///
/// Holds the video resource exclusively until the sequence ends, close() is called,
/// or the source is destroyed, whichever comes first.
class FrameSource
{
  public:
    /// @brief Opens a video file and prepares decimation to @p targetFps.
    /// @return The source, or SourceUnavailable if the file cannot be decoded.
    [[nodiscard]] static auto open(std::string_view path, double targetFps) -> Result<FrameSource>;

    /// @brief Wraps an already opened decoder.
    [[nodiscard]] static auto fromDecoder(std::unique_ptr<VideoDecoder> decoder, double targetFps)
        -> Result<FrameSource>;

    ~FrameSource();

    FrameSource(FrameSource&&) noexcept;
    FrameSource& operator=(FrameSource&&) noexcept;
    FrameSource(const FrameSource&) = delete;
    FrameSource& operator=(const FrameSource&) = delete;

    /// @brief Decodes up to the next emitted frame (blocking).
    /// @return The grayscale frame, or std::nullopt once the source is exhausted.
    [[nodiscard]] auto next() -> std::optional<RawFrame>;

    /// @brief Releases the video resource. Further next() calls return std::nullopt.
    void close();

    [[nodiscard]] auto nativeFps() const noexcept -> double { return _nativeFps; }
    [[nodiscard]] auto targetFps() const noexcept -> double { return _targetFps; }
    [[nodiscard]] auto stride() const noexcept -> int { return _stride; }
    [[nodiscard]] auto achievedFps() const noexcept -> double { return _nativeFps / _stride; }

    /// @brief Number of source frames decoded so far, emitted or skipped.
    [[nodiscard]] auto framesDecoded() const noexcept -> std::uint64_t { return _ordinal; }

    /// @brief Number of frames returned by next() so far.
    [[nodiscard]] auto framesEmitted() const noexcept -> std::uint64_t { return _emitted; }

    [[nodiscard]] auto isOpen() const noexcept -> bool { return _decoder != nullptr; }

  private:
    FrameSource(std::unique_ptr<VideoDecoder> decoder, double nativeFps, double targetFps);

    std::unique_ptr<VideoDecoder> _decoder;
    double _nativeFps = DefaultSourceFrameRate;
    double _targetFps = DefaultSourceFrameRate;
    int _stride = 1;
    std::uint64_t _ordinal = 0;
    std::uint64_t _emitted = 0;
};

} // namespace framecast
