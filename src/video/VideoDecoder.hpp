// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <opencv2/core.hpp>

#include <memory>
#include <string_view>

namespace framecast
{

/// @brief Abstract interface for a sequential video frame decoder.
class VideoDecoder
{
  public:
    virtual ~VideoDecoder() = default;

    /// @brief Returns the frame rate reported by the container, or 0 if unknown.
    [[nodiscard]] virtual auto frameRate() const -> double = 0;

    /// @brief Decodes the next frame (blocking).
    /// @param frame Receives an 8-bit BGR or single-channel image.
    /// @return False when the stream is exhausted or can no longer be read.
    [[nodiscard]] virtual auto read(cv::Mat& frame) -> bool = 0;

    /// @brief Releases the underlying video resource. Safe to call more than once.
    virtual void release() = 0;
};

/// @brief Opens a video file for decoding with OpenCV's videoio backend.
/// @param path The path to the video file.
/// @return The decoder, or SourceUnavailable if the file cannot be opened as video.
[[nodiscard]] auto openVideoFile(std::string_view path) -> Result<std::unique_ptr<VideoDecoder>>;

} // namespace framecast
