// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <vector>

namespace framecast
{

/// @brief A decoded single-channel 8-bit frame, row-major without padding.
///
/// Produced by FrameSource and handed to exactly one consumer; it is moved
/// through the pipeline queue, never shared.
struct RawFrame
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    /// @brief Source frame ordinal (before decimation), for diagnostics.
    std::uint64_t ordinal = 0;

    [[nodiscard]] auto empty() const noexcept -> bool { return width <= 0 || height <= 0; }

    /// @brief True if the pixel buffer matches width * height.
    [[nodiscard]] auto consistent() const noexcept -> bool
    {
        return !empty()
               && pixels.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
};

} // namespace framecast
