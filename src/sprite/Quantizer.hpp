// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <sprite/Palette.hpp>

#include <opencv2/core.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace framecast
{

/// @brief A palette-indexed image with bit-packed pixel data.
///
/// Pixels are stored row-major, most significant bits first within each byte,
/// without per-row padding. Only the final byte may carry unused bits.
struct QuantizedSprite
{
    int width = 0;
    int height = 0;
    int numColors = 0;
    int bitsPerPixel = 0;
    std::vector<std::uint8_t> paletteData;
    std::vector<std::uint8_t> pixelData;

    /// @brief Expected size of pixelData for the given geometry.
    [[nodiscard]] static auto packedSize(int width, int height, int bitsPerPixel) noexcept -> std::size_t;

    /// @brief Returns the palette index stored at (x, y).
    [[nodiscard]] auto indexAt(int x, int y) const -> std::uint8_t;

    /// @brief Returns a sprite covering @p count rows starting at row @p first, re-packed.
    [[nodiscard]] auto rows(int first, int count) const -> QuantizedSprite;
};

/// @brief Packs one palette index per byte into MSB-first bit groups.
/// @param indices Palette indices, each less than 2^bitsPerPixel.
/// @param bitsPerPixel 1, 2, 4 or 8.
[[nodiscard]] auto packIndices(std::span<const std::uint8_t> indices, int bitsPerPixel)
    -> std::vector<std::uint8_t>;

/// @brief Maps every pixel of an RGB image to its nearest palette entry.
///
/// No dithering is applied; identical input always yields identical output.
/// @param image 8-bit 3-channel image (CV_8UC3), channels in R, G, B order.
/// @param palette The session palette.
/// @return The indexed sprite, or EncodingError for unusable input.
[[nodiscard]] auto quantize(const cv::Mat& image, const Palette& palette) -> Result<QuantizedSprite>;

} // namespace framecast
