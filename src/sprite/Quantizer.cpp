// SPDX-License-Identifier: Apache-2.0
#include "Quantizer.hpp"

#include <format>
#include <stdexcept>

namespace framecast
{

auto QuantizedSprite::packedSize(int width, int height, int bitsPerPixel) noexcept -> std::size_t
{
    auto const bits = static_cast<std::size_t>(width) * static_cast<std::size_t>(height)
                      * static_cast<std::size_t>(bitsPerPixel);
    return (bits + 7) / 8;
}

auto QuantizedSprite::indexAt(int x, int y) const -> std::uint8_t
{
    if (x < 0 || y < 0 || x >= width || y >= height)
        throw std::out_of_range(std::format("Pixel ({}, {}) outside {}x{} sprite", x, y, width, height));

    auto const bitOffset = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width)
                            + static_cast<std::size_t>(x))
                           * static_cast<std::size_t>(bitsPerPixel);
    auto const byte = pixelData.at(bitOffset / 8);
    auto const shift = 8 - bitsPerPixel - static_cast<int>(bitOffset % 8);
    auto const mask = static_cast<std::uint8_t>((1u << bitsPerPixel) - 1u);
    return static_cast<std::uint8_t>((byte >> shift) & mask);
}

auto QuantizedSprite::rows(int first, int count) const -> QuantizedSprite
{
    if (first < 0 || count < 0 || first + count > height)
        throw std::out_of_range(std::format("Rows [{}, {}) outside sprite of height {}", first, first + count, height));

    auto indices = std::vector<std::uint8_t> {};
    indices.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(count));
    for (auto y = first; y < first + count; ++y)
        for (auto x = 0; x < width; ++x)
            indices.push_back(indexAt(x, y));

    return QuantizedSprite {
        .width = width,
        .height = count,
        .numColors = numColors,
        .bitsPerPixel = bitsPerPixel,
        .paletteData = paletteData,
        .pixelData = packIndices(indices, bitsPerPixel),
    };
}

auto packIndices(std::span<const std::uint8_t> indices, int bitsPerPixel) -> std::vector<std::uint8_t>
{
    auto const pixelsPerByte = 8 / bitsPerPixel;
    auto const mask = static_cast<std::uint8_t>((1u << bitsPerPixel) - 1u);

    auto packed = std::vector<std::uint8_t>((indices.size() + static_cast<std::size_t>(pixelsPerByte) - 1)
                                            / static_cast<std::size_t>(pixelsPerByte));
    for (auto i = std::size_t { 0 }; i < indices.size(); ++i)
    {
        auto const slot = static_cast<int>(i % static_cast<std::size_t>(pixelsPerByte));
        auto const shift = 8 - bitsPerPixel * (slot + 1);
        packed[i / static_cast<std::size_t>(pixelsPerByte)] |=
            static_cast<std::uint8_t>((indices[i] & mask) << shift);
    }
    return packed;
}

auto quantize(const cv::Mat& image, const Palette& palette) -> Result<QuantizedSprite>
{
    if (image.empty())
        return makeError(ErrorCode::EncodingError, "Cannot quantize an empty image");
    if (image.type() != CV_8UC3)
        return makeError(ErrorCode::EncodingError,
                         std::format("Quantizer expects an 8-bit RGB image, got {} channel(s) of depth {}",
                                     image.channels(),
                                     image.depth()));

    auto const width = image.cols;
    auto const height = image.rows;
    auto const bpp = palette.bitsPerPixel();

    auto indices = std::vector<std::uint8_t> {};
    indices.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    for (auto y = 0; y < height; ++y)
    {
        auto const* row = image.ptr<cv::Vec3b>(y);
        for (auto x = 0; x < width; ++x)
        {
            auto const& px = row[x];
            indices.push_back(palette.nearestIndex(Rgb { px[0], px[1], px[2] }));
        }
    }

    auto sprite = QuantizedSprite {
        .width = width,
        .height = height,
        .numColors = static_cast<int>(palette.size()),
        .bitsPerPixel = bpp,
        .paletteData = { palette.bytes().begin(), palette.bytes().end() },
        .pixelData = packIndices(indices, bpp),
    };

    if (sprite.pixelData.size() != QuantizedSprite::packedSize(width, height, bpp))
        return makeError(ErrorCode::EncodingError,
                         std::format("Packed {} bytes for a {}x{} sprite at {} bpp",
                                     sprite.pixelData.size(),
                                     width,
                                     height,
                                     bpp));

    return sprite;
}

} // namespace framecast
