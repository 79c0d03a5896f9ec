// SPDX-License-Identifier: Apache-2.0
#include "SpriteBlock.hpp"

#include <algorithm>
#include <format>
#include <limits>

namespace framecast
{

namespace
{
    void putU16(std::vector<std::uint8_t>& out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>(value >> 8));
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    }

    auto getU16(std::span<const std::uint8_t> data, std::size_t offset) -> std::uint16_t
    {
        return static_cast<std::uint16_t>((data[offset] << 8) | data[offset + 1]);
    }

    auto fitsU16(int value) -> bool
    {
        return value >= 0 && value <= std::numeric_limits<std::uint16_t>::max();
    }
} // namespace

auto makeSpriteBlock(const QuantizedSprite& sprite, int lineHeight) -> Result<SpriteBlockMessage>
{
    if (sprite.width <= 0 || sprite.height <= 0)
        return makeError(ErrorCode::EncodingError,
                         std::format("Sprite dimensions must be positive, got {}x{}", sprite.width, sprite.height));
    if (!fitsU16(sprite.width) || !fitsU16(sprite.height))
        return makeError(ErrorCode::EncodingError,
                         std::format("Sprite {}x{} exceeds the 16-bit wire limits", sprite.width, sprite.height));
    if (sprite.pixelData.size() != QuantizedSprite::packedSize(sprite.width, sprite.height, sprite.bitsPerPixel))
        return makeError(ErrorCode::EncodingError,
                         std::format("Sprite carries {} pixel bytes, expected {}",
                                     sprite.pixelData.size(),
                                     QuantizedSprite::packedSize(sprite.width, sprite.height, sprite.bitsPerPixel)));

    if (lineHeight <= 0 || lineHeight > sprite.height)
        lineHeight = sprite.height;

    auto const lineCount = (sprite.height + lineHeight - 1) / lineHeight;
    if (lineCount >= (SpriteBlockHeaderMarker << 8))
        return makeError(ErrorCode::EncodingError,
                         std::format("{} line packets would collide with the header marker", lineCount));

    auto message = SpriteBlockMessage {};
    message.header = SpriteBlockHeader {
        .width = static_cast<std::uint16_t>(sprite.width),
        .height = static_cast<std::uint16_t>(sprite.height),
        .lineHeight = static_cast<std::uint16_t>(lineHeight),
        .lineCount = static_cast<std::uint16_t>(lineCount),
        .bitsPerPixel = static_cast<std::uint8_t>(sprite.bitsPerPixel),
        .numColors = static_cast<std::uint8_t>(sprite.numColors),
        .progressiveRender = false,
        .updatable = true,
        .paletteData = sprite.paletteData,
    };

    message.lines.reserve(static_cast<std::size_t>(lineCount));
    if (lineCount == 1)
    {
        message.lines.push_back(SpriteLine { .index = 1, .rows = sprite });
        return message;
    }

    for (auto i = 0; i < lineCount; ++i)
    {
        auto const first = i * lineHeight;
        auto const count = std::min(lineHeight, sprite.height - first);
        message.lines.push_back(SpriteLine {
            .index = static_cast<std::uint16_t>(i + 1),
            .rows = sprite.rows(first, count),
        });
    }

    return message;
}

auto packHeader(const SpriteBlockHeader& header) -> std::vector<std::uint8_t>
{
    auto out = std::vector<std::uint8_t> {};
    out.reserve(SpriteBlockHeaderSize + header.paletteData.size());
    out.push_back(SpriteBlockHeaderMarker);
    putU16(out, header.width);
    putU16(out, header.height);
    putU16(out, header.lineHeight);
    out.push_back(header.progressiveRender ? 1 : 0);
    out.push_back(header.updatable ? 1 : 0);
    out.push_back(header.bitsPerPixel);
    out.push_back(header.numColors);
    putU16(out, header.lineCount);
    out.insert(out.end(), header.paletteData.begin(), header.paletteData.end());
    return out;
}

auto packLine(const SpriteLine& line) -> std::vector<std::uint8_t>
{
    auto const& rows = line.rows;
    auto out = std::vector<std::uint8_t> {};
    out.reserve(SpriteLineHeaderSize + rows.paletteData.size() + rows.pixelData.size());
    putU16(out, line.index);
    putU16(out, static_cast<std::uint16_t>(rows.width));
    putU16(out, static_cast<std::uint16_t>(rows.height));
    out.push_back(0); // uncompressed
    out.push_back(static_cast<std::uint8_t>(rows.bitsPerPixel));
    out.push_back(static_cast<std::uint8_t>(rows.numColors));
    out.insert(out.end(), rows.paletteData.begin(), rows.paletteData.end());
    out.insert(out.end(), rows.pixelData.begin(), rows.pixelData.end());
    return out;
}

auto parseHeader(std::span<const std::uint8_t> payload) -> Result<SpriteBlockHeader>
{
    if (payload.size() < SpriteBlockHeaderSize || payload[0] != SpriteBlockHeaderMarker)
        return makeError(ErrorCode::ProtocolError, "Payload is not a sprite block header");

    auto header = SpriteBlockHeader {
        .width = getU16(payload, 1),
        .height = getU16(payload, 3),
        .lineHeight = getU16(payload, 5),
        .lineCount = getU16(payload, 11),
        .bitsPerPixel = payload[9],
        .numColors = payload[10],
        .progressiveRender = payload[7] != 0,
        .updatable = payload[8] != 0,
        .paletteData = {},
    };

    auto const paletteSize = static_cast<std::size_t>(header.numColors) * 3;
    if (payload.size() != SpriteBlockHeaderSize + paletteSize)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Header carries {} bytes, expected {}",
                                     payload.size(),
                                     SpriteBlockHeaderSize + paletteSize));

    header.paletteData.assign(payload.begin() + static_cast<std::ptrdiff_t>(SpriteBlockHeaderSize), payload.end());
    return header;
}

auto parseLine(std::span<const std::uint8_t> payload) -> Result<SpriteLine>
{
    if (payload.size() < SpriteLineHeaderSize)
        return makeError(ErrorCode::ProtocolError, "Payload too short for a sprite line");
    if (payload[0] == SpriteBlockHeaderMarker)
        return makeError(ErrorCode::ProtocolError, "Payload is a sprite block header, not a line");

    auto line = SpriteLine {};
    line.index = getU16(payload, 0);
    line.rows.width = getU16(payload, 2);
    line.rows.height = getU16(payload, 4);
    line.rows.bitsPerPixel = payload[7];
    line.rows.numColors = payload[8];

    if (payload[6] != 0)
        return makeError(ErrorCode::ProtocolError, "Compressed sprite lines are not supported");
    if (line.rows.bitsPerPixel == 0 || line.rows.bitsPerPixel > 8)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Invalid bits per pixel: {}", line.rows.bitsPerPixel));

    auto const paletteSize = static_cast<std::size_t>(line.rows.numColors) * 3;
    auto const pixelSize =
        QuantizedSprite::packedSize(line.rows.width, line.rows.height, line.rows.bitsPerPixel);
    if (payload.size() != SpriteLineHeaderSize + paletteSize + pixelSize)
        return makeError(ErrorCode::ProtocolError,
                         std::format("Line carries {} bytes, expected {}",
                                     payload.size(),
                                     SpriteLineHeaderSize + paletteSize + pixelSize));

    auto const paletteBegin = payload.begin() + static_cast<std::ptrdiff_t>(SpriteLineHeaderSize);
    auto const pixelBegin = paletteBegin + static_cast<std::ptrdiff_t>(paletteSize);
    line.rows.paletteData.assign(paletteBegin, pixelBegin);
    line.rows.pixelData.assign(pixelBegin, payload.end());
    return line;
}

} // namespace framecast
