// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <sprite/Quantizer.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace framecast
{

/// @brief Message identifier every sprite block packet is tagged with.
constexpr auto SpriteBlockMessageId = std::uint8_t { 0x20 };

/// @brief First byte of a header payload. Line payloads never start with it.
constexpr auto SpriteBlockHeaderMarker = std::uint8_t { 0xFF };

/// @brief Fixed size of the header payload before the palette bytes.
constexpr auto SpriteBlockHeaderSize = std::size_t { 13 };

/// @brief Fixed size of a line payload before the palette bytes.
constexpr auto SpriteLineHeaderSize = std::size_t { 9 };

/// @brief Whole-sprite metadata sent ahead of the line packets.
struct SpriteBlockHeader
{
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint16_t lineHeight = 0;
    std::uint16_t lineCount = 0;
    std::uint8_t bitsPerPixel = 0;
    std::uint8_t numColors = 0;
    bool progressiveRender = false;
    bool updatable = true;
    std::vector<std::uint8_t> paletteData;
};

/// @brief One group of consecutive pixel rows.
struct SpriteLine
{
    std::uint16_t index = 0; ///< 1-based, strictly increasing within a block.
    QuantizedSprite rows;
};

/// @brief One still image ready for transmission: a header followed by its line groups.
struct SpriteBlockMessage
{
    SpriteBlockHeader header;
    std::vector<SpriteLine> lines;

    /// @brief Total number of packets (header plus lines).
    [[nodiscard]] auto packetCount() const noexcept -> std::size_t { return lines.size() + 1; }
};

/// @brief Splits a quantized sprite into a sprite block with @p lineHeight rows per line.
///
/// A lineHeight of 0 (or one not smaller than the sprite height) yields a single line.
/// The last line group is shorter when the height is not a multiple of lineHeight.
[[nodiscard]] auto makeSpriteBlock(const QuantizedSprite& sprite, int lineHeight) -> Result<SpriteBlockMessage>;

/// @brief Serializes the header payload.
[[nodiscard]] auto packHeader(const SpriteBlockHeader& header) -> std::vector<std::uint8_t>;

/// @brief Serializes one line payload.
[[nodiscard]] auto packLine(const SpriteLine& line) -> std::vector<std::uint8_t>;

/// @brief Parses a header payload produced by packHeader().
[[nodiscard]] auto parseHeader(std::span<const std::uint8_t> payload) -> Result<SpriteBlockHeader>;

/// @brief Parses a line payload produced by packLine().
[[nodiscard]] auto parseLine(std::span<const std::uint8_t> payload) -> Result<SpriteLine>;

} // namespace framecast
