// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <sprite/Palette.hpp>
#include <sprite/SpriteBlock.hpp>
#include <video/RawFrame.hpp>

namespace framecast
{

/// @brief Target geometry of transmitted sprites.
struct SpriteGeometry
{
    int width = 128;
    int height = 80;
    int lineHeight = 0; ///< Rows per line packet, 0 for a single line covering the sprite.
};

/// @brief Turns raw frames into sprite block messages.
///
/// Frames are resized with nearest-neighbour sampling, promoted to RGB and
/// quantized against the session palette, which is referenced, never copied.
class SpritePacketizer
{
  public:
    /// @param geometry Target sprite geometry.
    /// @param palette The session palette; must outlive the packetizer.
    SpritePacketizer(SpriteGeometry geometry, const Palette& palette);

    /// @brief Encodes one frame.
    /// @return The sprite block, or EncodingError on any inconsistency.
    [[nodiscard]] auto encode(const RawFrame& frame) const -> Result<SpriteBlockMessage>;

    /// @brief Resizes and quantizes one frame without splitting it into lines.
    [[nodiscard]] auto quantizeFrame(const RawFrame& frame) const -> Result<QuantizedSprite>;

    [[nodiscard]] auto geometry() const noexcept -> SpriteGeometry const& { return _geometry; }
    [[nodiscard]] auto palette() const noexcept -> Palette const& { return _palette; }

  private:
    SpriteGeometry _geometry;
    Palette const& _palette;
};

} // namespace framecast
