// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace framecast
{

/// @brief A single 8-bit RGB palette entry.
struct Rgb
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    constexpr auto operator==(const Rgb&) const -> bool = default;
};

/// @brief Immutable indexed-color palette of exactly four entries.
///
/// Built once per streaming session and shared by const reference with every
/// component that quantizes or serializes frames.
class Palette
{
  public:
    static constexpr auto Size = std::size_t { 4 };

    /// @brief Creates the fixed 4-level grayscale palette (0, 85, 170, 255).
    [[nodiscard]] static auto grayscale() -> Palette;

    /// @brief Creates a palette from arbitrary entries.
    /// @return The palette, or InvalidArgument if the entry count is not 4.
    [[nodiscard]] static auto fromEntries(std::span<const Rgb> entries) -> Result<Palette>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return _entries.size(); }
    [[nodiscard]] auto entries() const noexcept -> std::span<const Rgb> { return _entries; }
    [[nodiscard]] auto at(std::size_t index) const -> Rgb const& { return _entries.at(index); }

    /// @brief Returns the palette as packed RGB triples (3 bytes per entry).
    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::uint8_t> { return _bytes; }

    /// @brief Bits needed to index every entry, i.e. ceil(log2(size())).
    [[nodiscard]] auto bitsPerPixel() const noexcept -> int;

    /// @brief Returns the index of the entry closest to the given color.
    ///
    /// Distance is squared Euclidean distance in RGB space. On a tie the
    /// lowest index wins, so the mapping is fully deterministic.
    [[nodiscard]] auto nearestIndex(Rgb color) const noexcept -> std::uint8_t;

  private:
    explicit Palette(std::array<Rgb, Size> entries);

    std::array<Rgb, Size> _entries;
    std::vector<std::uint8_t> _bytes;
};

/// @brief Bits per pixel for a palette of @p colorCount entries.
[[nodiscard]] auto bitsPerPixelFor(std::size_t colorCount) noexcept -> int;

} // namespace framecast
