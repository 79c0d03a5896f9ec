// SPDX-License-Identifier: Apache-2.0
#include "Palette.hpp"

#include <algorithm>
#include <bit>
#include <format>
#include <limits>

namespace framecast
{

Palette::Palette(std::array<Rgb, Size> entries): _entries(entries)
{
    _bytes.reserve(_entries.size() * 3);
    for (auto const& entry: _entries)
    {
        _bytes.push_back(entry.r);
        _bytes.push_back(entry.g);
        _bytes.push_back(entry.b);
    }
}

auto Palette::grayscale() -> Palette
{
    return Palette({ {
        { 0, 0, 0 },
        { 85, 85, 85 },
        { 170, 170, 170 },
        { 255, 255, 255 },
    } });
}

auto Palette::fromEntries(std::span<const Rgb> entries) -> Result<Palette>
{
    if (entries.size() != Size)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Palette must have exactly {} entries, got {}", Size, entries.size()));

    auto array = std::array<Rgb, Size> {};
    std::ranges::copy(entries, array.begin());
    return Palette(array);
}

auto Palette::bitsPerPixel() const noexcept -> int
{
    return bitsPerPixelFor(_entries.size());
}

auto Palette::nearestIndex(Rgb color) const noexcept -> std::uint8_t
{
    auto bestIdx = std::size_t { 0 };
    auto bestDist = std::numeric_limits<int>::max();
    for (auto i = std::size_t { 0 }; i < _entries.size(); ++i)
    {
        auto const& c = _entries[i];
        auto const dr = static_cast<int>(color.r) - static_cast<int>(c.r);
        auto const dg = static_cast<int>(color.g) - static_cast<int>(c.g);
        auto const db = static_cast<int>(color.b) - static_cast<int>(c.b);
        auto const dist = dr * dr + dg * dg + db * db;
        if (dist < bestDist)
        {
            bestDist = dist;
            bestIdx = i;
        }
    }
    return static_cast<std::uint8_t>(bestIdx);
}

auto bitsPerPixelFor(std::size_t colorCount) noexcept -> int
{
    if (colorCount <= 2)
        return 1;
    return static_cast<int>(std::bit_width(colorCount - 1));
}

} // namespace framecast
