// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <print>

namespace framecast::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};

    struct LevelInfo
    {
        Level level;
        std::string_view name;
        std::string_view prefix;
    };

    constexpr auto Levels = std::array {
        LevelInfo { Level::Error, "error", "ERROR" },   LevelInfo { Level::Warning, "warning", "WARN " },
        LevelInfo { Level::Info, "info", "INFO " },     LevelInfo { Level::Debug, "debug", "DEBUG" },
        LevelInfo { Level::Trace, "trace", "TRACE" },
    };

    constexpr auto infoFor(Level level) -> LevelInfo const&
    {
        return Levels[static_cast<std::size_t>(level)];
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelName(Level level) -> std::string_view
{
    return infoFor(level).name;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "warn")
        return Level::Warning;
    auto const it = std::ranges::find(Levels, name, &LevelInfo::name);
    if (it == Levels.end())
        return std::nullopt;
    return it->level;
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr, "[{:%T}] [{}] {}", now, infoFor(level).prefix, message);
}

ScopedCapture::ScopedCapture(Level level): _previousLevel(getLevel())
{
    setCallback([this](Level messageLevel, std::string_view message) {
        auto lock = std::lock_guard(_mutex);
        _entries.push_back(Entry { .level = messageLevel, .message = std::string(message) });
    });
    setLevel(level);
}

ScopedCapture::~ScopedCapture()
{
    setCallback({});
    setLevel(_previousLevel);
}

auto ScopedCapture::entries() const -> std::vector<Entry>
{
    auto lock = std::lock_guard(_mutex);
    return _entries;
}

auto ScopedCapture::contains(std::string_view needle) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return std::ranges::any_of(_entries, [needle](Entry const& entry) { return entry.message.contains(needle); });
}

} // namespace framecast::log
