// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace framecast::log
{

/// @brief Verbosity level for log messages, ordered from least to most verbose.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to @p callback instead of stderr.
///
/// Pass an empty callback to revert to stderr output.
/// The callback is invoked under the log mutex, possibly from the pipeline threads.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Lower-case name as used in the config file ("error" ... "trace").
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name; "warn" is accepted as an alias for "warning".
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Writes a log message at the given level.
///
/// Stderr output is prefixed with a wall-clock timestamp and the level,
/// and is serialized so that lines from different threads never interleave.
void write(Level level, std::string_view message);

/// @brief Captures log output for the lifetime of the object, then restores stderr.
///
/// Also raises the level to @p level so that debug output can be inspected.
class ScopedCapture
{
  public:
    struct Entry
    {
        Level level;
        std::string message;
    };

    explicit ScopedCapture(Level level = Level::Trace);
    ~ScopedCapture();

    ScopedCapture(const ScopedCapture&) = delete;
    ScopedCapture& operator=(const ScopedCapture&) = delete;

    [[nodiscard]] auto entries() const -> std::vector<Entry>;

    /// @brief Whether any captured message contains @p needle.
    [[nodiscard]] auto contains(std::string_view needle) const -> bool;

  private:
    Level _previousLevel;
    mutable std::mutex _mutex;
    std::vector<Entry> _entries;
};

namespace detail
{
    template <typename... Args>
    void emit(Level level, std::format_string<Args...> fmt, Args&&... args)
    {
        // Formatting is skipped entirely for filtered levels.
        if (level <= getLevel())
            write(level, std::format(fmt, std::forward<Args>(args)...));
    }
} // namespace detail

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Debug, fmt, std::forward<Args>(args)...);
}

/// @brief Per-packet output.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace framecast::log
