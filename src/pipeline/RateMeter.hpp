// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace framecast
{

/// @brief Throughput snapshot.
struct RateSample
{
    std::uint64_t frames = 0;
    double elapsedSeconds = 0.0;
    double fps = 0.0;
};

/// @brief Tracks frames sent against wall-clock time.
///
/// Observability only: it never throttles. A sample is produced once more than
/// one second has elapsed since start(), and then at most once per interval.
class RateMeter
{
  public:
    using Clock = std::chrono::steady_clock;

    explicit RateMeter(std::chrono::milliseconds reportInterval = std::chrono::seconds(1));

    void start(Clock::time_point now = Clock::now());

    /// @brief Records one sent frame.
    /// @return A sample when a report is due, std::nullopt otherwise.
    [[nodiscard]] auto recordFrame(Clock::time_point now = Clock::now()) -> std::optional<RateSample>;

    /// @brief Returns the current totals regardless of the report cadence.
    [[nodiscard]] auto snapshot(Clock::time_point now = Clock::now()) const -> RateSample;

    [[nodiscard]] auto frames() const noexcept -> std::uint64_t { return _frames; }

  private:
    std::chrono::milliseconds _reportInterval;
    Clock::time_point _startedAt {};
    std::optional<Clock::time_point> _lastReport;
    std::uint64_t _frames = 0;
};

} // namespace framecast
