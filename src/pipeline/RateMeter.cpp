// SPDX-License-Identifier: Apache-2.0
#include "RateMeter.hpp"

namespace framecast
{

using namespace std::chrono_literals;

RateMeter::RateMeter(std::chrono::milliseconds reportInterval): _reportInterval(reportInterval)
{
}

void RateMeter::start(Clock::time_point now)
{
    _startedAt = now;
    _lastReport.reset();
    _frames = 0;
}

auto RateMeter::recordFrame(Clock::time_point now) -> std::optional<RateSample>
{
    ++_frames;

    if (now - _startedAt <= 1s)
        return std::nullopt;
    if (_lastReport && now - *_lastReport < _reportInterval)
        return std::nullopt;

    _lastReport = now;
    return snapshot(now);
}

auto RateMeter::snapshot(Clock::time_point now) const -> RateSample
{
    auto const elapsed = std::chrono::duration<double>(now - _startedAt).count();
    return RateSample {
        .frames = _frames,
        .elapsedSeconds = elapsed,
        .fps = elapsed > 0.0 ? static_cast<double>(_frames) / elapsed : 0.0,
    };
}

} // namespace framecast
