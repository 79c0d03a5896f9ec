// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <sprite/SpritePacketizer.hpp>
#include <transport/Transport.hpp>
#include <video/FrameSource.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

namespace framecast
{

/// @brief Lifecycle of a streaming session.
enum class PipelineState : std::uint8_t
{
    Idle,
    Streaming,
    Draining,
    Stopped,
};

[[nodiscard]] constexpr auto pipelineStateName(PipelineState state) -> std::string_view
{
    switch (state)
    {
        case PipelineState::Idle: return "idle";
        case PipelineState::Streaming: return "streaming";
        case PipelineState::Draining: return "draining";
        case PipelineState::Stopped: return "stopped";
    }
    return "unknown";
}

/// @brief Configuration for the frame pipeline.
struct PipelineConfig
{
    std::size_t queueCapacity = 4;
    std::chrono::milliseconds reportInterval = std::chrono::seconds(1);

    /// How long a stop request waits for the in-flight frame before the
    /// transport is cancelled.
    std::chrono::milliseconds stopTimeout = std::chrono::seconds(2);
};

/// @brief Connects a FrameSource to a Transport through the SpritePacketizer.
///
/// A producer task decodes frames into a bounded queue, a consumer task encodes
/// them and sends every packet in order, waiting for each send to complete.
/// Both tasks share one stop token that is polled at the top of each loop
/// iteration, so a frame is either sent completely or not at all when a stop
/// is requested.
class StreamPipeline
{
  public:
    StreamPipeline(FrameSource& source,
                   const SpritePacketizer& packetizer,
                   Transport& transport,
                   PipelineConfig config = {});
    ~StreamPipeline();

    StreamPipeline(const StreamPipeline&) = delete;
    StreamPipeline& operator=(const StreamPipeline&) = delete;

    /// @brief Runs a whole session: connect, stream until the source ends or a stop
    /// is requested, then disconnect.
    ///
    /// If connecting fails no task is started and the transport is not disconnected.
    /// Otherwise the transport is disconnected exactly once, on every exit path.
    /// @return Success on end of stream or requested stop, otherwise the first error.
    [[nodiscard]] auto run() -> VoidResult;

    /// @brief Requests a cooperative stop. Safe to call from any thread, at any time.
    ///
    /// The frame being sent is finished first. If the transport does not complete it
    /// within PipelineConfig::stopTimeout, the transport is cancelled and the session
    /// still ends as a clean stop.
    void requestStop();

    [[nodiscard]] auto state() const -> PipelineState;

    /// @brief Number of frames whose packets were all accepted by the transport.
    [[nodiscard]] auto framesSent() const -> std::uint64_t;

    /// @brief Number of packets accepted by the transport.
    [[nodiscard]] auto packetsSent() const -> std::uint64_t;

    /// @brief Largest number of frames that were queued at once.
    [[nodiscard]] auto peakQueueDepth() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace framecast
