// SPDX-License-Identifier: Apache-2.0
#include "StreamPipeline.hpp"

#include <core/Log.hpp>
#include <pipeline/FrameQueue.hpp>
#include <pipeline/RateMeter.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace framecast
{

namespace
{
    /// @brief Disconnects a connected transport when leaving scope.
    class ConnectionGuard
    {
      public:
        explicit ConnectionGuard(Transport& transport): _transport(transport) {}

        ~ConnectionGuard()
        {
            log::info("Disconnecting...");
            _transport.disconnect();
        }

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

      private:
        Transport& _transport;
    };
} // namespace

struct StreamPipeline::Impl
{
    FrameSource& source;
    SpritePacketizer const& packetizer;
    Transport& transport;
    PipelineConfig config;

    FrameQueue<RawFrame> queue;
    std::stop_source stopSource;
    RateMeter meter;

    std::atomic<PipelineState> state = PipelineState::Idle;
    std::atomic<std::uint64_t> framesSent = 0;
    std::atomic<std::uint64_t> packetsSent = 0;
    std::atomic<std::size_t> peakQueueDepth = 0;

    std::mutex errorMutex;
    std::optional<Error> firstError;

    std::mutex doneMutex;
    std::condition_variable_any doneCv;
    bool consumerDone = false;
    std::atomic<bool> transportCancelled = false;

    Impl(FrameSource& source, SpritePacketizer const& packetizer, Transport& transport, PipelineConfig config):
        source(source),
        packetizer(packetizer),
        transport(transport),
        config(config),
        queue(config.queueCapacity),
        meter(config.reportInterval)
    {
    }

    /// @brief Records a session-fatal error and cancels both tasks.
    void fail(Error error)
    {
        if (transportCancelled)
        {
            // The failure is the expected result of cancelling a stalled send.
            log::debug("Send aborted after stop: {}", error);
            stopSource.request_stop();
            return;
        }
        {
            auto lock = std::lock_guard(errorMutex);
            if (!firstError)
                firstError = std::move(error);
        }
        state = PipelineState::Stopped;
        stopSource.request_stop();
    }

    void produce(const std::stop_token& stopToken)
    {
        try
        {
            produceFrames(stopToken);
        }
        catch (const std::exception& e)
        {
            fail(Error { ErrorCode::Unknown, std::format("Frame producer failed: {}", e.what()) });
        }

        queue.close();
        source.close();
        log::debug("Producer finished after {} frame(s)", source.framesEmitted());
    }

    void produceFrames(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto frame = source.next();
            if (!frame)
                break;

            auto const ordinal = frame->ordinal;
            if (!queue.push(std::move(*frame), stopToken))
                break;

            auto const depth = queue.size();
            auto peak = peakQueueDepth.load();
            while (depth > peak && !peakQueueDepth.compare_exchange_weak(peak, depth))
                ;
            log::trace("Queued frame {} (depth {})", ordinal, depth);
        }
    }

    /// @brief Sends all packets of one frame, header first, each send awaited.
    auto sendFrame(SpriteBlockMessage const& message) -> VoidResult
    {
        auto const header = packHeader(message.header);
        if (auto result = transport.sendMessage(SpriteBlockMessageId, header); !result)
            return result;
        ++packetsSent;

        for (auto const& line: message.lines)
        {
            auto const payload = packLine(line);
            if (auto result = transport.sendMessage(SpriteBlockMessageId, payload); !result)
                return result;
            ++packetsSent;
        }
        return {};
    }

    void consume(const std::stop_token& stopToken)
    {
        try
        {
            consumeFrames(stopToken);
        }
        catch (const std::exception& e)
        {
            fail(Error { ErrorCode::Unknown, std::format("Frame sender failed: {}", e.what()) });
        }

        {
            auto lock = std::lock_guard(doneMutex);
            consumerDone = true;
        }
        doneCv.notify_all();
    }

    /// @brief Waits for the consumer. Once a stop is requested it gets stopTimeout to
    /// finish its frame, then the transport is cancelled to unblock it.
    void awaitConsumer(const std::stop_token& stopToken)
    {
        auto lock = std::unique_lock(doneMutex);
        if (doneCv.wait(lock, stopToken, [this] { return consumerDone; }))
            return;
        if (doneCv.wait_for(lock, config.stopTimeout, [this] { return consumerDone; }))
            return;
        lock.unlock();

        log::warning("Link did not complete the current frame within {} ms, cancelling", config.stopTimeout.count());
        transportCancelled = true;
        transport.cancel();
    }

    void consumeFrames(const std::stop_token& stopToken)
    {
        meter.start();

        while (!stopToken.stop_requested())
        {
            auto frame = queue.pop(stopToken);
            if (!frame)
            {
                if (queue.finished())
                {
                    state = PipelineState::Draining;
                    log::debug("End of stream reached");
                }
                break;
            }

            auto message = packetizer.encode(*frame);
            if (!message)
            {
                fail(message.error());
                break;
            }

            if (auto result = sendFrame(*message); !result)
            {
                fail(result.error());
                break;
            }

            ++framesSent;
            if (auto const sample = meter.recordFrame())
                log::info("Sent frames: {}, FPS: {:.2f}", sample->frames, sample->fps);
        }
    }
};

StreamPipeline::StreamPipeline(FrameSource& source,
                               const SpritePacketizer& packetizer,
                               Transport& transport,
                               PipelineConfig config):
    _impl(std::make_unique<Impl>(source, packetizer, transport, config))
{
}

StreamPipeline::~StreamPipeline() = default;

auto StreamPipeline::run() -> VoidResult
{
    if (_impl->state != PipelineState::Idle)
        return makeError(ErrorCode::InvalidArgument, "A pipeline can only run once");

    if (auto result = _impl->transport.connect(); !result)
    {
        _impl->state = PipelineState::Stopped;
        _impl->source.close();
        return result;
    }

    {
        auto const connection = ConnectionGuard(_impl->transport);

        _impl->state = PipelineState::Streaming;
        {
            auto const token = _impl->stopSource.get_token();
            auto producer = std::jthread([this, token] { _impl->produce(token); });
            auto consumer = std::jthread([this, token] { _impl->consume(token); });
            _impl->awaitConsumer(token);
            // Consumer may exit first (error, stop); make sure a blocked producer wakes up.
            consumer.join();
            _impl->stopSource.request_stop();
            producer.join();
        }
    }

    _impl->state = PipelineState::Stopped;
    log::info("Streaming stopped after {} frame(s)", _impl->framesSent.load());

    auto lock = std::lock_guard(_impl->errorMutex);
    if (_impl->firstError)
        return std::unexpected(*_impl->firstError);
    return {};
}

void StreamPipeline::requestStop()
{
    _impl->stopSource.request_stop();
}

auto StreamPipeline::state() const -> PipelineState
{
    return _impl->state;
}

auto StreamPipeline::framesSent() const -> std::uint64_t
{
    return _impl->framesSent;
}

auto StreamPipeline::packetsSent() const -> std::uint64_t
{
    return _impl->packetsSent;
}

auto StreamPipeline::peakQueueDepth() const -> std::size_t
{
    return _impl->peakQueueDepth;
}

} // namespace framecast
