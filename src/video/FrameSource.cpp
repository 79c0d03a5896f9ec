// SPDX-License-Identifier: Apache-2.0
#include "FrameSource.hpp"

#include <core/Log.hpp>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace framecast
{

namespace
{
    /// @brief Converts a decoded frame into an owned single-channel frame.
    auto toGrayFrame(const cv::Mat& decoded, std::uint64_t ordinal) -> std::optional<RawFrame>
    {
        auto gray = cv::Mat {};
        try
        {
            switch (decoded.channels())
            {
                case 1: gray = decoded; break;
                case 3: cv::cvtColor(decoded, gray, cv::COLOR_BGR2GRAY); break;
                case 4: cv::cvtColor(decoded, gray, cv::COLOR_BGRA2GRAY); break;
                default:
                    log::warning("Skipping frame {} with {} channels", ordinal, decoded.channels());
                    return std::nullopt;
            }
            if (gray.depth() != CV_8U)
                gray.convertTo(gray, CV_8U);
        }
        catch (const cv::Exception& e)
        {
            log::warning("Grayscale conversion of frame {} failed: {}", ordinal, e.what());
            return std::nullopt;
        }

        auto frame = RawFrame {};
        frame.width = gray.cols;
        frame.height = gray.rows;
        frame.ordinal = ordinal;
        frame.pixels.resize(static_cast<std::size_t>(gray.cols) * static_cast<std::size_t>(gray.rows));
        for (auto y = 0; y < gray.rows; ++y)
        {
            auto const* row = gray.ptr<std::uint8_t>(y);
            std::copy_n(row, gray.cols, frame.pixels.begin() + static_cast<std::ptrdiff_t>(y) * gray.cols);
        }
        return frame;
    }
} // namespace

auto decimationStride(double nativeFps, double targetFps) noexcept -> int
{
    if (!std::isfinite(nativeFps) || nativeFps <= 0.0)
        nativeFps = DefaultSourceFrameRate;
    if (!std::isfinite(targetFps) || targetFps <= 0.0)
        return 1;

    // std::nearbyint honours the default rounding mode: halfway cases go to even.
    auto const ratio = std::nearbyint(nativeFps / targetFps);
    return std::max(1, static_cast<int>(ratio));
}

FrameSource::FrameSource(std::unique_ptr<VideoDecoder> decoder, double nativeFps, double targetFps):
    _decoder(std::move(decoder)),
    _nativeFps(nativeFps),
    _targetFps(targetFps),
    _stride(decimationStride(nativeFps, targetFps))
{
}

FrameSource::~FrameSource()
{
    close();
}

FrameSource::FrameSource(FrameSource&&) noexcept = default;

FrameSource& FrameSource::operator=(FrameSource&& other) noexcept
{
    if (this != &other)
    {
        close();
        _decoder = std::move(other._decoder);
        _nativeFps = other._nativeFps;
        _targetFps = other._targetFps;
        _stride = other._stride;
        _ordinal = other._ordinal;
        _emitted = other._emitted;
    }
    return *this;
}

auto FrameSource::open(std::string_view path, double targetFps) -> Result<FrameSource>
{
    auto decoder = openVideoFile(path);
    if (!decoder)
        return std::unexpected(decoder.error());

    return fromDecoder(std::move(*decoder), targetFps);
}

auto FrameSource::fromDecoder(std::unique_ptr<VideoDecoder> decoder, double targetFps) -> Result<FrameSource>
{
    if (!decoder)
        return makeError(ErrorCode::SourceUnavailable, "No video decoder");
    if (!std::isfinite(targetFps) || targetFps <= 0.0)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid target frame rate: {}", targetFps));

    auto nativeFps = decoder->frameRate();
    if (!std::isfinite(nativeFps) || nativeFps <= 0.0)
    {
        log::warning("Source reports no frame rate, assuming {} FPS", DefaultSourceFrameRate);
        nativeFps = DefaultSourceFrameRate;
    }

    auto source = FrameSource(std::move(decoder), nativeFps, targetFps);
    log::info("Source video: {:.2f} FPS. Processing every {} frame(s) for a target of ~{} FPS (achieved {:.2f} FPS).",
              source.nativeFps(),
              source.stride(),
              targetFps,
              source.achievedFps());
    return source;
}

auto FrameSource::next() -> std::optional<RawFrame>
{
    auto decoded = cv::Mat {};
    while (_decoder)
    {
        if (!_decoder->read(decoded))
        {
            log::debug("Video source exhausted after {} frame(s), {} emitted", _ordinal, _emitted);
            close();
            return std::nullopt;
        }

        auto const ordinal = _ordinal++;
        if (ordinal % static_cast<std::uint64_t>(_stride) != 0)
            continue;

        auto frame = toGrayFrame(decoded, ordinal);
        if (!frame)
        {
            close();
            return std::nullopt;
        }

        ++_emitted;
        return frame;
    }
    return std::nullopt;
}

void FrameSource::close()
{
    if (!_decoder)
        return;

    _decoder->release();
    _decoder.reset();
}

} // namespace framecast
