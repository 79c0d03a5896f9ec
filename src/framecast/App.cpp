// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <framecast/InterruptWatcher.hpp>
#include <pipeline/StreamPipeline.hpp>
#include <sprite/Palette.hpp>
#include <sprite/SpritePacketizer.hpp>
#include <transport/BridgeTransport.hpp>
#include <video/FrameSource.hpp>

#include <filesystem>
#include <format>
#include <optional>

namespace framecast
{

auto checkVideoPath(std::string_view path) -> VoidResult
{
    auto ec = std::error_code {};
    if (path.empty() || !std::filesystem::is_regular_file(path, ec))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Video file not found at '{}' or no file provided.", path));
    return {};
}

struct App::Impl
{
    AppConfig config;
    std::string videoPath;

    // Built once per session and referenced by the packetizer for every frame.
    Palette palette = Palette::grayscale();

    std::optional<FrameSource> source;
    std::unique_ptr<Transport> transport;
    std::unique_ptr<SpritePacketizer> packetizer;
};

App::App(AppConfig config, std::string videoPath): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    _impl->videoPath = std::move(videoPath);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (auto result = validateConfig(_impl->config); !result)
        return result;

    auto source = FrameSource::open(_impl->videoPath, static_cast<double>(_impl->config.stream.fps));
    if (!source)
        return std::unexpected(source.error());
    _impl->source.emplace(std::move(*source));

    _impl->packetizer = std::make_unique<SpritePacketizer>(_impl->config.stream.sprite, _impl->palette);

    if (!_impl->transport)
        _impl->transport = std::make_unique<BridgeTransport>(_impl->config.bridge);

    auto const& sprite = _impl->config.stream.sprite;
    log::info("Streaming {} as {}x{} sprites, {} colors at {} bpp",
              _impl->videoPath,
              sprite.width,
              sprite.height,
              _impl->palette.size(),
              _impl->palette.bitsPerPixel());
    return {};
}

void App::setTransport(std::unique_ptr<Transport> transport)
{
    _impl->transport = std::move(transport);
}

auto App::run() -> int
{
    if (!_impl->source || !_impl->packetizer || !_impl->transport)
    {
        log::error("App::run() called before a successful initialize()");
        return 1;
    }

    auto pipeline = StreamPipeline(*_impl->source, *_impl->packetizer, *_impl->transport, _impl->config.pipeline);

    auto interrupts = InterruptWatcher {};
    if (auto result = interrupts.start([&pipeline] { pipeline.requestStop(); }); !result)
        log::warning("Interrupt handling unavailable: {}", result.error().message);

    auto const result = pipeline.run();
    interrupts.stop();

    if (!result)
    {
        log::error("An error occurred: {}", result.error());
        return 1;
    }

    return 0;
}

} // namespace framecast
