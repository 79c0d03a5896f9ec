// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <framecast/App.hpp>
#include <framecast/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "framecast - stream a video file to a wearable display as grayscale sprites" };

    auto videoPath = std::string {};
    auto configPath = std::string {};
    auto width = 0;
    auto height = 0;
    auto fps = 0;
    auto lineHeight = -1;
    auto queueCapacity = 0;
    auto bridgeCommand = std::string {};
    auto verbose = false;

    app.add_option("video_file", videoPath, "The path to the video file to stream");
    app.add_option("--width", width, "Width to resize the video to (default 128)");
    app.add_option("--height", height, "Height to resize the video to (default 80)");
    app.add_option("--fps", fps, "Target FPS for streaming (default 14)");
    app.add_option("--line-height", lineHeight, "Rows per line packet, 0 for one packet per frame");
    app.add_option("--queue-capacity", queueCapacity, "Frames buffered between decoder and sender (default 4)");
    app.add_option("--bridge", bridgeCommand, "Link bridge command");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (auto checked = framecast::checkVideoPath(videoPath); !checked)
    {
        std::println(stderr, "Error: {}", checked.error().message);
        std::print(stderr, "{}", app.help());
        return 1;
    }

    auto configResult = configPath.empty() ? framecast::loadConfig() : framecast::loadConfigFromFile(configPath);
    if (!configResult)
    {
        framecast::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    framecast::log::setLevel(verbose ? framecast::log::Level::Debug : config.logLevel);

    // Apply CLI overrides
    if (width > 0)
        config.stream.sprite.width = width;
    if (height > 0)
        config.stream.sprite.height = height;
    if (fps > 0)
        config.stream.fps = fps;
    if (lineHeight >= 0)
        config.stream.sprite.lineHeight = lineHeight;
    if (queueCapacity > 0)
        config.pipeline.queueCapacity = static_cast<std::size_t>(queueCapacity);
    if (!bridgeCommand.empty())
    {
        config.bridge.command = bridgeCommand;
        config.bridge.args.clear();
    }

    // A vanished link bridge must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    auto application = framecast::App(std::move(config), videoPath);
    if (auto initResult = application.initialize(); !initResult)
    {
        framecast::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
