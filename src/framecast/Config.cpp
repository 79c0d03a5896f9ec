// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace framecast
{

namespace
{
    constexpr auto MaxSpriteDimension = static_cast<int>(std::numeric_limits<std::uint16_t>::max());
} // namespace

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/framecast";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/framecast";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/framecast";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const& sprite = config.stream.sprite;
    if (sprite.width < 1 || sprite.width > MaxSpriteDimension || sprite.height < 1
        || sprite.height > MaxSpriteDimension)
        return makeError(ErrorCode::ConfigError,
                         std::format("Sprite size {}x{} must be within 1..{}", sprite.width, sprite.height, MaxSpriteDimension));
    if (sprite.lineHeight < 0)
        return makeError(ErrorCode::ConfigError, std::format("Line height must not be negative, got {}", sprite.lineHeight));
    if (config.stream.fps < 1)
        return makeError(ErrorCode::ConfigError, std::format("Frame rate must be at least 1, got {}", config.stream.fps));
    if (config.pipeline.queueCapacity < 1)
        return makeError(ErrorCode::ConfigError, "Queue capacity must be at least 1");
    if (config.pipeline.reportInterval.count() < 0)
        return makeError(ErrorCode::ConfigError, "Report interval must not be negative");
    if (config.pipeline.stopTimeout.count() < 0)
        return makeError(ErrorCode::ConfigError, "Stop timeout must not be negative");
    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config root in {} must be an object", path));

    auto config = AppConfig {};

    // Stream section
    if (root.contains("stream"))
    {
        auto const& stream = root["stream"];
        config.stream.sprite.width = json::getIntOr(stream, "width", config.stream.sprite.width);
        config.stream.sprite.height = json::getIntOr(stream, "height", config.stream.sprite.height);
        config.stream.sprite.lineHeight = json::getIntOr(stream, "lineHeight", config.stream.sprite.lineHeight);
        config.stream.fps = json::getIntOr(stream, "fps", config.stream.fps);
    }

    // Pipeline section
    if (root.contains("pipeline"))
    {
        auto const& pipeline = root["pipeline"];
        auto const capacity = json::getIntOr(pipeline, "queueCapacity", static_cast<int>(config.pipeline.queueCapacity));
        if (capacity < 1)
            return makeError(ErrorCode::ConfigError, std::format("Queue capacity must be at least 1, got {}", capacity));
        config.pipeline.queueCapacity = static_cast<std::size_t>(capacity);
        config.pipeline.reportInterval = std::chrono::milliseconds(
            json::getIntOr(pipeline, "reportIntervalMs", static_cast<int>(config.pipeline.reportInterval.count())));
        config.pipeline.stopTimeout = std::chrono::milliseconds(
            json::getIntOr(pipeline, "stopTimeoutMs", static_cast<int>(config.pipeline.stopTimeout.count())));
    }

    // Bridge section
    if (root.contains("bridge"))
    {
        auto const& bridge = root["bridge"];
        config.bridge.command = json::getStringOr(bridge, "command", config.bridge.command);
        config.bridge.args = json::getStringList(bridge, "args");
        config.bridge.env = json::getStringMap(bridge, "env");
    }

    if (root.contains("logLevel"))
    {
        auto const name = json::getStringOr(root, "logLevel", "info");
        auto const level = log::parseLevel(name);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", name));
        config.logLevel = *level;
    }

    if (auto result = validateConfig(config); !result)
        return std::unexpected(result.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["stream"] = {
        { "width", config.stream.sprite.width },
        { "height", config.stream.sprite.height },
        { "lineHeight", config.stream.sprite.lineHeight },
        { "fps", config.stream.fps },
    };

    root["pipeline"] = {
        { "queueCapacity", config.pipeline.queueCapacity },
        { "reportIntervalMs", config.pipeline.reportInterval.count() },
        { "stopTimeoutMs", config.pipeline.stopTimeout.count() },
    };

    auto bridge = nlohmann::json::object();
    bridge["command"] = config.bridge.command;
    if (!config.bridge.args.empty())
        bridge["args"] = config.bridge.args;
    if (!config.bridge.env.empty())
        bridge["env"] = config.bridge.env;
    root["bridge"] = std::move(bridge);

    root["logLevel"] = std::string(log::levelName(config.logLevel));

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::ConfigError,
                             std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace framecast
