// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <pipeline/StreamPipeline.hpp>
#include <sprite/SpritePacketizer.hpp>
#include <transport/BridgeTransport.hpp>

#include <string>
#include <string_view>

namespace framecast
{

/// @brief Output stream section: sprite geometry and frame rate.
struct StreamConfig
{
    SpriteGeometry sprite;
    int fps = 14;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    StreamConfig stream;
    PipelineConfig pipeline;
    BridgeConfig bridge;
    log::Level logLevel = log::Level::Info;
};

/// @brief Checks value ranges that the wire format and pipeline rely on.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Loads the configuration from the default config path, or defaults if absent.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating parent directories as needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/framecast or ~/.config/framecast
/// On macOS: ~/Library/Application Support/framecast
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace framecast
