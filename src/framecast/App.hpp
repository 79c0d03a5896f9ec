// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <framecast/Config.hpp>
#include <transport/Transport.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace framecast
{

/// @brief Checks that @p path names an existing regular file.
/// @return Success, or InvalidArgument with a message suitable for the user.
[[nodiscard]] auto checkVideoPath(std::string_view path) -> VoidResult;

/// @brief Wires the session palette, video source, packetizer, transport and pipeline together.
class App
{
  public:
    /// @param config The application configuration.
    /// @param videoPath The video file to stream.
    App(AppConfig config, std::string videoPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the video source and prepares the link bridge.
    /// @return Success, or SourceUnavailable if the video cannot be decoded.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Replaces the link transport (before run()).
    void setTransport(std::unique_ptr<Transport> transport);

    /// @brief Streams the video until it ends, an error occurs, or the user interrupts.
    /// @return Exit code: 0 on end of stream or interrupt, 1 on a session error.
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace framecast
