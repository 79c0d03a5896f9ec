// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <transport/Transport.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace framecast
{

/// @brief Command line of the link bridge process.
struct BridgeConfig
{
    std::string command = "frame-bridge";
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Transport that drives the device link through a bridge process.
///
/// The bridge owns the actual radio link. It is spawned on connect() and fed
/// over its stdin: every request is one JSON line followed by `length` raw
/// payload bytes. Every request is answered by one JSON line on its stdout,
/// either {"ok":true} or {"ok":false,"error":"..."}.
/// All pipe I/O waits in poll() together with a wake-up pipe, so cancel()
/// can end a request the bridge never answers.
class BridgeTransport: public Transport
{
  public:
    explicit BridgeTransport(BridgeConfig config);
    ~BridgeTransport() override;

    BridgeTransport(const BridgeTransport&) = delete;
    BridgeTransport& operator=(const BridgeTransport&) = delete;

    [[nodiscard]] auto connect() -> VoidResult override;
    void disconnect() override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto sendMessage(std::uint8_t tag, std::span<const std::uint8_t> payload) -> VoidResult override;

    /// @brief Wakes a request blocked on a silent bridge. Thread-safe.
    void cancel() override;

  private:
    [[nodiscard]] auto request(const nlohmann::json& header, std::span<const std::uint8_t> payload) -> VoidResult;

    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace framecast
