// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <span>

namespace framecast
{

/// @brief Abstract interface for the message link to the display device.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Establishes the link.
    /// @return Success or a TransportError.
    [[nodiscard]] virtual auto connect() -> VoidResult = 0;

    /// @brief Tears the link down.
    virtual void disconnect() = 0;

    /// @brief Returns true while the link is usable.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Sends one tagged message and waits until the peer accepted it.
    /// @param tag The message identifier.
    /// @param payload The message body.
    /// @return Success or a TransportError.
    [[nodiscard]] virtual auto sendMessage(std::uint8_t tag, std::span<const std::uint8_t> payload)
        -> VoidResult = 0;

    /// @brief Makes a pending or future send fail promptly with a TransportError.
    ///
    /// Called from another thread when the peer stopped answering.
    /// Stays in effect until the next connect().
    virtual void cancel() {}
};

} // namespace framecast
