// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <thread>

namespace framecast
{

/// @brief Turns SIGINT/SIGTERM into a callback on a regular thread.
///
/// The signal handler only writes to a self-pipe; a watcher thread reads it
/// and invokes the callback, so the callback may lock mutexes or request stops.
/// The handlers are one-shot, so a second interrupt terminates the process
/// even if the session does not wind down.
/// Only one watcher should be active at a time.
class InterruptWatcher
{
  public:
    InterruptWatcher() = default;
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    /// @brief Installs the handlers and starts the watcher thread.
    [[nodiscard]] auto start(std::function<void()> onInterrupt) -> VoidResult;

    /// @brief Restores the previous handlers and joins the watcher thread.
    void stop();

  private:
    int _pipe[2] = { -1, -1 };
    std::jthread _watcher;
    bool _installed = false;
};

} // namespace framecast
