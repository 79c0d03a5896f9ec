// SPDX-License-Identifier: Apache-2.0
#include "InterruptWatcher.hpp"

#include <core/Log.hpp>

#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace framecast
{

namespace
{
    int gInterruptPipe = -1;            // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigint {};    // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigterm {};   // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void interruptHandler(int sig)
    {
        if (gInterruptPipe >= 0)
        {
            auto const byte = static_cast<char>(sig);
            [[maybe_unused]] auto const n = ::write(gInterruptPipe, &byte, 1);
        }
    }

    constexpr auto PollIntervalMs = 100;
} // namespace

InterruptWatcher::~InterruptWatcher()
{
    stop();
}

auto InterruptWatcher::start(std::function<void()> onInterrupt) -> VoidResult
{
    if (_installed)
        return {};

    if (pipe(_pipe) == -1)
        return makeError(ErrorCode::IoError, "Failed to create interrupt notification pipe");

    for (auto const fd: _pipe)
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

    gInterruptPipe = _pipe[1];

    struct sigaction sa {};
    sa.sa_handler = interruptHandler;
    // One-shot: a second interrupt gets the default action and ends the process.
    sa.sa_flags = SA_RESTART | SA_RESETHAND;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, &gPrevSigint);
    sigaction(SIGTERM, &sa, &gPrevSigterm);
    _installed = true;

    _watcher = std::jthread([readFd = _pipe[0], onInterrupt = std::move(onInterrupt)](std::stop_token token) {
        auto pfd = pollfd { .fd = readFd, .events = POLLIN, .revents = 0 };
        while (!token.stop_requested())
        {
            if (::poll(&pfd, 1, PollIntervalMs) <= 0)
                continue;

            auto sig = char {};
            if (::read(readFd, &sig, 1) == 1)
            {
                log::info("Interrupted (signal {}), stopping...", static_cast<int>(sig));
                onInterrupt();
            }
        }
    });

    return {};
}

void InterruptWatcher::stop()
{
    if (!_installed)
        return;

    sigaction(SIGINT, &gPrevSigint, nullptr);
    sigaction(SIGTERM, &gPrevSigterm, nullptr);
    gInterruptPipe = -1;

    if (_watcher.joinable())
    {
        _watcher.request_stop();
        _watcher.join();
    }

    ::close(_pipe[0]);
    ::close(_pipe[1]);
    _pipe[0] = -1;
    _pipe[1] = -1;
    _installed = false;
}

} // namespace framecast
