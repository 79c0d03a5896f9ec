// SPDX-License-Identifier: Apache-2.0
#include "BridgeTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace framecast
{

namespace
{
    void closeFd(int& fd)
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }

    void addFdFlags(int fd, int fdFlags, int statusFlags)
    {
        if (fdFlags)
            fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | fdFlags);
        if (statusFlags)
            fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | statusFlags);
    }

    /// @brief Inherited environment with the configured overrides appended.
    auto mergedEnvironment(std::map<std::string, std::string> const& overrides) -> std::vector<std::string>
    {
        auto entries = std::vector<std::string> {};
        for (auto** e = environ; e && *e; ++e)
            entries.emplace_back(*e);
        for (auto const& [key, value]: overrides)
            entries.push_back(std::format("{}={}", key, value));
        return entries;
    }

    auto pointersTo(std::vector<std::string>& strings) -> std::vector<char*>
    {
        auto pointers = std::vector<char*> {};
        pointers.reserve(strings.size() + 1);
        for (auto& s: strings)
            pointers.push_back(s.data());
        pointers.push_back(nullptr);
        return pointers;
    }
} // namespace

struct BridgeTransport::Impl
{
    BridgeConfig config;
    pid_t childPid = -1;
    int toBridge = -1;   ///< Our end of the bridge's stdin (non-blocking).
    int fromBridge = -1; ///< Our end of the bridge's stdout.
    bool connected = false;
    std::string readBuffer;

    // cancel() may be called from another thread while a request is blocked in poll().
    std::atomic<bool> cancelled = false;
    int wakeRead = -1;
    int wakeWrite = -1;

    Impl()
    {
        int fds[2];
        if (pipe(fds) != 0)
            return;
        wakeRead = fds[0];
        wakeWrite = fds[1];
        for (auto const fd: fds)
            addFdFlags(fd, FD_CLOEXEC, O_NONBLOCK);
    }

    ~Impl()
    {
        closeFd(wakeRead);
        closeFd(wakeWrite);
    }

    void resetCancellation()
    {
        auto drain = std::array<char, 16> {};
        while (wakeRead >= 0 && ::read(wakeRead, drain.data(), drain.size()) > 0)
            ;
        cancelled = false;
    }

    auto spawn() -> VoidResult
    {
        int stdinPipe[2];
        int stdoutPipe[2];
        if (pipe(stdinPipe) != 0)
            return makeError(ErrorCode::TransportError, std::format("pipe() failed: {}", strerror(errno)));
        if (pipe(stdoutPipe) != 0)
        {
            auto const reason = errno;
            ::close(stdinPipe[0]);
            ::close(stdinPipe[1]);
            return makeError(ErrorCode::TransportError, std::format("pipe() failed: {}", strerror(reason)));
        }

        // Our ends must not leak into the bridge; dup2() clears the flag on its stdio.
        addFdFlags(stdinPipe[1], FD_CLOEXEC, O_NONBLOCK);
        addFdFlags(stdoutPipe[0], FD_CLOEXEC, 0);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

        auto argStrings = std::vector<std::string> { config.command };
        argStrings.insert(argStrings.end(), config.args.begin(), config.args.end());
        auto argv = pointersTo(argStrings);

        auto envStrings = std::vector<std::string> {};
        auto envp = std::vector<char*> {};
        if (!config.env.empty())
        {
            envStrings = mergedEnvironment(config.env);
            envp = pointersTo(envStrings);
        }

        pid_t pid = -1;
        auto const status = posix_spawnp(
            &pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.empty() ? environ : envp.data());
        posix_spawn_file_actions_destroy(&actions);

        ::close(stdinPipe[0]);
        ::close(stdoutPipe[1]);

        if (status != 0)
        {
            ::close(stdinPipe[1]);
            ::close(stdoutPipe[0]);
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to spawn link bridge '{}': {}", config.command, strerror(status)));
        }

        childPid = pid;
        toBridge = stdinPipe[1];
        fromBridge = stdoutPipe[0];
        return {};
    }

    /// @brief Blocks until @p fd is ready for @p events or cancel() was called.
    auto waitFor(int fd, short events) -> VoidResult
    {
        while (true)
        {
            if (cancelled)
                return makeError(ErrorCode::TransportError, "Link bridge request cancelled");

            auto fds = std::array {
                pollfd { .fd = fd, .events = events, .revents = 0 },
                pollfd { .fd = wakeRead, .events = POLLIN, .revents = 0 },
            };
            auto const n = ::poll(fds.data(), fds.size(), -1);
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0)
                return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
            if (fds[1].revents != 0)
                return makeError(ErrorCode::TransportError, "Link bridge request cancelled");
            if (fds[0].revents != 0)
                return {};
        }
    }

    auto writeAll(std::span<const std::uint8_t> data) -> VoidResult
    {
        while (!data.empty())
        {
            auto const written = ::write(toBridge, data.data(), data.size());
            if (written >= 0)
            {
                data = data.subspan(static_cast<std::size_t>(written));
                continue;
            }
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                return makeError(ErrorCode::TransportError,
                                 std::format("Failed to write to link bridge: {}", strerror(errno)));
            if (auto ready = waitFor(toBridge, POLLOUT); !ready)
                return ready;
        }
        return {};
    }

    /// @brief Reads one newline-terminated reply from the bridge.
    auto readLine() -> Result<std::string>
    {
        while (true)
        {
            auto const newlinePos = readBuffer.find('\n');
            if (newlinePos != std::string::npos)
            {
                auto line = readBuffer.substr(0, newlinePos);
                readBuffer.erase(0, newlinePos + 1);
                if (line.empty())
                    continue;
                return line;
            }

            if (auto ready = waitFor(fromBridge, POLLIN); !ready)
                return std::unexpected(ready.error());

            auto buf = std::array<char, 512> {};
            auto const bytesRead = ::read(fromBridge, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                return makeError(ErrorCode::TransportError, "Link bridge closed its output");
            readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
        }
    }

    void terminate()
    {
        closeFd(toBridge);
        closeFd(fromBridge);
        if (childPid > 0)
        {
            kill(childPid, SIGTERM);
            int status;
            waitpid(childPid, &status, 0);
            childPid = -1;
        }
        readBuffer.clear();
        connected = false;
    }
};

BridgeTransport::BridgeTransport(BridgeConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

BridgeTransport::~BridgeTransport()
{
    _impl->terminate();
}

auto BridgeTransport::connect() -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");
    if (_impl->config.command.empty())
        return makeError(ErrorCode::TransportError, "No link bridge command configured");

    _impl->resetCancellation();
    if (auto result = _impl->spawn(); !result)
        return result;

    if (auto result = request({ { "type", "connect" }, { "length", 0 } }, {}); !result)
    {
        _impl->terminate();
        return makeError(ErrorCode::TransportError, std::format("Connect failed: {}", result.error().message));
    }

    _impl->connected = true;
    log::info("Connected through link bridge: {}", _impl->config.command);
    return {};
}

void BridgeTransport::disconnect()
{
    if (_impl->childPid <= 0)
        return;

    if (_impl->connected)
    {
        if (auto result = request({ { "type", "disconnect" }, { "length", 0 } }, {}); !result)
            log::warning("Link bridge did not acknowledge disconnect: {}", result.error().message);
    }

    _impl->terminate();
    log::debug("Link bridge closed");
}

auto BridgeTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto BridgeTransport::sendMessage(std::uint8_t tag, std::span<const std::uint8_t> payload) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const header = nlohmann::json {
        { "type", "message" },
        { "tag", tag },
        { "length", payload.size() },
    };
    if (auto result = request(header, payload); !result)
    {
        _impl->connected = false;
        return result;
    }

    log::trace("Sent message 0x{:02x} ({} bytes)", tag, payload.size());
    return {};
}

void BridgeTransport::cancel()
{
    _impl->cancelled = true;
    if (_impl->wakeWrite >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const n = ::write(_impl->wakeWrite, &byte, 1);
    }
}

auto BridgeTransport::request(const nlohmann::json& header, std::span<const std::uint8_t> payload) -> VoidResult
{
    auto const line = header.dump() + "\n";
    auto const lineBytes =
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(line.data()), line.size());

    if (auto result = _impl->writeAll(lineBytes); !result)
        return result;
    if (auto result = _impl->writeAll(payload); !result)
        return result;

    auto reply = _impl->readLine();
    if (!reply)
        return std::unexpected(reply.error());

    auto ack = json::parse(*reply, ErrorCode::TransportError);
    if (!ack)
        return std::unexpected(ack.error());

    if (!json::getBoolOr(*ack, "ok", false))
        return makeError(ErrorCode::TransportError,
                         std::format("Link bridge rejected {}: {}",
                                     json::getStringOr(header, "type", "request"),
                                     json::getStringOr(*ack, "error", "no reason given")));
    return {};
}

} // namespace framecast
