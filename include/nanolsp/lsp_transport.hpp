// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_transport.hpp
 * @brief Collaborator interfaces: byte transport to the server and clock.
 *
 * The client owns exactly one Transport. Poll() is the only place bytes
 * arrive, so every callback into the client runs on the caller's thread.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "lsp_server_config.hpp"

namespace nanolsp {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }
};

class TransportSink {
public:
    virtual ~TransportSink() = default;

    virtual void OnStdout(std::string_view bytes) = 0;
    virtual void OnStderr(std::string_view bytes) = 0;

    // exitCode is nullopt when the process was killed by a signal.
    virtual void OnExit(std::optional<int> exitCode) = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Starts the server process. On failure returns false with err set.
    virtual bool Spawn(const ServerConfig& config, std::string& err) = 0;

    // Writes raw bytes to the server's stdin. False if the pipe is gone.
    virtual bool Write(std::string_view bytes) = 0;

    // Waits up to timeout for output, delivering it (and a process exit)
    // to sink. Returns false when no process is running.
    virtual bool Poll(std::chrono::milliseconds timeout, TransportSink& sink) = 0;

    // Closes stdin, waits grace for a voluntary exit, then signals.
    // Returns the exit code (nullopt if signalled or never spawned).
    virtual std::optional<int> Terminate(std::chrono::milliseconds grace) = 0;

    virtual bool IsRunning() const = 0;
};

} // namespace nanolsp
