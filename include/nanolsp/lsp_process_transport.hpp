// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_process_transport.hpp
 * @brief Transport backed by a child process and three pipes.
 */

#pragma once
#include <string>

#include <sys/types.h>

#include "lsp_transport.hpp"

namespace nanolsp {

class ProcessTransport : public Transport {
public:
    ProcessTransport();
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    bool Spawn(const ServerConfig& config, std::string& err) override;
    bool Write(std::string_view bytes) override;
    bool Poll(std::chrono::milliseconds timeout, TransportSink& sink) override;
    std::optional<int> Terminate(std::chrono::milliseconds grace) override;
    bool IsRunning() const override { return pid_ > 0; }

    pid_t Pid() const { return pid_; }

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    // output read while Write() waited for stdin space; handed out by Poll()
    std::string pending_out_;
    std::string pending_err_;

    // Non-blocking reap. True (with code set) once the child is gone.
    bool TryReap(std::optional<int>& exitCode);
    // Blocks until the child exits or timeout passes.
    bool WaitForExit(std::chrono::milliseconds timeout, std::optional<int>& exitCode);
    // Appends whatever is readable to out; closes fd (sets -1) on EOF or error.
    static void Drain(int& fd, std::string& out);
    void CloseFds();
};

} // namespace nanolsp
