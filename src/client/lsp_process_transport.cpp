// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_process_transport.cpp
 * @brief fork/exec transport with non-blocking pipe I/O.
 *
 * exec failures are reported back through a close-on-exec status pipe,
 * so Spawn() knows synchronously whether the server started.
 */

#include "nanolsp/lsp_process_transport.hpp"
#include "nanolsp/lsp_log.hpp"
#include "nanolsp/lsp_utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace nanolsp {

namespace {

constexpr std::string_view kModule = "process";

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void SetNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::optional<int> DecodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return std::nullopt;
}

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string_view entry(*e);
        const size_t eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        merged[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
    }
    for (const auto& [key, value] : overrides) merged[key] = value;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) out.push_back(key + "=" + value);
    return out;
}

std::vector<char*> ToArgv(std::vector<std::string>& items) {
    std::vector<char*> argv;
    argv.reserve(items.size() + 1);
    for (auto& s : items) argv.push_back(s.data());
    argv.push_back(nullptr);
    return argv;
}

} // anonymous namespace

ProcessTransport::ProcessTransport() {
    IgnoreSigpipeOnce();
}

ProcessTransport::~ProcessTransport() {
    (void)Terminate(std::chrono::milliseconds(100));
}

bool ProcessTransport::Spawn(const ServerConfig& config, std::string& err) {
    if (pid_ > 0) {
        err = "process already running";
        return false;
    }

    const auto exe = FindExecutable(config.command);
    if (!exe) {
        err = "command not found: " + config.command;
        return false;
    }

    // Everything the child needs is allocated before fork().
    std::vector<std::string> argStore;
    argStore.push_back(config.command);
    argStore.insert(argStore.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv = ToArgv(argStore);

    std::vector<std::string> envStore = BuildEnvironment(config.env);
    std::vector<char*> envp = ToArgv(envStore);

    const std::string exePath = exe->string();

    std::string cwd;
    if (config.rootUri && config.rootUri->rfind("file://", 0) == 0) {
        std::error_code ec;
        const std::filesystem::path root = UriToPath(*config.rootUri);
        if (std::filesystem::is_directory(root, ec)) cwd = root.string();
    }

    int inPipe[2] = { -1, -1 };
    int outPipe[2] = { -1, -1 };
    int errPipe[2] = { -1, -1 };
    int statusPipe[2] = { -1, -1 };
    auto closeAll = [&] {
        for (int* p : { inPipe, outPipe, errPipe, statusPipe }) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0
        || pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(statusPipe, O_CLOEXEC) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        closeAll();
        return false;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        closeAll();
        return false;
    }

    if (pid == 0) {
        // child: async-signal-safe calls only
        (void)dup2(inPipe[0], STDIN_FILENO);
        (void)dup2(outPipe[1], STDOUT_FILENO);
        (void)dup2(errPipe[1], STDERR_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const int e = errno;
            (void)!write(statusPipe[1], &e, sizeof(e));
            _exit(127);
        }

        execve(exePath.c_str(), argv.data(), envp.data());
        const int e = errno;
        (void)!write(statusPipe[1], &e, sizeof(e));
        _exit(127);
    }

    CloseFd(inPipe[0]);
    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);
    CloseFd(statusPipe[1]);

    int childErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    CloseFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        err = "failed to start '" + config.command + "': " + std::strerror(childErrno);
        closeAll();
        return false;
    }

    pid_ = pid;
    stdin_fd_ = inPipe[1];
    stdout_fd_ = outPipe[0];
    stderr_fd_ = errPipe[0];
    SetNonBlocking(stdin_fd_);
    SetNonBlocking(stdout_fd_);
    SetNonBlocking(stderr_fd_);
    pending_out_.clear();
    pending_err_.clear();

    LogDebug(kModule, "Spawned '" + exePath + "' (pid " + std::to_string(pid_) + ")");
    return true;
}

bool ProcessTransport::Write(std::string_view bytes) {
    if (stdin_fd_ < 0) return false;

    const char* data = bytes.data();
    size_t remaining = bytes.size();
    while (remaining > 0) {
        const ssize_t n = ::write(stdin_fd_, data, remaining);
        if (n > 0) {
            data += n;
            remaining -= static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // The server may be blocked writing to us; keep its output
            // flowing while we wait for room in its stdin.
            struct pollfd fds[3];
            nfds_t count = 0;
            fds[count++] = { stdin_fd_, POLLOUT, 0 };
            if (stdout_fd_ >= 0) fds[count++] = { stdout_fd_, POLLIN, 0 };
            if (stderr_fd_ >= 0) fds[count++] = { stderr_fd_, POLLIN, 0 };
            if (::poll(fds, count, 50) < 0 && errno != EINTR) return false;

            if (stdout_fd_ >= 0) Drain(stdout_fd_, pending_out_);
            if (stderr_fd_ >= 0) Drain(stderr_fd_, pending_err_);
            continue;
        }
        LogDebug(kModule, std::string("write to server stdin failed: ") + std::strerror(errno));
        return false;
    }
    return true;
}

void ProcessTransport::Drain(int& fd, std::string& out) {
    char buf[65536];
    while (fd >= 0) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        CloseFd(fd);  // EOF or hard error
    }
}

bool ProcessTransport::TryReap(std::optional<int>& exitCode) {
    if (pid_ <= 0) return true;

    int status = 0;
    pid_t r = 0;
    do {
        r = waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exitCode = DecodeStatus(status);
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        exitCode.reset();
        return true;
    }
    return false;
}

bool ProcessTransport::WaitForExit(std::chrono::milliseconds timeout, std::optional<int>& exitCode) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (TryReap(exitCode)) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

bool ProcessTransport::Poll(std::chrono::milliseconds timeout, TransportSink& sink) {
    if (pid_ <= 0) return false;

    if (!pending_out_.empty()) {
        std::string chunk;
        chunk.swap(pending_out_);
        sink.OnStdout(chunk);
        if (pid_ <= 0) return true;
    }
    if (!pending_err_.empty()) {
        std::string chunk;
        chunk.swap(pending_err_);
        sink.OnStderr(chunk);
        if (pid_ <= 0) return true;
    }

    struct pollfd fds[2];
    nfds_t count = 0;
    if (stdout_fd_ >= 0) fds[count++] = { stdout_fd_, POLLIN, 0 };
    if (stderr_fd_ >= 0) fds[count++] = { stderr_fd_, POLLIN, 0 };

    if (count > 0) {
        const int rc = ::poll(fds, count, static_cast<int>(timeout.count()));
        if (rc < 0 && errno != EINTR) {
            LogDebug(kModule, std::string("poll failed: ") + std::strerror(errno));
        }
    }

    std::string out;
    std::string errText;
    if (stdout_fd_ >= 0) Drain(stdout_fd_, out);
    if (stderr_fd_ >= 0) Drain(stderr_fd_, errText);

    std::optional<int> exitCode;
    bool exited = false;
    if (stdout_fd_ < 0 && stderr_fd_ < 0) {
        // both pipes closed: the child is gone or about to be
        exited = WaitForExit(count > 0 ? std::chrono::milliseconds(200) : timeout, exitCode);
    }
    else {
        exited = TryReap(exitCode);
        if (exited) {
            // pick up anything written just before exit
            if (stdout_fd_ >= 0) Drain(stdout_fd_, out);
            if (stderr_fd_ >= 0) Drain(stderr_fd_, errText);
        }
    }

    if (!out.empty()) {
        sink.OnStdout(out);
        if (pid_ <= 0) return true;
    }
    if (!errText.empty()) {
        sink.OnStderr(errText);
        if (pid_ <= 0) return true;
    }

    if (exited) {
        LogDebug(kModule, "Server process " + std::to_string(pid_) + " exited");
        pid_ = -1;
        CloseFds();
        sink.OnExit(exitCode);
    }
    return true;
}

std::optional<int> ProcessTransport::Terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0) {
        CloseFds();
        return std::nullopt;
    }

    // EOF on stdin is what an "exit" notification is followed by anyway
    CloseFd(stdin_fd_);

    std::optional<int> exitCode;
    bool exited = WaitForExit(grace, exitCode);
    if (!exited) {
        LogDebug(kModule, "Sending SIGTERM to " + std::to_string(pid_));
        (void)kill(pid_, SIGTERM);
        exited = WaitForExit(grace, exitCode);
    }
    if (!exited) {
        LogDebug(kModule, "Sending SIGKILL to " + std::to_string(pid_));
        (void)kill(pid_, SIGKILL);
        int status = 0;
        pid_t r = 0;
        do {
            r = waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        exitCode = (r == pid_) ? DecodeStatus(status) : std::nullopt;
    }

    pid_ = -1;
    CloseFds();
    return exitCode;
}

void ProcessTransport::CloseFds() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
    pending_out_.clear();
    pending_err_.clear();
}

} // namespace nanolsp
