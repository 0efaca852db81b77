// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file test_helpers.hpp
 * @brief Scripted in-memory language server for client tests.
 *
 * FakeServer records every frame the client writes and answers requests
 * through per-method handlers. FakeTransport and FakeClock share one
 * FakeServer, so a test keeps a handle on it after the client has taken
 * ownership of both. Time only moves when the client polls with nothing
 * to deliver, which makes timeouts deterministic.
 */

#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nanolsp/lsp_client.hpp"
#include "nanolsp/lsp_frame_codec.hpp"
#include "nanolsp/lsp_message.hpp"
#include "nanolsp/lsp_transport.hpp"

#include <unistd.h>

namespace nanolsp {
namespace test {

struct FakeServer {
    using Handler = std::function<json(const json& params)>;

    // spawn behaviour
    bool spawn_fails = false;
    std::string spawn_error = "command not found: fake-ls";
    std::optional<int> exit_code_on_terminate = 0;

    // process state
    bool running = false;
    int spawn_count = 0;
    int terminate_count = 0;
    Clock::TimePoint now{};

    // traffic
    std::vector<Message> received;  // decoded frames written by the client
    std::string stdout_bytes;       // delivered on the next Poll()
    std::string stderr_bytes;
    std::optional<std::optional<int>> pending_exit;

    std::map<std::string, Handler> handlers;
    std::map<std::string, ResponseError> error_handlers;

    FrameCodec decoder;

    void Handle(const std::string& method, Handler handler) { handlers[method] = std::move(handler); }

    void HandleError(const std::string& method, int code, const std::string& message) {
        error_handlers[method] = ResponseError{ code, message, nullptr };
    }

    void Send(const Message& message) { stdout_bytes += FrameCodec::Encode(message); }
    void Reply(const json& id, const json& result) { Send(MakeResponse(id, result)); }
    void Notify(const std::string& method, const json& params) { Send(Notification{ method, params }); }
    void Exit(std::optional<int> code) { pending_exit = code; }

    void OnClientMessage(const Message& message) {
        received.push_back(message);

        const auto* request = std::get_if<Request>(&message);
        if (request == nullptr) return;

        auto err = error_handlers.find(request->method);
        if (err != error_handlers.end()) {
            Send(MakeErrorResponse(request->id, err->second.code, err->second.message));
            return;
        }
        auto it = handlers.find(request->method);
        if (it != handlers.end()) Reply(request->id, it->second(request->params));
        // unhandled requests stay unanswered
    }

    // Requests the client sent, in order.
    std::vector<Request> Requests(const std::string& method = std::string()) const {
        std::vector<Request> out;
        for (const auto& m : received) {
            if (const auto* r = std::get_if<Request>(&m)) {
                if (method.empty() || r->method == method) out.push_back(*r);
            }
        }
        return out;
    }

    std::vector<Notification> Notifications(const std::string& method = std::string()) const {
        std::vector<Notification> out;
        for (const auto& m : received) {
            if (const auto* n = std::get_if<Notification>(&m)) {
                if (method.empty() || n->method == method) out.push_back(*n);
            }
        }
        return out;
    }

    std::vector<Response> Responses() const {
        std::vector<Response> out;
        for (const auto& m : received) {
            if (const auto* r = std::get_if<Response>(&m)) out.push_back(*r);
        }
        return out;
    }
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}

    bool Spawn(const ServerConfig&, std::string& err) override {
        if (server_->spawn_fails) {
            err = server_->spawn_error;
            return false;
        }
        server_->running = true;
        server_->spawn_count++;
        server_->decoder.Reset();
        server_->pending_exit.reset();
        return true;
    }

    bool Write(std::string_view bytes) override {
        if (!server_->running) return false;
        for (const auto& message : server_->decoder.Feed(bytes)) server_->OnClientMessage(message);
        return true;
    }

    bool Poll(std::chrono::milliseconds timeout, TransportSink& sink) override {
        if (!server_->running) return false;

        bool delivered = false;
        if (!server_->stdout_bytes.empty()) {
            std::string bytes;
            bytes.swap(server_->stdout_bytes);
            sink.OnStdout(bytes);
            delivered = true;
        }
        if (server_->running && !server_->stderr_bytes.empty()) {
            std::string bytes;
            bytes.swap(server_->stderr_bytes);
            sink.OnStderr(bytes);
            delivered = true;
        }
        if (server_->running && server_->pending_exit) {
            const std::optional<int> code = *server_->pending_exit;
            server_->pending_exit.reset();
            server_->running = false;
            sink.OnExit(code);
            return true;
        }
        if (!delivered) server_->now += timeout;
        return true;
    }

    std::optional<int> Terminate(std::chrono::milliseconds) override {
        server_->terminate_count++;
        const bool wasRunning = server_->running;
        server_->running = false;
        return wasRunning ? server_->exit_code_on_terminate : std::nullopt;
    }

    bool IsRunning() const override { return server_->running; }

private:
    std::shared_ptr<FakeServer> server_;
};

class FakeClock : public Clock {
public:
    explicit FakeClock(std::shared_ptr<FakeServer> server) : server_(std::move(server)) {}
    TimePoint Now() const override { return server_->now; }

private:
    std::shared_ptr<FakeServer> server_;
};

inline ServerConfig TestServerConfig() {
    ServerConfig cfg;
    cfg.name = "fake-ls";
    cfg.command = "fake-ls";
    cfg.args = { "--stdio" };
    cfg.languages = { "ts", "tsx" };
    cfg.rootUri = "file:///work/project";
    return cfg;
}

// A client wired to a FakeServer that answers initialize with the given
// capabilities and shutdown with null.
struct ClientHarness {
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::unique_ptr<LspClient> client;

    explicit ClientHarness(json capabilities = json::object(), ClientOptions options = {}) {
        server->Handle(methods::kInitialize, [capabilities](const json&) {
            return json{ {"capabilities", capabilities}, {"serverInfo", { {"name", "fake-ls"}, {"version", "1.0"} }} };
        });
        server->Handle(methods::kShutdown, [](const json&) { return json(nullptr); });

        client = std::make_unique<LspClient>(TestServerConfig(),
            std::make_unique<FakeTransport>(server), std::make_unique<FakeClock>(server), options);
    }
};

// Fresh directory under the system temp dir, removed on destruction.
class ScopedTempDir {
public:
    ScopedTempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "nanolsp-test-XXXXXX").string();
        if (::mkdtemp(tmpl.data()) == nullptr) throw std::runtime_error("mkdtemp failed: " + tmpl);
        path_ = tmpl;
    }
    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    std::filesystem::path WriteFile(const std::filesystem::path& relative, const std::string& content,
        bool executable = false) const {
        const std::filesystem::path file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream(file, std::ios::binary) << content;
        if (executable) {
            std::filesystem::permissions(file, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
        }
        return file;
    }

private:
    std::filesystem::path path_;
};

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) old_ = std::string(old);
        ::setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (old_) ::setenv(name_.c_str(), old_->c_str(), 1);
        else ::unsetenv(name_.c_str());
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> old_;
};

} // namespace test
} // namespace nanolsp
