// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_client.hpp
 * @brief Language Server Protocol client.
 *
 * Spawns one language server, performs the initialize handshake and
 * exposes typed requests (completion, code actions, formatting, pull
 * diagnostics) plus document synchronization.
 *
 * All I/O is driven from the caller's thread: blocking operations pump
 * the transport until their response arrives, and Poll() lets an outer
 * loop deliver pushed notifications and expire timeouts.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lsp_capability_store.hpp"
#include "lsp_document_tracker.hpp"
#include "lsp_error.hpp"
#include "lsp_frame_codec.hpp"
#include "lsp_message.hpp"
#include "lsp_notification_dispatcher.hpp"
#include "lsp_protocol.hpp"
#include "lsp_request_correlator.hpp"
#include "lsp_server_config.hpp"
#include "lsp_signal.hpp"
#include "lsp_transport.hpp"

namespace nanolsp {

inline constexpr const char* kClientName = "nanolsp";
inline constexpr const char* kClientVersion = "0.1.0";

enum class ClientState {
    Disconnected,
    Starting,
    Ready,
    Stopped,
    Errored,
};

const char* ToString(ClientState state);

struct ClientOptions {
    std::chrono::milliseconds requestTimeout{ 30000 };
    std::chrono::milliseconds pollInterval{ 50 };
    std::chrono::milliseconds shutdownTimeout{ 2000 };  // best-effort shutdown request in Stop()
    std::chrono::milliseconds terminateGrace{ 1000 };
    std::size_t stderrTailBytes = 4096;
};

class LspClient : private TransportSink {
public:
    // Uses a ProcessTransport and the steady clock.
    explicit LspClient(ServerConfig config, ClientOptions options = {});

    LspClient(ServerConfig config, std::unique_ptr<Transport> transport,
        std::unique_ptr<Clock> clock, ClientOptions options = {});

    ~LspClient() override;

    LspClient(const LspClient&) = delete;
    LspClient& operator=(const LspClient&) = delete;

    // lifecycle
    InitializeResult Start();
    void Stop();

    bool IsReady() const { return state_ == ClientState::Ready; }
    ClientState State() const { return state_; }
    const ServerConfig& Config() const { return config_; }

    // nullopt before Start() completes and after Stop() or a process exit.
    const std::optional<ServerCapabilities>& GetCapabilities() const { return capabilities_.Get(); }

    // document sync; local versions are tracked even when not Ready
    void OpenDocument(const std::string& uri, const std::string& languageId, const std::string& text);
    void UpdateDocument(const std::string& uri, const std::string& text);
    void CloseDocument(const std::string& uri);
    std::optional<int> DocumentVersion(const std::string& uri) const { return documents_.Version(uri); }

    // Typed requests. Each returns an empty list without touching the wire
    // when the server did not advertise the matching capability.
    std::vector<CompletionItem> GetCompletions(const std::string& uri, const Position& position);
    std::vector<CodeAction> GetCodeActions(const std::string& uri, const std::vector<Diagnostic>& diagnostics,
        int startLine, int startChar, int endLine, int endChar);
    std::vector<TextEdit> FormatDocument(const std::string& uri, const FormattingOptionsPatch& options = {});

    // Pull diagnostics. Never throws; failures yield an empty list.
    std::vector<Diagnostic> GetDiagnostics(const std::string& uri);

    // Last publishDiagnostics payload for uri (push model).
    std::vector<Diagnostic> GetCachedDiagnostics(const std::string& uri) const;

    // Generic JSON-RPC access.
    // SendRequest reports through exactly one of the callbacks. When the
    // client is not Ready it rejects immediately and returns nullopt.
    std::optional<long long> SendRequest(const std::string& method, const json& params,
        RequestCorrelator::ResolveFn onResult, RequestCorrelator::RejectFn onError);

    // Blocks until the response arrives; throws LspError.
    json Request(const std::string& method, const json& params);

    // Dropped silently when not Ready.
    void SendNotification(const std::string& method, const json& params);

    // Pumps transport output for up to timeout and expires due requests.
    // Returns false when there is no running process.
    bool Poll(std::chrono::milliseconds timeout);

    std::size_t PendingRequestCount() const { return correlator_.PendingCount(); }
    const std::string& StderrTail() const { return stderr_tail_; }

    // events
    Signal<const PublishDiagnosticsParams&> DiagnosticsEvent;
    Signal<const LspError&> ErrorEvent;
    Signal<std::optional<int>> ExitEvent;

private:
    ServerConfig config_;
    ClientOptions options_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<Clock> clock_;

    ClientState state_ = ClientState::Disconnected;

    FrameCodec codec_;
    RequestCorrelator correlator_;
    NotificationDispatcher dispatcher_;
    CapabilityStore capabilities_;
    DocumentTracker documents_;

    std::unordered_map<std::string, std::vector<Diagnostic>> diagnostics_cache_;  // uri -> last push
    std::string stderr_tail_;
    std::string stderr_line_;  // partial line awaiting '\n'
    std::optional<int> last_exit_code_;

private:
    void RegisterHandlers();

    // TransportSink
    void OnStdout(std::string_view bytes) override;
    void OnStderr(std::string_view bytes) override;
    void OnExit(std::optional<int> exitCode) override;

    void HandleMessage(const Message& message);
    void HandleServerRequest(const nanolsp::Request& request);
    void HandleNotification(const Notification& notification);

    // Sends without the Ready check; used for the handshake and replies.
    std::optional<long long> SendRequestUnchecked(const std::string& method, const json& params,
        RequestCorrelator::ResolveFn onResult, RequestCorrelator::RejectFn onError);
    json RequestUnchecked(const std::string& method, const json& params);
    bool WriteMessage(const Message& message);
    bool CanWrite() const;

    // One transport poll bounded by the next request deadline.
    void PumpOnce(std::chrono::milliseconds maxWait);

    json BuildInitializeParams() const;
    void ResetSession();
    std::string WithStderrTail(std::string message) const;
};

} // namespace nanolsp
