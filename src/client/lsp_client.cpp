// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_client.cpp
 * @brief LSP client lifecycle, message routing and typed requests.
 */

#include "nanolsp/lsp_client.hpp"
#include "nanolsp/lsp_log.hpp"
#include "nanolsp/lsp_process_transport.hpp"
#include "nanolsp/lsp_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace nanolsp {

namespace {

constexpr std::string_view kModule = "client";

LspError WithMessage(const LspError& e, const std::string& message) {
    if (e.Code()) return LspError(e.Kind(), message, *e.Code());
    return LspError(e.Kind(), message);
}

// Items that fail to convert are kept as raw JSON where the element type
// can carry it.
template <typename T>
bool KeepUnparsed(const json&, std::vector<T>&) { return false; }

bool KeepUnparsed(const json& item, std::vector<CompletionItem>& out) {
    CompletionItem unparsed;
    unparsed.raw = item;
    out.push_back(std::move(unparsed));
    return true;
}

bool KeepUnparsed(const json& item, std::vector<CodeAction>& out) {
    CodeAction unparsed;
    unparsed.raw = item;
    out.push_back(std::move(unparsed));
    return true;
}

// Converts a result array item by item; one bad item never fails the list.
template <typename T>
std::vector<T> ParseList(const json& items, const char* method) {
    if (!items.is_array()) {
        throw LspError(LspErrorKind::Protocol, std::string("Malformed ") + method + " result: expected an array");
    }

    std::vector<T> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        try {
            out.push_back(item.get<T>());
        }
        catch (const json::exception& e) {
            const bool kept = KeepUnparsed(item, out);
            LogDebug(kModule, std::string(kept ? "Keeping unparsed " : "Skipping malformed ")
                + method + " item: " + e.what());
        }
    }
    return out;
}

void LogServerMessage(const std::string& server, const json& params) {
    if (!params.is_object()) return;

    const std::string text = params.contains("message") && params["message"].is_string()
        ? params["message"].get<std::string>() : std::string();
    const int type = params.contains("type") && params["type"].is_number_integer()
        ? params["type"].get<int>() : static_cast<int>(MessageType::Log);

    LogLevel level = LogLevel::Debug;
    switch (static_cast<MessageType>(type)) {
    case MessageType::Error:   level = LogLevel::Error; break;
    case MessageType::Warning: level = LogLevel::Warn; break;
    case MessageType::Info:    level = LogLevel::Info; break;
    case MessageType::Log:     level = LogLevel::Debug; break;
    }
    Log(level, "server", server + ": " + text);
}

} // anonymous namespace

const char* ToString(ClientState state) {
    switch (state) {
    case ClientState::Disconnected: return "disconnected";
    case ClientState::Starting:     return "starting";
    case ClientState::Ready:        return "ready";
    case ClientState::Stopped:      return "stopped";
    case ClientState::Errored:      return "errored";
    }
    return "unknown";
}

LspClient::LspClient(ServerConfig config, ClientOptions options)
    : LspClient(std::move(config), std::make_unique<ProcessTransport>(),
        std::make_unique<SteadyClock>(), options) {
}

LspClient::LspClient(ServerConfig config, std::unique_ptr<Transport> transport,
    std::unique_ptr<Clock> clock, ClientOptions options)
    : config_(std::move(config))
    , options_(options)
    , transport_(std::move(transport))
    , clock_(std::move(clock))
    , correlator_(options.requestTimeout) {
    RegisterHandlers();
}

LspClient::~LspClient() {
    if (transport_ && transport_->IsRunning()) {
        try {
            Stop();
        }
        catch (const std::exception& e) {
            LogWarn(kModule, std::string("Error while stopping '") + config_.name + "': " + e.what());
        }
    }
}

void LspClient::RegisterHandlers() {
    dispatcher_.Register(methods::kPublishDiagnostics, [this](const json& params) {
        PublishDiagnosticsParams published;
        try {
            published = params.get<PublishDiagnosticsParams>();
        }
        catch (const json::exception& e) {
            LogDebug(kModule, std::string("Ignoring malformed publishDiagnostics: ") + e.what());
            return;
        }
        diagnostics_cache_[published.uri] = published.diagnostics;
        DiagnosticsEvent.Emit(published);
    });

    dispatcher_.Register(methods::kLogMessage, [this](const json& params) { LogServerMessage(config_.name, params); });
    dispatcher_.Register(methods::kShowMessage, [this](const json& params) { LogServerMessage(config_.name, params); });
}

// ---------------------------------------------------------------------------
// lifecycle
// ---------------------------------------------------------------------------

InitializeResult LspClient::Start() {
    if (state_ == ClientState::Starting || state_ == ClientState::Ready) {
        throw LspError(LspErrorKind::InvalidState,
            std::string("LSP client already started (") + ToString(state_) + ")");
    }

    ResetSession();
    last_exit_code_.reset();
    state_ = ClientState::Starting;

    std::string err;
    if (!transport_->Spawn(config_, err)) {
        state_ = ClientState::Errored;
        LspError error(LspErrorKind::SpawnFailure, "Failed to start LSP server '" + config_.name + "': " + err);
        LogError(kModule, error.what());
        ErrorEvent.Emit(error);
        throw error;
    }
    LogInfo(kModule, "Started LSP server '" + config_.name + "'");

    try {
        const json raw = RequestUnchecked(methods::kInitialize, BuildInitializeParams());

        if (!raw.is_object()) {
            throw LspError(LspErrorKind::Protocol, "Malformed initialize result: " + raw.dump());
        }

        InitializeResult result;
        try {
            result = raw.get<InitializeResult>();
        }
        catch (const json::exception& e) {
            throw LspError(LspErrorKind::Protocol, std::string("Malformed initialize result: ") + e.what());
        }

        capabilities_.Set(result.capabilities);
        if (!WriteMessage(Notification{ methods::kInitialized, json::object() })) {
            throw LspError(LspErrorKind::ProcessExit, "LSP process exited during initialization");
        }

        state_ = ClientState::Ready;
        LogInfo(kModule, "LSP server '" + config_.name + "' ready"
            + (result.serverName ? " (" + *result.serverName + ")" : std::string()));
        return result;
    }
    catch (const LspError& e) {
        const LspError error = WithMessage(e, WithStderrTail(
            "LSP server '" + config_.name + "' failed to initialize: " + e.what()));

        if (transport_->IsRunning()) (void)transport_->Terminate(options_.terminateGrace);
        correlator_.RejectAll(LspError(LspErrorKind::ClientShutdown, "LSP client stopped"));
        capabilities_.Clear();
        codec_.Reset();
        state_ = ClientState::Errored;

        LogError(kModule, error.what());
        ErrorEvent.Emit(error);
        throw error;
    }
}

void LspClient::Stop() {
    const bool hadProcess = transport_->IsRunning();
    const bool wasReady = state_ == ClientState::Ready;

    if (hadProcess || state_ != ClientState::Disconnected) state_ = ClientState::Stopped;

    if (hadProcess && wasReady) {
        // best effort: the server may already be gone or ignore us
        struct ShutdownOutcome { bool done = false; };
        auto outcome = std::make_shared<ShutdownOutcome>();
        SendRequestUnchecked(methods::kShutdown, nullptr,
            [outcome](const json&) { outcome->done = true; },
            [outcome, this](const LspError& e) {
                outcome->done = true;
                LogDebug(kModule, "LSP shutdown error (non-critical) for '" + config_.name + "': " + e.what());
            });

        const auto deadline = clock_->Now() + options_.shutdownTimeout;
        while (!outcome->done && transport_->IsRunning()) {
            const auto now = clock_->Now();
            if (now >= deadline) {
                LogDebug(kModule, "LSP shutdown request timed out for '" + config_.name + "'");
                break;
            }
            const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            PumpOnce(std::min(remaining, options_.pollInterval));
        }

        if (transport_->IsRunning()) (void)WriteMessage(Notification{ methods::kExit, nullptr });
    }

    std::optional<int> exitCode = last_exit_code_;
    if (transport_->IsRunning()) exitCode = transport_->Terminate(options_.terminateGrace);

    const std::size_t rejected = correlator_.RejectAll(LspError(LspErrorKind::ClientShutdown, "LSP client stopped"));
    if (rejected > 0) LogDebug(kModule, "Rejected " + std::to_string(rejected) + " pending request(s) on stop");

    capabilities_.Clear();
    documents_.Clear();
    diagnostics_cache_.clear();
    codec_.Reset();
    stderr_line_.clear();

    if (hadProcess) {
        LogInfo(kModule, "Stopped LSP server '" + config_.name + "'");
        ExitEvent.Emit(exitCode);
    }
}

void LspClient::ResetSession() {
    codec_.Reset();
    capabilities_.Clear();
    diagnostics_cache_.clear();
    stderr_tail_.clear();
    stderr_line_.clear();
}

json LspClient::BuildInitializeParams() const {
    std::string rootUri;
    if (config_.rootUri) {
        rootUri = *config_.rootUri;
    }
    else {
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        rootUri = PathToUri(ec ? std::filesystem::path("/") : cwd);
    }

    json textDocument = {
        {"synchronization", {
            {"dynamicRegistration", false},
            {"willSave", false},
            {"willSaveWaitUntil", false},
            {"didSave", true},
        }},
        {"completion", {
            {"dynamicRegistration", false},
            {"completionItem", {
                {"snippetSupport", true},
                {"commitCharactersSupport", true},
                {"documentationFormat", json::array({ "markdown", "plaintext" })},
                {"deprecatedSupport", true},
            }},
        }},
        {"hover", {
            {"dynamicRegistration", false},
            {"contentFormat", json::array({ "markdown", "plaintext" })},
        }},
        {"publishDiagnostics", {
            {"relatedInformation", true},
            {"versionSupport", true},
        }},
        {"codeAction", {
            {"dynamicRegistration", false},
            {"codeActionLiteralSupport", {
                {"codeActionKind", {
                    {"valueSet", json::array({
                        "quickfix",
                        "refactor",
                        "refactor.extract",
                        "refactor.inline",
                        "refactor.rewrite",
                        "source",
                        "source.organizeImports",
                    })},
                }},
            }},
        }},
        {"formatting", {
            {"dynamicRegistration", false},
        }},
    };

    json workspace = {
        {"applyEdit", true},
        {"workspaceEdit", { {"documentChanges", true} }},
        {"didChangeConfiguration", { {"dynamicRegistration", false} }},
        {"workspaceFolders", true},
    };

    json params;
    params["processId"] = static_cast<long long>(::getpid());
    params["clientInfo"] = { {"name", kClientName}, {"version", kClientVersion} };
    params["rootUri"] = rootUri;
    params["capabilities"] = { {"textDocument", textDocument}, {"workspace", workspace} };
    if (config_.rootUri) {
        params["workspaceFolders"] = json::array({ { {"uri", *config_.rootUri}, {"name", "workspace"} } });
    }
    else {
        params["workspaceFolders"] = nullptr;
    }
    return params;
}

// ---------------------------------------------------------------------------
// document sync
// ---------------------------------------------------------------------------

void LspClient::OpenDocument(const std::string& uri, const std::string& languageId, const std::string& text) {
    const int version = documents_.Open(uri);

    json params;
    params["textDocument"] = {
        {"uri", uri},
        {"languageId", languageId},
        {"version", version},
        {"text", text},
    };
    SendNotification(methods::kDidOpen, params);
}

void LspClient::UpdateDocument(const std::string& uri, const std::string& text) {
    const int version = documents_.Update(uri);

    json params;
    params["textDocument"] = { {"uri", uri}, {"version", version} };
    params["contentChanges"] = json::array({ { {"text", text} } });
    SendNotification(methods::kDidChange, params);
}

void LspClient::CloseDocument(const std::string& uri) {
    documents_.Close(uri);
    diagnostics_cache_.erase(uri);

    json params;
    params["textDocument"] = { {"uri", uri} };
    SendNotification(methods::kDidClose, params);
}

// ---------------------------------------------------------------------------
// typed requests
// ---------------------------------------------------------------------------

std::vector<CompletionItem> LspClient::GetCompletions(const std::string& uri, const Position& position) {
    if (!capabilities_.Supports(Capability::Completion)) return {};

    json params;
    params["textDocument"] = { {"uri", uri} };
    params["position"] = position;
    params["context"] = { {"triggerKind", static_cast<int>(CompletionTriggerKind::Invoked)} };

    const json result = Request(methods::kCompletion, params);
    if (result.is_null()) return {};
    if (result.is_array()) return ParseList<CompletionItem>(result, methods::kCompletion);
    if (result.is_object() && result.contains("items")) {
        // CompletionList
        const json& items = result["items"];
        if (items.is_null()) return {};
        return ParseList<CompletionItem>(items, methods::kCompletion);
    }
    throw LspError(LspErrorKind::Protocol,
        std::string("Malformed ") + methods::kCompletion + " result: " + result.dump());
}

std::vector<CodeAction> LspClient::GetCodeActions(const std::string& uri, const std::vector<Diagnostic>& diagnostics,
    int startLine, int startChar, int endLine, int endChar) {
    if (!capabilities_.Supports(Capability::CodeAction)) return {};

    json params;
    params["textDocument"] = { {"uri", uri} };
    params["range"] = Range{ Position{ startLine, startChar }, Position{ endLine, endChar } };
    params["context"] = { {"diagnostics", diagnostics} };

    const json result = Request(methods::kCodeAction, params);
    if (result.is_null()) return {};
    return ParseList<CodeAction>(result, methods::kCodeAction);
}

std::vector<TextEdit> LspClient::FormatDocument(const std::string& uri, const FormattingOptionsPatch& options) {
    if (!capabilities_.Supports(Capability::DocumentFormatting)) return {};

    json params;
    params["textDocument"] = { {"uri", uri} };
    params["options"] = options.Resolve();

    const json result = Request(methods::kFormatting, params);
    if (result.is_null()) return {};
    return ParseList<TextEdit>(result, methods::kFormatting);
}

std::vector<Diagnostic> LspClient::GetDiagnostics(const std::string& uri) {
    if (!capabilities_.Supports(Capability::Diagnostic)) return {};

    try {
        json params;
        params["textDocument"] = { {"uri", uri} };

        const json result = Request(methods::kDocumentDiagnostic, params);
        if (!result.is_object() || !result.contains("items") || result["items"].is_null()) return {};
        return ParseList<Diagnostic>(result["items"], methods::kDocumentDiagnostic);
    }
    catch (const LspError& e) {
        LogDebug(kModule, "Pull diagnostics failed for " + uri + ": " + e.what());
        return {};
    }
    catch (const json::exception& e) {
        LogDebug(kModule, "Pull diagnostics failed for " + uri + ": " + e.what());
        return {};
    }
}

std::vector<Diagnostic> LspClient::GetCachedDiagnostics(const std::string& uri) const {
    auto it = diagnostics_cache_.find(uri);
    if (it == diagnostics_cache_.end()) return {};
    return it->second;
}

// ---------------------------------------------------------------------------
// generic JSON-RPC
// ---------------------------------------------------------------------------

std::optional<long long> LspClient::SendRequest(const std::string& method, const json& params,
    RequestCorrelator::ResolveFn onResult, RequestCorrelator::RejectFn onError) {
    if (state_ != ClientState::Ready || !transport_->IsRunning()) {
        onError(LspError(LspErrorKind::NotRunning, "LSP process not running"));
        return std::nullopt;
    }
    return SendRequestUnchecked(method, params, std::move(onResult), std::move(onError));
}

json LspClient::Request(const std::string& method, const json& params) {
    if (state_ != ClientState::Ready || !transport_->IsRunning()) {
        throw LspError(LspErrorKind::NotRunning, "LSP process not running");
    }
    return RequestUnchecked(method, params);
}

void LspClient::SendNotification(const std::string& method, const json& params) {
    if (state_ != ClientState::Ready) {
        LogDebug(kModule, "Not sending " + method + ": client is " + ToString(state_));
        return;
    }
    (void)WriteMessage(Notification{ method, params });
}

bool LspClient::Poll(std::chrono::milliseconds timeout) {
    if (!transport_->IsRunning()) {
        correlator_.ExpireDue(clock_->Now());
        return false;
    }
    PumpOnce(timeout);
    return true;
}

std::optional<long long> LspClient::SendRequestUnchecked(const std::string& method, const json& params,
    RequestCorrelator::ResolveFn onResult, RequestCorrelator::RejectFn onError) {
    if (!CanWrite()) {
        onError(LspError(LspErrorKind::NotRunning, "LSP process not running"));
        return std::nullopt;
    }

    const nanolsp::Request request = correlator_.Register(method, params,
        std::move(onResult), std::move(onError), clock_->Now());
    const long long id = *IntegerId(request.id);

    if (!WriteMessage(request)) {
        correlator_.Reject(id, LspError(LspErrorKind::NotRunning, "LSP process not running"));
    }
    return id;
}

json LspClient::RequestUnchecked(const std::string& method, const json& params) {
    struct Outcome {
        bool done = false;
        json result;
        std::optional<LspError> error;
    };
    auto outcome = std::make_shared<Outcome>();

    SendRequestUnchecked(method, params,
        [outcome](const json& result) {
            outcome->done = true;
            outcome->result = result;
        },
        [outcome](const LspError& error) {
            outcome->done = true;
            outcome->error = error;
        });

    while (!outcome->done) {
        if (!transport_->IsRunning()) {
            // no process left to answer
            correlator_.RejectAll(LspError(LspErrorKind::ProcessExit, WithStderrTail("LSP process exited")));
            break;
        }
        PumpOnce(options_.pollInterval);
    }

    if (outcome->error) throw *outcome->error;
    return outcome->result;
}

bool LspClient::WriteMessage(const Message& message) {
    if (!CanWrite()) return false;

    if (!transport_->Write(FrameCodec::Encode(message))) {
        LogDebug(kModule, "Write to '" + config_.name + "' failed");
        return false;
    }
    return true;
}

bool LspClient::CanWrite() const {
    return transport_->IsRunning();
}

void LspClient::PumpOnce(std::chrono::milliseconds maxWait) {
    std::chrono::milliseconds wait = maxWait;
    if (auto next = correlator_.NextDeadline()) {
        const auto now = clock_->Now();
        const auto untilDeadline = *next <= now
            ? std::chrono::milliseconds(0)
            : std::chrono::ceil<std::chrono::milliseconds>(*next - now);
        wait = std::min(wait, untilDeadline);
    }

    if (transport_->IsRunning()) (void)transport_->Poll(wait, *this);
    correlator_.ExpireDue(clock_->Now());
}

// ---------------------------------------------------------------------------
// inbound
// ---------------------------------------------------------------------------

void LspClient::OnStdout(std::string_view bytes) {
    for (const Message& message : codec_.Feed(bytes)) {
        HandleMessage(message);
    }
}

void LspClient::OnStderr(std::string_view bytes) {
    stderr_tail_.append(bytes.data(), bytes.size());
    if (stderr_tail_.size() > options_.stderrTailBytes) {
        stderr_tail_.erase(0, stderr_tail_.size() - options_.stderrTailBytes);
    }

    stderr_line_.append(bytes.data(), bytes.size());
    size_t pos = 0;
    while ((pos = stderr_line_.find('\n')) != std::string::npos) {
        std::string line = stderr_line_.substr(0, pos);
        stderr_line_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) LogDebug("stderr", config_.name + ": " + line);
    }
}

void LspClient::OnExit(std::optional<int> exitCode) {
    last_exit_code_ = exitCode;
    if (!stderr_line_.empty()) {
        LogDebug("stderr", config_.name + ": " + stderr_line_);
        stderr_line_.clear();
    }

    if (state_ == ClientState::Stopped) {
        LogDebug(kModule, "LSP server '" + config_.name + "' exited during stop");
        return;
    }

    std::string message = "LSP process exited";
    message += exitCode ? " with code " + std::to_string(*exitCode) : std::string(" (killed by signal)");
    LogWarn(kModule, "'" + config_.name + "': " + message);

    state_ = ClientState::Errored;
    capabilities_.Clear();
    codec_.Reset();
    correlator_.RejectAll(LspError(LspErrorKind::ProcessExit, WithStderrTail(message)));
    ExitEvent.Emit(exitCode);
}

void LspClient::HandleMessage(const Message& message) {
    if (const auto* response = std::get_if<Response>(&message)) {
        if (!correlator_.Complete(*response)) {
            LogDebug(kModule, "Discarding response with no pending request: " + response->id.dump());
        }
    }
    else if (const auto* request = std::get_if<nanolsp::Request>(&message)) {
        HandleServerRequest(*request);
    }
    else if (const auto* notification = std::get_if<Notification>(&message)) {
        HandleNotification(*notification);
    }
}

void LspClient::HandleServerRequest(const nanolsp::Request& request) {
    const std::string& method = request.method;
    Response reply;

    if (method == methods::kConfiguration) {
        json result = json::array();
        if (request.params.is_object() && request.params.contains("items") && request.params["items"].is_array()) {
            for (size_t i = 0; i < request.params["items"].size(); ++i) result.push_back(nullptr);
        }
        reply = MakeResponse(request.id, result);
    }
    else if (method == methods::kWorkDoneProgressCreate
        || method == methods::kRegisterCapability
        || method == methods::kUnregisterCapability
        || method == methods::kShowMessageRequest) {
        reply = MakeResponse(request.id, nullptr);
    }
    else if (method == methods::kWorkspaceFolders) {
        json folders = nullptr;
        if (config_.rootUri) folders = json::array({ { {"uri", *config_.rootUri}, {"name", "workspace"} } });
        reply = MakeResponse(request.id, folders);
    }
    else {
        LogDebug(kModule, "Unsupported server request: " + method);
        reply = MakeErrorResponse(request.id, error_codes::kMethodNotFound, "Method not found: " + method);
    }

    (void)WriteMessage(reply);
}

void LspClient::HandleNotification(const Notification& notification) {
    (void)dispatcher_.Dispatch(notification);
}

std::string LspClient::WithStderrTail(std::string message) const {
    std::string tail = stderr_tail_;
    while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r' || tail.back() == ' ')) tail.pop_back();
    if (tail.empty()) return message;
    return message + "\nserver stderr:\n" + tail;
}

} // namespace nanolsp
