// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_message.hpp
 * @brief JSON-RPC 2.0 message variant.
 *
 * A decoded frame is exactly one of Request, Response or Notification,
 * classified by the presence of "id" and "method". Method name and
 * error code constants used by the client live here as well.
 */

#pragma once
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace nanolsp {

using json = nlohmann::json;

struct ResponseError {
    int code = 0;
    std::string message;
    json data;  // null when absent
};

struct Request {
    json id;  // number or string
    std::string method;
    json params;
};

struct Response {
    json id;  // null for errors the peer could not attribute
    json result;
    std::optional<ResponseError> error;
};

struct Notification {
    std::string method;
    json params;
};

using Message = std::variant<Request, Response, Notification>;

bool operator==(const ResponseError& a, const ResponseError& b);
bool operator==(const Request& a, const Request& b);
bool operator==(const Response& a, const Response& b);
bool operator==(const Notification& a, const Notification& b);

// Wire form including "jsonrpc":"2.0". Absent params are omitted.
json ToJson(const Request& req);
json ToJson(const Response& resp);
json ToJson(const Notification& note);
json ToJson(const Message& msg);

// Classify a parsed body. nullopt when it is not a JSON-RPC message
// (not an object, method of the wrong type, neither id nor method).
std::optional<Message> MessageFromJson(const json& body);

Response MakeResponse(const json& id, const json& result);
Response MakeErrorResponse(const json& id, int code, const std::string& message);

// Integer request id, nullopt for string/null ids.
std::optional<long long> IntegerId(const json& id);

namespace methods {
    // lifecycle
    inline constexpr const char* kInitialize = "initialize";
    inline constexpr const char* kInitialized = "initialized";
    inline constexpr const char* kShutdown = "shutdown";
    inline constexpr const char* kExit = "exit";

    // text document sync
    inline constexpr const char* kDidOpen = "textDocument/didOpen";
    inline constexpr const char* kDidChange = "textDocument/didChange";
    inline constexpr const char* kDidClose = "textDocument/didClose";

    // language features
    inline constexpr const char* kCompletion = "textDocument/completion";
    inline constexpr const char* kCodeAction = "textDocument/codeAction";
    inline constexpr const char* kFormatting = "textDocument/formatting";
    inline constexpr const char* kDocumentDiagnostic = "textDocument/diagnostic";

    // server -> client
    inline constexpr const char* kPublishDiagnostics = "textDocument/publishDiagnostics";
    inline constexpr const char* kLogMessage = "window/logMessage";
    inline constexpr const char* kShowMessage = "window/showMessage";
    inline constexpr const char* kShowMessageRequest = "window/showMessageRequest";
    inline constexpr const char* kWorkDoneProgressCreate = "window/workDoneProgress/create";
    inline constexpr const char* kConfiguration = "workspace/configuration";
    inline constexpr const char* kWorkspaceFolders = "workspace/workspaceFolders";
    inline constexpr const char* kRegisterCapability = "client/registerCapability";
    inline constexpr const char* kUnregisterCapability = "client/unregisterCapability";
} // namespace methods

namespace error_codes {
    inline constexpr int kParseError = -32700;
    inline constexpr int kInvalidRequest = -32600;
    inline constexpr int kMethodNotFound = -32601;
    inline constexpr int kInvalidParams = -32602;
    inline constexpr int kInternalError = -32603;
} // namespace error_codes

} // namespace nanolsp
