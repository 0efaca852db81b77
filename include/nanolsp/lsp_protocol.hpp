// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_protocol.hpp
 * @brief LSP payload structures used by the client.
 *
 * Only the subset the client sends or reads is modeled. Field names
 * follow the protocol's JSON names. Nested structures the client never
 * inspects (workspace edits, command arguments) stay as raw JSON.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nanolsp {

using json = nlohmann::json;

struct Position {
    int line = 0;       // 0-based
    int character = 0;  // 0-based, UTF-16 code units
};

struct Range {
    Position start;
    Position end;
};

enum class DiagnosticSeverity { Error = 1, Warning = 2, Information = 3, Hint = 4 };

struct Diagnostic {
    Range range;
    std::optional<DiagnosticSeverity> severity;
    json code;  // number, string or null
    std::optional<std::string> source;
    std::string message;
    json relatedInformation;  // null when absent
};

struct PublishDiagnosticsParams {
    std::string uri;
    std::optional<int> version;
    std::vector<Diagnostic> diagnostics;
};

struct TextEdit {
    Range range;
    std::string newText;
};

struct Command {
    std::string title;
    std::string command;
    json arguments;  // null when absent
};

struct CodeAction {
    std::string title;
    std::optional<std::string> kind;
    std::vector<Diagnostic> diagnostics;
    bool isPreferred = false;
    json edit;  // WorkspaceEdit, null when absent
    std::optional<Command> command;
    json raw;  // the action exactly as the server sent it
};

enum class InsertTextFormat { PlainText = 1, Snippet = 2 };

struct CompletionItem {
    std::string label;
    std::optional<int> kind;  // CompletionItemKind
    std::optional<std::string> detail;
    std::optional<std::string> documentation;  // plain string or MarkupContent.value
    bool deprecated = false;
    std::optional<std::string> insertText;
    std::optional<InsertTextFormat> insertTextFormat;
    std::optional<TextEdit> textEdit;
    std::vector<TextEdit> additionalTextEdits;
    std::optional<std::string> sortText;
    std::optional<std::string> filterText;
    json data;  // opaque, echoed back by resolve requests
    json raw;   // the item exactly as the server sent it
};

enum class CompletionTriggerKind { Invoked = 1, TriggerCharacter = 2, TriggerForIncompleteCompletions = 3 };

struct FormattingOptions {
    int tabSize = 2;
    bool insertSpaces = true;
    bool trimTrailingWhitespace = true;
    bool insertFinalNewline = true;
    bool trimFinalNewlines = true;
};

// Partial formatting configuration; unset keys take FormattingOptions defaults.
struct FormattingOptionsPatch {
    std::optional<int> tabSize;
    std::optional<bool> insertSpaces;
    std::optional<bool> trimTrailingWhitespace;
    std::optional<bool> insertFinalNewline;
    std::optional<bool> trimFinalNewlines;

    FormattingOptions Resolve() const;
};

enum class TextDocumentSyncKind { None = 0, Full = 1, Incremental = 2 };

struct ServerCapabilities {
    // A provider counts as present when its JSON value is truthy:
    // true, any object, a non-empty string or a non-zero number.
    bool completionProvider = false;
    bool codeActionProvider = false;
    bool documentFormattingProvider = false;
    bool diagnosticProvider = false;

    std::optional<TextDocumentSyncKind> textDocumentSync;
    std::vector<std::string> completionTriggerCharacters;

    json raw = json::object();  // everything the server sent
};

struct InitializeResult {
    ServerCapabilities capabilities;
    std::optional<std::string> serverName;
    std::optional<std::string> serverVersion;
};

// LSP window/logMessage type
enum class MessageType { Error = 1, Warning = 2, Info = 3, Log = 4 };

// JavaScript-style truthiness of a JSON value.
bool IsTruthy(const json& value);

void to_json(json& j, const Position& p);
void from_json(const json& j, Position& p);
void to_json(json& j, const Range& r);
void from_json(const json& j, Range& r);
void to_json(json& j, const Diagnostic& d);
void from_json(const json& j, Diagnostic& d);
void to_json(json& j, const PublishDiagnosticsParams& p);
void from_json(const json& j, PublishDiagnosticsParams& p);
void to_json(json& j, const TextEdit& e);
void from_json(const json& j, TextEdit& e);
void to_json(json& j, const Command& c);
void from_json(const json& j, Command& c);
void from_json(const json& j, CodeAction& a);
void from_json(const json& j, CompletionItem& item);
void to_json(json& j, const FormattingOptions& o);
void from_json(const json& j, ServerCapabilities& caps);
void from_json(const json& j, InitializeResult& result);

const char* ToString(DiagnosticSeverity severity);

} // namespace nanolsp
