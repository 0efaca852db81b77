// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_protocol.cpp
 * @brief JSON conversion for LSP payload structures.
 *
 * Required fields are read with at() and throw nlohmann::json::exception
 * when missing or mistyped; the client turns that into a Protocol error.
 */

#include "nanolsp/lsp_protocol.hpp"

#include <cmath>

namespace nanolsp {

namespace {

template <typename T>
void ReadOptional(const json& j, const char* key, std::optional<T>& out) {
    const auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

bool ReadBool(const json& j, const char* key, bool fallback) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

json ReadRaw(const json& j, const char* key) {
    const auto it = j.find(key);
    return it == j.end() ? json() : *it;
}

} // anonymous namespace

bool IsTruthy(const json& value) {
    switch (value.type()) {
    case json::value_t::null:
    case json::value_t::discarded:
        return false;
    case json::value_t::boolean:
        return value.get<bool>();
    case json::value_t::number_integer:
        return value.get<long long>() != 0;
    case json::value_t::number_unsigned:
        return value.get<unsigned long long>() != 0;
    case json::value_t::number_float: {
        const double d = value.get<double>();
        return d != 0.0 && !std::isnan(d);
    }
    case json::value_t::string:
        return !value.get_ref<const std::string&>().empty();
    case json::value_t::object:
    case json::value_t::array:
    case json::value_t::binary:
        return true;
    }
    return false;
}

FormattingOptions FormattingOptionsPatch::Resolve() const {
    FormattingOptions o;
    if (tabSize) o.tabSize = *tabSize;
    if (insertSpaces) o.insertSpaces = *insertSpaces;
    if (trimTrailingWhitespace) o.trimTrailingWhitespace = *trimTrailingWhitespace;
    if (insertFinalNewline) o.insertFinalNewline = *insertFinalNewline;
    if (trimFinalNewlines) o.trimFinalNewlines = *trimFinalNewlines;
    return o;
}

// ─── Position / Range ───────────────────────────────────────

void to_json(json& j, const Position& p) {
    j = json{ {"line", p.line}, {"character", p.character} };
}

void from_json(const json& j, Position& p) {
    j.at("line").get_to(p.line);
    j.at("character").get_to(p.character);
}

void to_json(json& j, const Range& r) {
    j = json{ {"start", r.start}, {"end", r.end} };
}

void from_json(const json& j, Range& r) {
    j.at("start").get_to(r.start);
    j.at("end").get_to(r.end);
}

// ─── Diagnostics ────────────────────────────────────────────

void to_json(json& j, const Diagnostic& d) {
    j = json{ {"range", d.range}, {"message", d.message} };
    if (d.severity) j["severity"] = static_cast<int>(*d.severity);
    if (!d.code.is_null()) j["code"] = d.code;
    if (d.source) j["source"] = *d.source;
    if (!d.relatedInformation.is_null()) j["relatedInformation"] = d.relatedInformation;
}

void from_json(const json& j, Diagnostic& d) {
    j.at("range").get_to(d.range);
    j.at("message").get_to(d.message);

    std::optional<int> severity;
    ReadOptional(j, "severity", severity);
    if (severity && *severity >= 1 && *severity <= 4) {
        d.severity = static_cast<DiagnosticSeverity>(*severity);
    }
    else {
        d.severity.reset();
    }

    d.code = ReadRaw(j, "code");
    ReadOptional(j, "source", d.source);
    d.relatedInformation = ReadRaw(j, "relatedInformation");
}

void to_json(json& j, const PublishDiagnosticsParams& p) {
    j = json{ {"uri", p.uri}, {"diagnostics", p.diagnostics} };
    if (p.version) j["version"] = *p.version;
}

void from_json(const json& j, PublishDiagnosticsParams& p) {
    j.at("uri").get_to(p.uri);
    ReadOptional(j, "version", p.version);
    p.diagnostics.clear();
    const auto it = j.find("diagnostics");
    if (it != j.end() && !it->is_null()) it->get_to(p.diagnostics);
}

const char* ToString(DiagnosticSeverity severity) {
    switch (severity) {
    case DiagnosticSeverity::Error:       return "error";
    case DiagnosticSeverity::Warning:     return "warning";
    case DiagnosticSeverity::Information: return "info";
    case DiagnosticSeverity::Hint:        return "hint";
    }
    return "unknown";
}

// ─── Edits / commands / code actions ────────────────────────

void to_json(json& j, const TextEdit& e) {
    j = json{ {"range", e.range}, {"newText", e.newText} };
}

void from_json(const json& j, TextEdit& e) {
    j.at("range").get_to(e.range);
    j.at("newText").get_to(e.newText);
}

void to_json(json& j, const Command& c) {
    j = json{ {"title", c.title}, {"command", c.command} };
    if (!c.arguments.is_null()) j["arguments"] = c.arguments;
}

void from_json(const json& j, Command& c) {
    j.at("title").get_to(c.title);
    j.at("command").get_to(c.command);
    c.arguments = ReadRaw(j, "arguments");
}

void from_json(const json& j, CodeAction& a) {
    // (Command | CodeAction)[]: a bare Command has a string "command"
    const auto cmdIt = j.find("command");
    if (cmdIt != j.end() && cmdIt->is_string()) {
        Command cmd = j.get<Command>();
        a = CodeAction{};
        a.title = cmd.title;
        a.command = std::move(cmd);
        a.raw = j;
        return;
    }

    j.at("title").get_to(a.title);
    ReadOptional(j, "kind", a.kind);
    a.diagnostics.clear();
    const auto diagIt = j.find("diagnostics");
    if (diagIt != j.end() && !diagIt->is_null()) diagIt->get_to(a.diagnostics);
    a.isPreferred = ReadBool(j, "isPreferred", false);
    a.edit = ReadRaw(j, "edit");
    a.command.reset();
    if (cmdIt != j.end() && cmdIt->is_object()) a.command = cmdIt->get<Command>();
    a.raw = j;
}

// ─── Completion ─────────────────────────────────────────────

void from_json(const json& j, CompletionItem& item) {
    j.at("label").get_to(item.label);
    ReadOptional(j, "kind", item.kind);
    ReadOptional(j, "detail", item.detail);

    item.documentation.reset();
    const auto docIt = j.find("documentation");
    if (docIt != j.end()) {
        if (docIt->is_string()) item.documentation = docIt->get<std::string>();
        else if (docIt->is_object()) item.documentation = docIt->value("value", std::string());
    }

    item.deprecated = ReadBool(j, "deprecated", false);
    ReadOptional(j, "insertText", item.insertText);

    std::optional<int> format;
    ReadOptional(j, "insertTextFormat", format);
    if (format && (*format == 1 || *format == 2)) item.insertTextFormat = static_cast<InsertTextFormat>(*format);
    else item.insertTextFormat.reset();

    item.textEdit.reset();
    const auto editIt = j.find("textEdit");
    if (editIt != j.end() && editIt->is_object()) {
        if (editIt->contains("range")) {
            item.textEdit = editIt->get<TextEdit>();
        }
        else if (editIt->contains("insert")) {
            // InsertReplaceEdit: keep the insert range
            TextEdit edit;
            editIt->at("insert").get_to(edit.range);
            editIt->at("newText").get_to(edit.newText);
            item.textEdit = std::move(edit);
        }
    }

    item.additionalTextEdits.clear();
    const auto addIt = j.find("additionalTextEdits");
    if (addIt != j.end() && !addIt->is_null()) addIt->get_to(item.additionalTextEdits);

    ReadOptional(j, "sortText", item.sortText);
    ReadOptional(j, "filterText", item.filterText);
    item.data = ReadRaw(j, "data");
    item.raw = j;
}

// ─── Formatting ─────────────────────────────────────────────

void to_json(json& j, const FormattingOptions& o) {
    j = json{
        {"tabSize", o.tabSize},
        {"insertSpaces", o.insertSpaces},
        {"trimTrailingWhitespace", o.trimTrailingWhitespace},
        {"insertFinalNewline", o.insertFinalNewline},
        {"trimFinalNewlines", o.trimFinalNewlines},
    };
}

// ─── Capabilities ───────────────────────────────────────────

void from_json(const json& j, ServerCapabilities& caps) {
    caps = ServerCapabilities{};
    if (!j.is_object()) return;

    caps.raw = j;
    caps.completionProvider = IsTruthy(ReadRaw(j, "completionProvider"));
    caps.codeActionProvider = IsTruthy(ReadRaw(j, "codeActionProvider"));
    caps.documentFormattingProvider = IsTruthy(ReadRaw(j, "documentFormattingProvider"));
    caps.diagnosticProvider = IsTruthy(ReadRaw(j, "diagnosticProvider"));

    const json sync = ReadRaw(j, "textDocumentSync");
    int syncKind = -1;
    if (sync.is_number_integer()) syncKind = sync.get<int>();
    else if (sync.is_object() && sync.contains("change") && sync["change"].is_number_integer()) syncKind = sync["change"].get<int>();
    if (syncKind >= 0 && syncKind <= 2) caps.textDocumentSync = static_cast<TextDocumentSyncKind>(syncKind);

    const json completion = ReadRaw(j, "completionProvider");
    if (completion.is_object() && completion.contains("triggerCharacters") && completion["triggerCharacters"].is_array()) {
        for (const auto& c : completion["triggerCharacters"]) {
            if (c.is_string()) caps.completionTriggerCharacters.push_back(c.get<std::string>());
        }
    }
}

void from_json(const json& j, InitializeResult& result) {
    result = InitializeResult{};
    if (!j.is_object()) return;

    const auto capsIt = j.find("capabilities");
    if (capsIt != j.end()) capsIt->get_to(result.capabilities);

    const auto infoIt = j.find("serverInfo");
    if (infoIt != j.end() && infoIt->is_object()) {
        ReadOptional(*infoIt, "name", result.serverName);
        ReadOptional(*infoIt, "version", result.serverVersion);
    }
}

} // namespace nanolsp
