// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include <gtest/gtest.h>

#include "nanolsp/lsp_capability_store.hpp"
#include "nanolsp/lsp_document_tracker.hpp"
#include "nanolsp/lsp_protocol.hpp"

using namespace nanolsp;

// ============================================================================
// Payload conversion
// ============================================================================

TEST(ProtocolTests, TruthinessFollowsProviderConventions) {
    EXPECT_TRUE(IsTruthy(json(true)));
    EXPECT_TRUE(IsTruthy(json::object()));
    EXPECT_TRUE(IsTruthy(json{ {"resolveProvider", false} }));
    EXPECT_TRUE(IsTruthy(json(1)));
    EXPECT_TRUE(IsTruthy(json("x")));
    EXPECT_FALSE(IsTruthy(json(false)));
    EXPECT_FALSE(IsTruthy(json(nullptr)));
    EXPECT_FALSE(IsTruthy(json(0)));
    EXPECT_FALSE(IsTruthy(json("")));
}

TEST(ProtocolTests, ServerCapabilitiesFromInitializeResult) {
    const json raw = json::parse(R"({
        "capabilities": {
            "completionProvider": {"triggerCharacters": [".", "\""]},
            "codeActionProvider": true,
            "documentFormattingProvider": false,
            "textDocumentSync": {"openClose": true, "change": 2}
        },
        "serverInfo": {"name": "tsserver", "version": "4.3"}
    })");

    const InitializeResult result = raw.get<InitializeResult>();
    EXPECT_TRUE(result.capabilities.completionProvider);
    EXPECT_TRUE(result.capabilities.codeActionProvider);
    EXPECT_FALSE(result.capabilities.documentFormattingProvider);
    EXPECT_FALSE(result.capabilities.diagnosticProvider);
    ASSERT_TRUE(result.capabilities.textDocumentSync.has_value());
    EXPECT_EQ(*result.capabilities.textDocumentSync, TextDocumentSyncKind::Incremental);
    EXPECT_EQ(result.capabilities.completionTriggerCharacters, (std::vector<std::string>{ ".", "\"" }));
    EXPECT_EQ(result.serverName, std::optional<std::string>("tsserver"));
    EXPECT_EQ(result.serverVersion, std::optional<std::string>("4.3"));
    EXPECT_EQ(result.capabilities.raw["codeActionProvider"], true);
}

TEST(ProtocolTests, DiagnosticRoundTripsOptionalFields) {
    const json raw = json::parse(R"({
        "range": {"start": {"line": 1, "character": 2}, "end": {"line": 1, "character": 8}},
        "severity": 2,
        "code": "TS6133",
        "source": "ts",
        "message": "'x' is declared but never used."
    })");

    const Diagnostic d = raw.get<Diagnostic>();
    EXPECT_EQ(d.range.start.line, 1);
    EXPECT_EQ(d.range.end.character, 8);
    EXPECT_EQ(d.severity, std::optional<DiagnosticSeverity>(DiagnosticSeverity::Warning));
    EXPECT_EQ(d.code, json("TS6133"));
    EXPECT_EQ(d.source, std::optional<std::string>("ts"));
    EXPECT_EQ(json(d), raw);
}

TEST(ProtocolTests, DiagnosticWithoutMessageThrows) {
    const json raw = json::parse(R"({"range": {"start": {"line": 0, "character": 0}, "end": {"line": 0, "character": 1}}})");
    EXPECT_THROW(raw.get<Diagnostic>(), json::exception);
}

TEST(ProtocolTests, CompletionItemDocumentationForms) {
    const CompletionItem plain = json::parse(R"({"label": "log", "documentation": "Writes a line"})").get<CompletionItem>();
    EXPECT_EQ(plain.documentation, std::optional<std::string>("Writes a line"));

    const CompletionItem markup = json::parse(
        R"({"label": "log", "documentation": {"kind": "markdown", "value": "**Writes**"}})").get<CompletionItem>();
    EXPECT_EQ(markup.documentation, std::optional<std::string>("**Writes**"));
}

TEST(ProtocolTests, CompletionItemInsertReplaceEditUsesInsertRange) {
    const CompletionItem item = json::parse(R"({
        "label": "length",
        "insertTextFormat": 2,
        "textEdit": {
            "newText": "length",
            "insert": {"start": {"line": 0, "character": 4}, "end": {"line": 0, "character": 6}},
            "replace": {"start": {"line": 0, "character": 4}, "end": {"line": 0, "character": 9}}
        },
        "data": {"id": 17}
    })").get<CompletionItem>();

    ASSERT_TRUE(item.textEdit.has_value());
    EXPECT_EQ(item.textEdit->range.end.character, 6);
    EXPECT_EQ(item.insertTextFormat, std::optional<InsertTextFormat>(InsertTextFormat::Snippet));
    EXPECT_EQ(item.data, json({ {"id", 17} }));
}

TEST(ProtocolTests, BareCommandBecomesCodeAction) {
    const CodeAction action = json::parse(
        R"({"title": "Organize imports", "command": "_typescript.organizeImports", "arguments": ["/a.ts"]})").get<CodeAction>();
    EXPECT_EQ(action.title, "Organize imports");
    ASSERT_TRUE(action.command.has_value());
    EXPECT_EQ(action.command->command, "_typescript.organizeImports");
    EXPECT_EQ(action.command->arguments, json::array({ "/a.ts" }));
    EXPECT_FALSE(action.kind.has_value());
    EXPECT_EQ(action.raw["command"], "_typescript.organizeImports");
}

TEST(ProtocolTests, CodeActionLiteral) {
    const CodeAction action = json::parse(R"({
        "title": "Remove unused variable",
        "kind": "quickfix",
        "isPreferred": true,
        "edit": {"changes": {}},
        "command": {"title": "Fix", "command": "fix.run"}
    })").get<CodeAction>();
    EXPECT_EQ(action.kind, std::optional<std::string>("quickfix"));
    EXPECT_TRUE(action.isPreferred);
    EXPECT_TRUE(action.edit.is_object());
    ASSERT_TRUE(action.command.has_value());
    EXPECT_EQ(action.command->title, "Fix");
}

TEST(ProtocolTests, FormattingDefaultsAndOverrides) {
    const json defaults = FormattingOptionsPatch{}.Resolve();
    EXPECT_EQ(defaults, json::parse(R"({"tabSize":2,"insertSpaces":true,"trimTrailingWhitespace":true,
        "insertFinalNewline":true,"trimFinalNewlines":true})"));

    FormattingOptionsPatch patch;
    patch.tabSize = 4;
    patch.insertFinalNewline = false;
    const FormattingOptions o = patch.Resolve();
    EXPECT_EQ(o.tabSize, 4);
    EXPECT_TRUE(o.insertSpaces);
    EXPECT_FALSE(o.insertFinalNewline);
    EXPECT_TRUE(o.trimFinalNewlines);
}

// ============================================================================
// CapabilityStore
// ============================================================================

TEST(CapabilityStoreTests, EmptyStoreSupportsNothing) {
    CapabilityStore store;
    EXPECT_FALSE(store.IsSet());
    EXPECT_FALSE(store.Get().has_value());
    EXPECT_FALSE(store.Supports(Capability::Completion));
}

TEST(CapabilityStoreTests, SetOnceUntilCleared) {
    CapabilityStore store;
    ServerCapabilities first;
    first.completionProvider = true;
    ServerCapabilities second;
    second.codeActionProvider = true;

    EXPECT_TRUE(store.Set(first));
    EXPECT_FALSE(store.Set(second));
    EXPECT_TRUE(store.Supports(Capability::Completion));
    EXPECT_FALSE(store.Supports(Capability::CodeAction));

    store.Clear();
    EXPECT_FALSE(store.IsSet());
    EXPECT_TRUE(store.Set(second));
    EXPECT_TRUE(store.Supports(Capability::CodeAction));
}

TEST(CapabilityStoreTests, GatesOnlyClientOperations) {
    const ServerCapabilities caps = json::parse(R"({
        "hoverProvider": true,
        "definitionProvider": true,
        "documentFormattingProvider": {},
        "diagnosticProvider": {"interFileDependencies": false}
    })").get<ServerCapabilities>();

    CapabilityStore store;
    store.Set(caps);
    EXPECT_FALSE(store.Supports(Capability::Completion));
    EXPECT_FALSE(store.Supports(Capability::CodeAction));
    EXPECT_TRUE(store.Supports(Capability::DocumentFormatting));
    EXPECT_TRUE(store.Supports(Capability::Diagnostic));
    EXPECT_STREQ(ToString(Capability::Diagnostic), "diagnosticProvider");

    // unmodelled providers remain visible through the raw object
    EXPECT_EQ(store.Get()->raw["hoverProvider"], true);
}

// ============================================================================
// DocumentTracker
// ============================================================================

TEST(DocumentTrackerTests, VersionsCountFromOne) {
    DocumentTracker docs;
    EXPECT_EQ(docs.Open("file:///a.ts"), 1);
    EXPECT_EQ(docs.Update("file:///a.ts"), 2);
    EXPECT_EQ(docs.Update("file:///a.ts"), 3);
    EXPECT_EQ(docs.Version("file:///a.ts"), std::optional<int>(3));
}

TEST(DocumentTrackerTests, CloseRestartsVersioning) {
    DocumentTracker docs;
    docs.Open("file:///a.ts");
    docs.Update("file:///a.ts");
    EXPECT_TRUE(docs.Close("file:///a.ts"));
    EXPECT_FALSE(docs.Close("file:///a.ts"));
    EXPECT_FALSE(docs.IsOpen("file:///a.ts"));
    EXPECT_EQ(docs.Update("file:///a.ts"), 1);
}

TEST(DocumentTrackerTests, UpdateWithoutOpenStartsAtOne) {
    DocumentTracker docs;
    EXPECT_EQ(docs.Update("file:///b.ts"), 1);
    EXPECT_TRUE(docs.IsOpen("file:///b.ts"));
}

TEST(DocumentTrackerTests, ReopenResetsVersion) {
    DocumentTracker docs;
    docs.Open("file:///a.ts");
    docs.Update("file:///a.ts");
    EXPECT_EQ(docs.Open("file:///a.ts"), 1);
}

TEST(DocumentTrackerTests, OpenUrisAreSorted) {
    DocumentTracker docs;
    docs.Open("file:///c.ts");
    docs.Open("file:///a.ts");
    docs.Update("file:///b.ts");
    EXPECT_EQ(docs.OpenUris(), (std::vector<std::string>{ "file:///a.ts", "file:///b.ts", "file:///c.ts" }));
    EXPECT_EQ(docs.Size(), 3u);
    docs.Clear();
    EXPECT_EQ(docs.Size(), 0u);
}
