// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_server_catalog.cpp
 * @brief Known server table and discovery.
 */

#include "nanolsp/lsp_server_catalog.hpp"
#include "nanolsp/lsp_log.hpp"
#include "nanolsp/lsp_process_transport.hpp"
#include "nanolsp/lsp_utils.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <system_error>
#include <unordered_map>

namespace nanolsp {

namespace {

constexpr std::string_view kModule = "catalog";

std::string StripDot(const std::string& extension) {
    if (!extension.empty() && extension[0] == '.') return extension.substr(1);
    return extension;
}

bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

std::vector<std::string> SplitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

// Collects only the exit status of a check process.
class ExitWatcher : public TransportSink {
public:
    void OnStdout(std::string_view) override {}
    void OnStderr(std::string_view) override {}
    void OnExit(std::optional<int> exitCode) override {
        exited = true;
        code = exitCode;
    }

    bool exited = false;
    std::optional<int> code;
};

bool RunCheckCommand(const std::string& resolvedCommand, const std::vector<std::string>& args) {
    ServerConfig check;
    check.name = "check";
    check.command = resolvedCommand;
    check.args = args;

    ProcessTransport process;
    std::string err;
    if (!process.Spawn(check, err)) {
        LogDebug(kModule, "Check command failed to start: " + err);
        return false;
    }

    ExitWatcher watcher;
    const auto deadline = std::chrono::steady_clock::now() + kVersionCheckTimeout;
    while (!watcher.exited && std::chrono::steady_clock::now() < deadline) {
        if (!process.Poll(std::chrono::milliseconds(100), watcher)) break;
    }

    if (!watcher.exited) {
        LogDebug(kModule, "Check command timed out: " + resolvedCommand);
        (void)process.Terminate(std::chrono::milliseconds(100));
        return false;
    }
    return watcher.code && *watcher.code == 0;
}

} // anonymous namespace

const std::vector<KnownServer>& KnownServers() {
    static const std::vector<KnownServer> servers = {
        { "typescript-language-server", "typescript-language-server", { "--stdio" },
            { "ts", "tsx", "js", "jsx", "mjs", "cjs" },
            "typescript-language-server --version", VerificationMethod::Version,
            "npm install -g typescript-language-server typescript" },
        { "deno", "deno", { "lsp" },
            { "ts", "tsx", "js", "jsx", "mjs", "cjs" },
            "deno --version", VerificationMethod::Version,
            "Install Deno from https://deno.com/" },
        { "pyright", "pyright-langserver", { "--stdio" },
            { "py", "pyi" },
            "pyright-langserver --version", VerificationMethod::Lsp,
            "npm install -g pyright" },
        { "pylsp", "pylsp", {},
            { "py", "pyi" },
            "pylsp --version", VerificationMethod::Version,
            "pip install python-lsp-server" },
        { "rust-analyzer", "rust-analyzer", {},
            { "rs" },
            "rust-analyzer --version", VerificationMethod::Version,
            "rustup component add rust-analyzer" },
        { "gopls", "gopls", { "serve" },
            { "go" },
            "gopls version", VerificationMethod::Version,
            "go install golang.org/x/tools/gopls@latest" },
        { "clangd", "clangd", { "--background-index" },
            { "c", "cpp", "cc", "cxx", "h", "hpp", "hxx" },
            "clangd --version", VerificationMethod::Version,
            "Install via system package manager (apt, brew, etc.)" },
        { "vscode-json-languageserver", "vscode-json-language-server", { "--stdio" },
            { "json", "jsonc" },
            "vscode-json-language-server --version", VerificationMethod::Lsp,
            "npm install -g vscode-langservers-extracted" },
        { "vscode-html-languageserver", "vscode-html-language-server", { "--stdio" },
            { "html", "htm" },
            "vscode-html-language-server --version", VerificationMethod::Lsp,
            "npm install -g vscode-langservers-extracted" },
        { "vscode-css-languageserver", "vscode-css-language-server", { "--stdio" },
            { "css", "scss", "less" },
            "vscode-css-language-server --version", VerificationMethod::Lsp,
            "npm install -g vscode-langservers-extracted" },
        { "yaml-language-server", "yaml-language-server", { "--stdio" },
            { "yaml", "yml" },
            "yaml-language-server --version", VerificationMethod::Lsp,
            "npm install -g yaml-language-server" },
        { "bash-language-server", "bash-language-server", { "start" },
            { "sh", "bash", "zsh" },
            "bash-language-server --version", VerificationMethod::Version,
            "npm install -g bash-language-server" },
        { "lua-language-server", "lua-language-server", {},
            { "lua" },
            "lua-language-server --version", VerificationMethod::Version,
            "Install from https://github.com/LuaLS/lua-language-server" },
        { "vscode-markdown-language-server", "vscode-mdx-language-server", { "--stdio" },
            { "md", "markdown", "mdx" },
            "vscode-mdx-language-server --version", VerificationMethod::Lsp,
            "npm install -g @microsoft/vscode-mdx-language-server or vscode-langservers-extracted" },
        { "marksman", "marksman", { "server" },
            { "md", "markdown" },
            "marksman --version", VerificationMethod::Version,
            "npm install -g marksman or download from https://github.com/artempyanykh/marksman/releases" },
        { "graphql-lsp-server", "graphql-lsp", { "server", "-s" },
            { "graphql", "gql" },
            "graphql-lsp --version", VerificationMethod::Version,
            "npm install -g @graphql-tools/lsp-server" },
        { "graphql-language-server-cli", "graphql-lsp", { "server", "--stdio" },
            { "graphql", "gql" },
            "graphql-lsp --version", VerificationMethod::Version,
            "npm install -g graphql-language-service-cli" },
        { "docker-language", "docker-langserver", { "--stdio" },
            { "dockerfile" },
            "docker-langserver --version", VerificationMethod::Version,
            "npm install -g docker-langserver or https://github.com/rcjsuen/dockerfile-language-server-nodejs" },
        { "docker-compose-language", "yaml-language-server", { "--stdio" },
            { "yaml", "yml", "docker-compose" },
            "yaml-language-server --version", VerificationMethod::Version,
            "npm install -g yaml-language-server" },
    };
    return servers;
}

bool IsDenoProject(const std::filesystem::path& root) {
    std::error_code ec;
    for (const char* name : { "deno.json", "deno.jsonc" }) {
        if (std::filesystem::exists(root / name, ec)) return true;
    }
    return false;
}

std::vector<KnownServer> GetOrderedServers(const std::filesystem::path& root) {
    std::vector<KnownServer> servers = KnownServers();
    if (!IsDenoProject(root)) return servers;

    auto deno = std::find_if(servers.begin(), servers.end(), [](const KnownServer& s) { return s.name == "deno"; });
    if (deno != servers.end() && deno != servers.begin()) {
        std::rotate(servers.begin(), deno, deno + 1);
    }
    return servers;
}

std::optional<std::string> FindCommand(const std::string& command, const std::filesystem::path& projectRoot) {
    if (auto onPath = FindExecutable(command)) return onPath->string();

    std::error_code ec;
    const std::filesystem::path local = projectRoot / "node_modules" / ".bin" / command;
    if (std::filesystem::exists(local, ec)) return local.string();

    return std::nullopt;
}

bool VerifyServer(const KnownServer& server, const std::string& resolvedCommand) {
    switch (server.verification) {
    case VerificationMethod::Version: {
        if (server.checkCommand.empty()) return true;
        std::vector<std::string> words = SplitWords(server.checkCommand);
        if (words.empty()) return true;
        words.erase(words.begin());  // the command itself, replaced by the resolved path
        return RunCheckCommand(resolvedCommand, words);
    }
    case VerificationMethod::Lsp: {
        ServerConfig probe;
        probe.name = server.name;
        probe.command = resolvedCommand;
        probe.args = server.args;

        ProcessTransport process;
        std::string err;
        if (!process.Spawn(probe, err)) {
            LogDebug(kModule, server.name + " did not start: " + err);
            return false;
        }
        (void)process.Terminate(std::chrono::milliseconds(100));
        return true;
    }
    case VerificationMethod::None:
        return true;
    }
    return false;
}

std::vector<ServerConfig> DiscoverLanguageServers(const std::filesystem::path& projectRoot) {
    return DiscoverLanguageServers(projectRoot, VerifyServer);
}

std::vector<ServerConfig> DiscoverLanguageServers(const std::filesystem::path& projectRoot, const ServerVerifier& verify) {
    std::vector<ServerConfig> discovered;
    std::set<std::string> covered;

    for (const KnownServer& server : GetOrderedServers(projectRoot)) {
        const bool hasNewLanguage = std::any_of(server.languages.begin(), server.languages.end(),
            [&](const std::string& lang) { return covered.count(lang) == 0; });
        if (!hasNewLanguage) continue;

        const auto commandPath = FindCommand(server.command, projectRoot);
        if (!commandPath) continue;

        if (!verify(server, *commandPath)) {
            LogDebug(kModule, "Verification failed for " + server.name);
            continue;
        }

        ServerConfig cfg;
        cfg.name = server.name;
        cfg.command = *commandPath;
        cfg.args = server.args;
        cfg.languages = server.languages;
        discovered.push_back(std::move(cfg));

        covered.insert(server.languages.begin(), server.languages.end());
        LogDebug(kModule, "Discovered " + server.name + " at " + *commandPath);
    }
    return discovered;
}

const ServerConfig* GetServerForLanguage(const std::vector<ServerConfig>& servers, const std::string& extension) {
    const std::string ext = StripDot(extension);
    for (const auto& server : servers) {
        if (Contains(server.languages, ext)) return &server;
    }
    return nullptr;
}

std::string GetLanguageId(const std::string& extension) {
    const std::string ext = StripDot(extension);

    if (ext == "docker-compose.yml" || ext == "docker-compose.yaml"
        || ext == "compose.yml" || ext == "compose.yaml") {
        return "docker-compose";
    }

    static const std::unordered_map<std::string, std::string> kLanguageMap = {
        { "ts", "typescript" }, { "tsx", "typescriptreact" },
        { "js", "javascript" }, { "jsx", "javascriptreact" },
        { "mjs", "javascript" }, { "cjs", "javascript" },
        { "py", "python" }, { "pyi", "python" },
        { "rs", "rust" },
        { "go", "go" },
        { "c", "c" }, { "h", "c" },
        { "cpp", "cpp" }, { "cc", "cpp" }, { "cxx", "cpp" }, { "hpp", "cpp" }, { "hxx", "cpp" },
        { "json", "json" }, { "jsonc", "jsonc" },
        { "html", "html" }, { "htm", "html" },
        { "css", "css" }, { "scss", "scss" }, { "less", "less" },
        { "yaml", "yaml" }, { "yml", "yaml" },
        { "sh", "shellscript" }, { "bash", "shellscript" }, { "zsh", "shellscript" },
        { "lua", "lua" },
        { "md", "markdown" }, { "markdown", "markdown" }, { "mdx", "markdown" },
        { "toml", "toml" },
        { "xml", "xml" },
        { "sql", "sql" },
        { "java", "java" },
        { "kt", "kotlin" },
        { "swift", "swift" },
        { "rb", "ruby" },
        { "php", "php" },
        { "graphql", "graphql" }, { "gql", "graphql" },
        { "dockerfile", "dockerfile" },
    };

    auto it = kLanguageMap.find(ext);
    return it != kLanguageMap.end() ? it->second : ext;
}

std::vector<std::string> GetMissingServerHints(const std::vector<std::string>& extensions,
    const std::filesystem::path& projectRoot) {
    std::vector<std::string> hints;
    std::set<std::string> checked;

    for (const auto& extension : extensions) {
        const std::string ext = StripDot(extension);
        for (const auto& server : KnownServers()) {
            if (checked.count(server.name) != 0) continue;
            if (!Contains(server.languages, ext)) continue;

            checked.insert(server.name);
            if (!FindCommand(server.command, projectRoot) && !server.installHint.empty()) {
                hints.push_back(server.name + ": " + server.installHint);
            }
        }
    }
    return hints;
}

std::optional<std::filesystem::path> FindLocalServer(const std::filesystem::path& projectRoot, const std::string& serverName) {
    const std::filesystem::path candidates[] = {
        projectRoot / "node_modules" / ".bin" / serverName,
        projectRoot / "node_modules" / serverName / "bin" / serverName,
    };

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (std::filesystem::exists(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

std::vector<KnownServerStatus> GetKnownServersStatus(const std::filesystem::path& projectRoot) {
    std::vector<KnownServerStatus> out;
    out.reserve(KnownServers().size());
    for (const auto& server : KnownServers()) {
        KnownServerStatus status;
        status.name = server.name;
        status.available = FindCommand(server.command, projectRoot).has_value();
        status.languages = server.languages;
        status.installHint = server.installHint;
        out.push_back(std::move(status));
    }
    return out;
}

} // namespace nanolsp
