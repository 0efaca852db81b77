// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_server_catalog.hpp
 * @brief Known language servers and installed-server discovery.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "lsp_server_config.hpp"

namespace nanolsp {

enum class VerificationMethod {
    Version,  // run checkCommand, expect exit code 0
    Lsp,      // spawn the server itself, expect it to start
    None,     // found on PATH is enough
};

struct KnownServer {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::string> languages;  // extensions without the dot
    std::string checkCommand;
    VerificationMethod verification = VerificationMethod::Version;
    std::string installHint;
};

struct KnownServerStatus {
    std::string name;
    bool available = false;
    std::vector<std::string> languages;
    std::string installHint;
};

// Decides whether a found server actually works. resolvedCommand is the
// path FindCommand() returned.
using ServerVerifier = std::function<bool(const KnownServer& server, const std::string& resolvedCommand)>;

inline constexpr std::chrono::milliseconds kVersionCheckTimeout{ 5000 };

const std::vector<KnownServer>& KnownServers();

// deno.json or deno.jsonc in root.
bool IsDenoProject(const std::filesystem::path& root);

// KnownServers(), with deno moved to the front in Deno projects.
std::vector<KnownServer> GetOrderedServers(const std::filesystem::path& root);

// PATH first, then <projectRoot>/node_modules/.bin.
std::optional<std::string> FindCommand(const std::string& command, const std::filesystem::path& projectRoot);

// Default verifier: runs the server's verification method.
bool VerifyServer(const KnownServer& server, const std::string& resolvedCommand);

// One config per language group; earlier servers in the ordered list win.
std::vector<ServerConfig> DiscoverLanguageServers(const std::filesystem::path& projectRoot);
std::vector<ServerConfig> DiscoverLanguageServers(const std::filesystem::path& projectRoot, const ServerVerifier& verify);

// extension may carry a leading '.'. nullptr when no server covers it.
const ServerConfig* GetServerForLanguage(const std::vector<ServerConfig>& servers, const std::string& extension);

// "tsx" -> "typescriptreact"; unknown extensions map to themselves.
std::string GetLanguageId(const std::string& extension);

// "<server>: <install hint>" for each uninstalled server covering one of extensions.
std::vector<std::string> GetMissingServerHints(const std::vector<std::string>& extensions,
    const std::filesystem::path& projectRoot);

std::optional<std::filesystem::path> FindLocalServer(const std::filesystem::path& projectRoot, const std::string& serverName);

std::vector<KnownServerStatus> GetKnownServersStatus(const std::filesystem::path& projectRoot);

} // namespace nanolsp
