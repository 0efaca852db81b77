// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_server_config.hpp
 * @brief Language server launch configuration and its loader.
 *
 * Server lists are read from agents.config.json, either as a top-level
 * "lspServers" array or nested under "nanocoder".
 */

#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nanolsp {

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // merged over the parent environment
    std::vector<std::string> languages;      // file extensions, without the dot
    std::optional<std::string> rootUri;
};

inline constexpr const char* kConfigFileName = "agents.config.json";

bool ParseServerConfig(const nlohmann::json& j, ServerConfig& out, std::string& err);
bool LoadServerConfigs(const std::filesystem::path& file, std::vector<ServerConfig>& out, std::string& err);

// Walks from startDir up to the filesystem root looking for kConfigFileName.
bool FindConfigFile(const std::filesystem::path& startDir, std::filesystem::path& outFile);

} // namespace nanolsp
