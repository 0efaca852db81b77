// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_server_config.cpp
 * @brief Server configuration loader implementation.
 *
 * Parses agents.config.json and validates each lspServers entry.
 */

#include "nanolsp/lsp_server_config.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace nanolsp {

using json = nlohmann::json;

static bool ReadAllText(const std::filesystem::path& p, std::string& out, std::string& err) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) { err = "cannot open: " + p.string(); return false; }
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

static bool ReadStringArray(const json& j, const char* key, std::vector<std::string>& out, std::string& err) {
    out.clear();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_array()) { err = std::string("'") + key + "' must be an array of strings"; return false; }
    for (const auto& v : *it) {
        if (!v.is_string()) { err = std::string("'") + key + "' must be an array of strings"; return false; }
        out.push_back(v.get<std::string>());
    }
    return true;
}

bool ParseServerConfig(const json& j, ServerConfig& out, std::string& err) {
    if (!j.is_object()) { err = "server entry must be an object"; return false; }

    ServerConfig cfg;

    auto name = j.find("name");
    if (name == j.end() || !name->is_string() || name->get<std::string>().empty()) {
        err = "missing 'name'";
        return false;
    }
    cfg.name = name->get<std::string>();

    auto command = j.find("command");
    if (command == j.end() || !command->is_string() || command->get<std::string>().empty()) {
        err = "server '" + cfg.name + "': missing 'command'";
        return false;
    }
    cfg.command = command->get<std::string>();

    if (!ReadStringArray(j, "args", cfg.args, err)) { err = "server '" + cfg.name + "': " + err; return false; }

    auto languages = j.find("languages");
    if (languages == j.end()) {
        err = "server '" + cfg.name + "': missing 'languages'";
        return false;
    }
    if (!ReadStringArray(j, "languages", cfg.languages, err)) { err = "server '" + cfg.name + "': " + err; return false; }
    for (auto& lang : cfg.languages) {
        if (!lang.empty() && lang[0] == '.') lang.erase(0, 1);
    }

    auto env = j.find("env");
    if (env != j.end() && !env->is_null()) {
        if (!env->is_object()) { err = "server '" + cfg.name + "': 'env' must be an object"; return false; }
        for (auto it = env->begin(); it != env->end(); ++it) {
            if (!it.value().is_string()) {
                err = "server '" + cfg.name + "': env value for '" + it.key() + "' must be a string";
                return false;
            }
            cfg.env[it.key()] = it.value().get<std::string>();
        }
    }

    auto rootUri = j.find("rootUri");
    if (rootUri != j.end() && !rootUri->is_null()) {
        if (!rootUri->is_string()) { err = "server '" + cfg.name + "': 'rootUri' must be a string"; return false; }
        cfg.rootUri = rootUri->get<std::string>();
    }

    out = std::move(cfg);
    return true;
}

bool LoadServerConfigs(const std::filesystem::path& file, std::vector<ServerConfig>& out, std::string& err) {
    std::string text;
    if (!ReadAllText(file, text, err)) return false;

    json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        err = "invalid JSON: " + file.string();
        return false;
    }
    if (!root.is_object()) {
        err = "expected a JSON object: " + file.string();
        return false;
    }

    const json* list = nullptr;
    if (root.contains("lspServers")) {
        list = &root["lspServers"];
    }
    else if (root.contains("nanocoder") && root["nanocoder"].is_object() && root["nanocoder"].contains("lspServers")) {
        list = &root["nanocoder"]["lspServers"];
    }

    out.clear();
    if (list == nullptr || list->is_null()) return true;  // no servers configured
    if (!list->is_array()) {
        err = "'lspServers' must be an array";
        return false;
    }

    for (const auto& entry : *list) {
        ServerConfig cfg;
        if (!ParseServerConfig(entry, cfg, err)) return false;
        out.push_back(std::move(cfg));
    }
    return true;
}

bool FindConfigFile(const std::filesystem::path& startDir, std::filesystem::path& outFile) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::absolute(startDir, ec);
    if (ec) return false;

    while (true) {
        const std::filesystem::path candidate = dir / kConfigFileName;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            outFile = candidate;
            return true;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    return false;
}

} // namespace nanolsp
