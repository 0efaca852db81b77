// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nanolsp_main.cpp
 * @brief nanolsp command-line driver.
 *
 * Starts the language server configured for a file and prints its
 * diagnostics, completions or formatting edits. Entry point for the
 * nanolsp executable.
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nanolsp/lsp_client.hpp"
#include "nanolsp/lsp_log.hpp"
#include "nanolsp/lsp_server_catalog.hpp"
#include "nanolsp/lsp_server_config.hpp"
#include "nanolsp/lsp_utils.hpp"

using namespace nanolsp;

namespace {

void print_usage() {
    std::cerr << R"(
nanolsp - Language Server Protocol client v)" << kClientVersion << R"(

Usage: nanolsp <command> [options]

Commands:
  diagnostics <file>              Print diagnostics for a file
      --wait-ms <n>               How long to wait for pushed diagnostics [default: 3000]

  complete <file> <line> <char>   Print completions at a 0-based position

  format <file>                   Print formatting edits
      --tab-size <n>              Indentation width [default: 2]
      --use-tabs                  Indent with tabs instead of spaces

  servers                         List known language servers and their availability
  version                         Show version information
  help                            Show this help message

Common options:
  --config <file>                 Server list (agents.config.json); searched upward from
                                  the current directory when omitted, else auto-discovered
  --server <name>                 Use this server instead of matching by file extension
  --log-level <level>             debug|info|warn|error|off [default: warn, or $NANOLSP_LOG_LEVEL]

Examples:
  nanolsp diagnostics src/main.ts
  nanolsp complete src/main.ts 10 4
  nanolsp format main.go --tab-size 4 --use-tabs
)";
}

void print_version() {
    std::cout << "nanolsp version " << kClientVersion << "\n";
    std::cout << "Language Server Protocol client\n";
}

struct CliOptions {
    std::vector<std::string> positional;
    std::filesystem::path config_path;
    std::string server_name;
    int wait_ms = 3000;
    std::optional<int> tab_size;
    bool use_tabs = false;
};

bool parse_int(const std::string& text, int& out) {
    try {
        size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = value;
        return true;
    }
    catch (const std::exception&) {
        return false;
    }
}

bool parse_options(int argc, char* argv[], CliOptions& opts) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--server" && i + 1 < argc) {
            opts.server_name = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            SetLogLevel(ParseLogLevel(argv[++i], GetLogLevel()));
        } else if (arg == "--wait-ms" && i + 1 < argc) {
            if (!parse_int(argv[++i], opts.wait_ms) || opts.wait_ms < 0) {
                std::cerr << "Error: --wait-ms expects a non-negative number\n";
                return false;
            }
        } else if (arg == "--tab-size" && i + 1 < argc) {
            int value = 0;
            if (!parse_int(argv[++i], value) || value <= 0) {
                std::cerr << "Error: --tab-size expects a positive number\n";
                return false;
            }
            opts.tab_size = value;
        } else if (arg == "--use-tabs") {
            opts.use_tabs = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return true;
}

bool read_file(const std::filesystem::path& p, std::string& out) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) return false;
    out.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return true;
}

std::string language_id_for(const std::filesystem::path& file) {
    const std::string name = file.filename().string();
    if (GetLanguageId(name) == "docker-compose") return "docker-compose";

    std::string ext = file.extension().string();
    if (ext.empty()) {
        // Dockerfile, Makefile, ...
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return GetLanguageId(lower);
    }
    return GetLanguageId(ext);
}

// Picks the server for file from --config, agents.config.json, or discovery.
bool resolve_server(const CliOptions& opts, const std::filesystem::path& file, ServerConfig& out) {
    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);

    std::filesystem::path config_path = opts.config_path;
    if (config_path.empty()) {
        std::filesystem::path found;
        if (FindConfigFile(cwd, found)) config_path = found;
    }

    std::vector<ServerConfig> servers;
    if (!config_path.empty()) {
        std::string err;
        if (!LoadServerConfigs(config_path, servers, err)) {
            std::cerr << "Error: Failed to load config: " << err << "\n";
            return false;
        }
    }
    if (servers.empty()) {
        servers = DiscoverLanguageServers(cwd);
    }

    const ServerConfig* chosen = nullptr;
    if (!opts.server_name.empty()) {
        for (const auto& s : servers) {
            if (s.name == opts.server_name) { chosen = &s; break; }
        }
        if (chosen == nullptr) {
            std::cerr << "Error: No server named '" << opts.server_name << "'\n";
            return false;
        }
    } else {
        std::string ext = file.extension().string();
        if (ext.empty()) ext = language_id_for(file);
        chosen = GetServerForLanguage(servers, ext);
        if (chosen == nullptr) {
            std::cerr << "Error: No language server available for " << file.string() << "\n";
            for (const auto& hint : GetMissingServerHints({ ext }, cwd)) {
                std::cerr << "  " << hint << "\n";
            }
            return false;
        }
    }

    out = *chosen;
    if (!out.rootUri) out.rootUri = PathToUri(cwd);
    return true;
}

std::string format_range(const Range& r) {
    return std::to_string(r.start.line + 1) + ":" + std::to_string(r.start.character + 1) + "-"
        + std::to_string(r.end.line + 1) + ":" + std::to_string(r.end.character + 1);
}

// Loads the file, starts its server and opens the document.
struct Session {
    std::filesystem::path file;
    std::string uri;
    std::unique_ptr<LspClient> client;
};

bool open_session(const CliOptions& opts, const std::filesystem::path& file, Session& session) {
    std::string text;
    if (!read_file(file, text)) {
        std::cerr << "Error: Cannot open file: " << file.string() << "\n";
        return false;
    }

    ServerConfig config;
    if (!resolve_server(opts, file, config)) return false;

    session.file = file;
    session.uri = PathToUri(file);
    session.client = std::make_unique<LspClient>(config);
    session.client->Start();
    session.client->OpenDocument(session.uri, language_id_for(file), text);
    return true;
}

// ============== Diagnostics ==============
int cmd_diagnostics(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_options(argc, argv, opts)) return 1;
    if (opts.positional.size() != 1) {
        std::cerr << "Error: Missing file\n";
        std::cerr << "Usage: nanolsp diagnostics <file> [--wait-ms N]\n";
        return 1;
    }

    try {
        Session session;
        if (!open_session(opts, opts.positional[0], session)) return 1;
        LspClient& client = *session.client;

        std::vector<Diagnostic> diags;
        bool received = false;
        client.DiagnosticsEvent.On([&](const PublishDiagnosticsParams& p) {
            if (p.uri == session.uri) received = true;
        });

        if (client.GetCapabilities() && client.GetCapabilities()->diagnosticProvider) {
            diags = client.GetDiagnostics(session.uri);
        }
        if (diags.empty()) {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.wait_ms);
            while (!received && std::chrono::steady_clock::now() < deadline) {
                if (!client.Poll(std::chrono::milliseconds(50))) break;
            }
            diags = client.GetCachedDiagnostics(session.uri);
        }

        for (const auto& d : diags) {
            std::cout << session.file.string() << ":" << d.range.start.line + 1 << ":"
                      << d.range.start.character + 1 << ": "
                      << (d.severity ? ToString(*d.severity) : "error") << ": "
                      << d.message << "\n";
        }
        client.Stop();
        return 0;
    } catch (const LspError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Complete ==============
int cmd_complete(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_options(argc, argv, opts)) return 1;

    Position pos;
    if (opts.positional.size() != 3 || !parse_int(opts.positional[1], pos.line)
        || !parse_int(opts.positional[2], pos.character)) {
        std::cerr << "Error: Expected <file> <line> <character>\n";
        std::cerr << "Usage: nanolsp complete <file> <line> <character>\n";
        return 1;
    }

    try {
        Session session;
        if (!open_session(opts, opts.positional[0], session)) return 1;

        for (const auto& item : session.client->GetCompletions(session.uri, pos)) {
            std::cout << item.label;
            if (item.detail && !item.detail->empty()) std::cout << "\t" << *item.detail;
            std::cout << "\n";
        }
        session.client->Stop();
        return 0;
    } catch (const LspError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Format ==============
int cmd_format(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_options(argc, argv, opts)) return 1;
    if (opts.positional.size() != 1) {
        std::cerr << "Error: Missing file\n";
        std::cerr << "Usage: nanolsp format <file> [--tab-size N] [--use-tabs]\n";
        return 1;
    }

    FormattingOptionsPatch patch;
    patch.tabSize = opts.tab_size;
    if (opts.use_tabs) patch.insertSpaces = false;

    try {
        Session session;
        if (!open_session(opts, opts.positional[0], session)) return 1;

        for (const auto& edit : session.client->FormatDocument(session.uri, patch)) {
            std::cout << format_range(edit.range) << ": " << json(edit.newText).dump() << "\n";
        }
        session.client->Stop();
        return 0;
    } catch (const LspError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// ============== Servers ==============
int cmd_servers() {
    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);

    for (const auto& status : GetKnownServersStatus(cwd)) {
        std::string langs;
        for (const auto& l : status.languages) {
            if (!langs.empty()) langs += ",";
            langs += l;
        }
        std::cout << (status.available ? "[x] " : "[ ] ") << status.name << " (" << langs << ")";
        if (!status.available && !status.installHint.empty()) std::cout << "\n      " << status.installHint;
        std::cout << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (const char* level = std::getenv("NANOLSP_LOG_LEVEL")) {
        SetLogLevel(ParseLogLevel(level, LogLevel::Warn));
    }

    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    if (command == "diagnostics") {
        return cmd_diagnostics(argc - 2, argv + 2);
    } else if (command == "complete") {
        return cmd_complete(argc - 2, argv + 2);
    } else if (command == "format") {
        return cmd_format(argc - 2, argv + 2);
    } else if (command == "servers") {
        return cmd_servers();
    } else if (command == "version" || command == "-v" || command == "--version") {
        print_version();
        return 0;
    } else if (command == "help" || command == "-h" || command == "--help") {
        print_usage();
        return 0;
    } else {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        print_usage();
        return 1;
    }
}
