// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_utils.hpp
 * @brief LSP utility functions.
 *
 * URI encoding/decoding, path conversion and executable lookup used
 * when launching servers and addressing documents.
 */

#pragma once
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <unistd.h>

namespace nanolsp {

    inline int hexval(char c) {
        if ('0' <= c && c <= '9') return c - '0';
        if ('a' <= c && c <= 'f') return 10 + (c - 'a');
        if ('A' <= c && c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    inline std::string uri_decode(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size()) {
                int a = hexval(s[i + 1]);
                int b = hexval(s[i + 2]);
                if (a >= 0 && b >= 0) {
                    out.push_back(static_cast<char>((a << 4) | b));
                    i += 2;
                    continue;
                }
            }
            out.push_back(s[i]);
        }
        return out;
    }

    // Percent-encodes everything outside RFC 3986 unreserved chars and '/'.
    inline std::string uri_encode_path(std::string_view s) {
        static const char* kHex = "0123456789ABCDEF";
        std::string out;
        out.reserve(s.size());
        for (unsigned char c : s) {
            const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
            if (unreserved) {
                out.push_back(static_cast<char>(c));
            }
            else {
                out.push_back('%');
                out.push_back(kHex[c >> 4]);
                out.push_back(kHex[c & 0x0F]);
            }
        }
        return out;
    }

    // file:///home/u/a.ts -> /home/u/a.ts
    // Anything that is not a file URI is returned as a plain path.
    inline std::filesystem::path UriToPath(const std::string& uri) {
        const std::string prefix = "file://";
        if (uri.rfind(prefix, 0) != 0) {
            return std::filesystem::path(uri);
        }

        std::string rest = uri.substr(prefix.size());
        // file://localhost/x -> /x
        if (rest.rfind("localhost/", 0) == 0) rest.erase(0, std::string("localhost").size());
        return std::filesystem::path(uri_decode(rest));
    }

    inline std::string PathToUri(const std::filesystem::path& p) {
        std::error_code ec;
        std::filesystem::path abs = p.is_absolute() ? p : std::filesystem::absolute(p, ec);
        if (ec) abs = p;
        return std::string("file://") + uri_encode_path(abs.lexically_normal().generic_string());
    }

    // "file:///a/b.tsx" -> "tsx"; empty when there is no extension.
    inline std::string ExtensionOf(const std::string& uriOrPath) {
        std::string ext = UriToPath(uriOrPath).extension().string();
        if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
        return ext;
    }

    // Resolves a command the way execvp would. Commands containing '/'
    // are checked as given; others are searched on PATH.
    inline std::optional<std::filesystem::path> FindExecutable(const std::string& command) {
        if (command.empty()) return std::nullopt;

        auto isExecutable = [](const std::filesystem::path& candidate) {
            std::error_code ec;
            return std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
        };

        if (command.find('/') != std::string::npos) {
            std::filesystem::path p(command);
            if (isExecutable(p)) return p;
            return std::nullopt;
        }

        const char* pathEnv = std::getenv("PATH");
        std::string_view path = (pathEnv != nullptr && *pathEnv != '\0') ? pathEnv : "/usr/local/bin:/usr/bin:/bin";

        size_t pos = 0;
        while (pos <= path.size()) {
            size_t sep = path.find(':', pos);
            if (sep == std::string_view::npos) sep = path.size();
            std::string_view dir = path.substr(pos, sep - pos);
            pos = sep + 1;

            std::filesystem::path candidate = dir.empty() ? std::filesystem::path(".") : std::filesystem::path(std::string(dir));
            candidate /= command;
            if (isExecutable(candidate)) return candidate;
        }
        return std::nullopt;
    }

} // namespace nanolsp
