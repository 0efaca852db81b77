// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_frame_codec.cpp
 * @brief Frame encoder and incremental decoder.
 */

#include "nanolsp/lsp_frame_codec.hpp"
#include "nanolsp/lsp_log.hpp"

#include <cctype>
#include <sstream>

namespace nanolsp {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::string_view kModule = "frame-codec";
constexpr std::string_view kContentLength = "Content-Length";

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// RFC 7230 tchar
bool IsTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    return std::string_view("!#$%&'*+-.^_`|~").find(c) != std::string_view::npos;
}

std::string_view Trim(std::string_view s) {
    std::size_t b = 0;
    while (b < s.size() && (s[b] == ' ' || s[b] == '\t')) ++b;
    std::size_t e = s.size();
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
    return s.substr(b, e - b);
}

std::string Preview(std::string_view body) {
    constexpr std::size_t kMax = 100;
    if (body.size() <= kMax) return std::string(body);
    return std::string(body.substr(0, kMax)) + "...";
}

} // anonymous namespace

std::string FrameCodec::Encode(const json& body) {
    const std::string content = body.dump(-1, ' ', false, json::error_handler_t::replace);
    std::ostringstream oss;
    oss << "Content-Length: " << content.size() << "\r\n\r\n" << content;
    return oss.str();
}

std::string FrameCodec::Encode(const Message& message) {
    return Encode(ToJson(message));
}

std::optional<std::size_t> FrameCodec::ParseContentLength(std::string_view headers) {
    std::size_t pos = 0;
    bool firstLine = true;
    while (pos <= headers.size()) {
        std::size_t eol = headers.find("\r\n", pos);
        if (eol == std::string_view::npos) eol = headers.size();
        const std::string_view line = headers.substr(pos, eol - pos);
        pos = eol + 2;

        const bool leading = firstLine;
        firstLine = false;

        std::string_view key;
        std::string_view value;
        if (leading) {
            // Bytes left over from a skipped frame may precede the first
            // header name, as long as they cannot be part of it.
            const std::size_t colon = line.find_last_of(':');
            if (colon == std::string_view::npos) continue;
            key = Trim(line.substr(0, colon));
            if (key.size() < kContentLength.size()) continue;
            const std::size_t start = key.size() - kContentLength.size();
            if (!EqualsIgnoreCase(key.substr(start), kContentLength)) continue;
            if (start > 0 && IsTokenChar(key[start - 1])) continue;
            value = Trim(line.substr(colon + 1));
        }
        else {
            const std::size_t colon = line.find(':');
            if (colon == std::string_view::npos) continue;
            key = Trim(line.substr(0, colon));
            if (!EqualsIgnoreCase(key, kContentLength)) continue;
            value = Trim(line.substr(colon + 1));
        }

        // first Content-Length wins
        if (value.empty()) return std::nullopt;

        std::size_t n = 0;
        for (char c : value) {
            if (c < '0' || c > '9') return std::nullopt;
            n = n * 10 + static_cast<std::size_t>(c - '0');
            if (n > kMaxContentLength) return std::nullopt;
        }
        return n;
    }
    return std::nullopt;
}

std::vector<Message> FrameCodec::Feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());

    std::vector<Message> out;
    std::size_t offset = 0;

    while (true) {
        const std::size_t headerEnd = buffer_.find(kHeaderTerminator, offset);
        if (headerEnd == std::string::npos) break;

        const std::string_view headers(buffer_.data() + offset, headerEnd - offset);
        const std::size_t bodyStart = headerEnd + kHeaderTerminator.size();

        const auto contentLength = ParseContentLength(headers);
        if (!contentLength) {
            // skip the header block and resync on the next one
            LogDebug(kModule, "Invalid frame header, skipping: " + Preview(headers));
            offset = bodyStart;
            continue;
        }

        if (buffer_.size() - bodyStart < *contentLength) break;

        const std::string_view body(buffer_.data() + bodyStart, *contentLength);
        offset = bodyStart + *contentLength;

        json parsed = json::parse(body.begin(), body.end(), nullptr, false);
        if (parsed.is_discarded()) {
            LogDebug(kModule, "Malformed JSON-RPC message: " + Preview(body));
            continue;
        }

        auto message = MessageFromJson(parsed);
        if (!message) {
            LogDebug(kModule, "Not a JSON-RPC message: " + Preview(body));
            continue;
        }
        out.push_back(std::move(*message));
    }

    buffer_.erase(0, offset);
    return out;
}

} // namespace nanolsp
