// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_frame_codec.hpp
 * @brief Content-Length framing for JSON-RPC over a byte stream.
 *
 * Encode() produces one complete frame. Feed() accepts arbitrary chunks
 * of the incoming stream (split or batched) and returns every message
 * completed by that chunk. Malformed frames are skipped, never fatal.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lsp_message.hpp"

namespace nanolsp {

class FrameCodec {
public:
    // Upper bound on a declared body size. Larger headers are treated as invalid.
    static constexpr std::size_t kMaxContentLength = 256u * 1024u * 1024u;

    static std::string Encode(const json& body);
    static std::string Encode(const Message& message);

    std::vector<Message> Feed(std::string_view bytes);

    // Bytes held back waiting for the rest of a frame.
    std::size_t BufferedSize() const { return buffer_.size(); }
    void Reset() { buffer_.clear(); }

    // Parses the Content-Length value out of a header block (without the
    // terminating blank line). Header names are case-insensitive; other
    // header lines are ignored.
    static std::optional<std::size_t> ParseContentLength(std::string_view headers);

private:
    std::string buffer_;  // IncomingBuffer
};

} // namespace nanolsp
