// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_error.hpp
 * @brief Error type raised by the LSP client.
 *
 * LspError carries a kind so callers can tell a server-side failure
 * from a timeout or a dead process without parsing the message text.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace nanolsp {

enum class LspErrorKind {
    SpawnFailure,    // process could not be started
    NotRunning,      // request issued while the client is not Ready
    Timeout,         // no response within the request timeout
    ServerError,     // JSON-RPC error response
    Protocol,        // malformed result payload
    ClientShutdown,  // pending request dropped by stop()
    ProcessExit,     // server process went away
    InvalidState,    // lifecycle call in the wrong state
};

const char* ToString(LspErrorKind kind);

class LspError : public std::runtime_error {
public:
    LspError(LspErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    LspError(LspErrorKind kind, const std::string& message, int code)
        : std::runtime_error(message), kind_(kind), code_(code) {}

    LspErrorKind Kind() const { return kind_; }

    // JSON-RPC error code, set only for ServerError.
    std::optional<int> Code() const { return code_; }

private:
    LspErrorKind kind_;
    std::optional<int> code_;
};

} // namespace nanolsp
