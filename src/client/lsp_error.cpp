// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "nanolsp/lsp_error.hpp"

namespace nanolsp {

const char* ToString(LspErrorKind kind) {
    switch (kind) {
    case LspErrorKind::SpawnFailure:   return "SpawnFailure";
    case LspErrorKind::NotRunning:     return "NotRunning";
    case LspErrorKind::Timeout:        return "Timeout";
    case LspErrorKind::ServerError:    return "ServerError";
    case LspErrorKind::Protocol:       return "Protocol";
    case LspErrorKind::ClientShutdown: return "ClientShutdown";
    case LspErrorKind::ProcessExit:    return "ProcessExit";
    case LspErrorKind::InvalidState:   return "InvalidState";
    }
    return "Unknown";
}

} // namespace nanolsp
