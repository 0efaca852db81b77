// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "nanolsp/lsp_capability_store.hpp"
#include "nanolsp/lsp_log.hpp"

namespace nanolsp {

const char* ToString(Capability capability) {
    switch (capability) {
    case Capability::Completion:         return "completionProvider";
    case Capability::CodeAction:         return "codeActionProvider";
    case Capability::DocumentFormatting: return "documentFormattingProvider";
    case Capability::Diagnostic:         return "diagnosticProvider";
    }
    return "unknown";
}

bool CapabilityStore::Set(ServerCapabilities capabilities) {
    if (capabilities_) {
        LogWarn("capabilities", "Server capabilities already set; ignoring");
        return false;
    }
    capabilities_ = std::move(capabilities);
    return true;
}

bool CapabilityStore::Supports(Capability capability) const {
    if (!capabilities_) return false;
    const ServerCapabilities& c = *capabilities_;

    switch (capability) {
    case Capability::Completion:         return c.completionProvider;
    case Capability::CodeAction:         return c.codeActionProvider;
    case Capability::DocumentFormatting: return c.documentFormattingProvider;
    case Capability::Diagnostic:         return c.diagnosticProvider;
    }
    return false;
}

} // namespace nanolsp
