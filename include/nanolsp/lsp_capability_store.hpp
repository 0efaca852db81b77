// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_capability_store.hpp
 * @brief Server capabilities captured from the initialize handshake.
 */

#pragma once
#include <optional>

#include "lsp_protocol.hpp"

namespace nanolsp {

enum class Capability {
    Completion,
    CodeAction,
    DocumentFormatting,
    Diagnostic,
};

const char* ToString(Capability capability);

class CapabilityStore {
public:
    // First call wins; later calls are ignored and return false until Clear().
    bool Set(ServerCapabilities capabilities);
    void Clear() { capabilities_.reset(); }

    bool IsSet() const { return capabilities_.has_value(); }
    const std::optional<ServerCapabilities>& Get() const { return capabilities_; }

    // False when nothing has been set.
    bool Supports(Capability capability) const;

private:
    std::optional<ServerCapabilities> capabilities_;
};

} // namespace nanolsp
