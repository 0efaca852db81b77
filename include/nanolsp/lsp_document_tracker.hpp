// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_document_tracker.hpp
 * @brief Open document uris and their version counters.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nanolsp {

class DocumentTracker {
public:
    // (Re)opens uri at version 1.
    int Open(const std::string& uri);

    // Bumps the version; a uri never opened starts at 1.
    int Update(const std::string& uri);

    // False when uri was not tracked.
    bool Close(const std::string& uri);

    std::optional<int> Version(const std::string& uri) const;
    bool IsOpen(const std::string& uri) const { return versions_.count(uri) != 0; }

    std::size_t Size() const { return versions_.size(); }
    std::vector<std::string> OpenUris() const;  // sorted
    void Clear() { versions_.clear(); }

private:
    std::unordered_map<std::string, int> versions_;  // uri -> version
};

} // namespace nanolsp
