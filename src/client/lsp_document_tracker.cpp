// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "nanolsp/lsp_document_tracker.hpp"

#include <algorithm>

namespace nanolsp {

int DocumentTracker::Open(const std::string& uri) {
    versions_[uri] = 1;
    return 1;
}

int DocumentTracker::Update(const std::string& uri) {
    auto it = versions_.find(uri);
    if (it == versions_.end()) {
        versions_[uri] = 1;
        return 1;
    }
    return ++it->second;
}

bool DocumentTracker::Close(const std::string& uri) {
    return versions_.erase(uri) != 0;
}

std::optional<int> DocumentTracker::Version(const std::string& uri) const {
    auto it = versions_.find(uri);
    if (it == versions_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> DocumentTracker::OpenUris() const {
    std::vector<std::string> uris;
    uris.reserve(versions_.size());
    for (const auto& [uri, version] : versions_) uris.push_back(uri);
    std::sort(uris.begin(), uris.end());
    return uris;
}

} // namespace nanolsp
