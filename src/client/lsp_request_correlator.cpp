// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_request_correlator.cpp
 * @brief Pending request bookkeeping.
 */

#include "nanolsp/lsp_request_correlator.hpp"
#include "nanolsp/lsp_log.hpp"

#include <vector>

namespace nanolsp {

Request RequestCorrelator::Register(const std::string& method, json params,
    ResolveFn resolve, RejectFn reject, TimePoint now) {
    const long long id = next_id_++;

    PendingRequestEntry entry;
    entry.id = id;
    entry.method = method;
    entry.resolve = std::move(resolve);
    entry.reject = std::move(reject);
    entry.deadline = now + timeout_;
    pending_.emplace(id, std::move(entry));

    return Request{ json(id), method, std::move(params) };
}

bool RequestCorrelator::Complete(const Response& response) {
    const auto id = IntegerId(response.id);
    if (!id) {
        LogDebug("correlator", "Response with non-integer id: " + response.id.dump());
        return false;
    }

    auto it = pending_.find(*id);
    if (it == pending_.end()) {
        LogDebug("correlator", "No pending request for response id " + std::to_string(*id));
        return false;
    }

    PendingRequestEntry entry = std::move(it->second);
    pending_.erase(it);

    if (response.error) {
        entry.reject(LspError(LspErrorKind::ServerError, response.error->message, response.error->code));
    }
    else {
        entry.resolve(response.result);
    }
    return true;
}

std::size_t RequestCorrelator::ExpireDue(TimePoint now) {
    std::vector<PendingRequestEntry> expired;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.deadline <= now) {
            expired.push_back(std::move(it->second));
            it = pending_.erase(it);
        }
        else {
            ++it;
        }
    }

    for (auto& entry : expired) {
        LogDebug("correlator", "Request " + std::to_string(entry.id) + " timed out: " + entry.method);
        entry.reject(LspError(LspErrorKind::Timeout, "LSP request timeout: " + entry.method));
    }
    return expired.size();
}

bool RequestCorrelator::Reject(long long id, const LspError& error) {
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;

    PendingRequestEntry entry = std::move(it->second);
    pending_.erase(it);
    entry.reject(error);
    return true;
}

std::size_t RequestCorrelator::RejectAll(const LspError& error) {
    std::map<long long, PendingRequestEntry> drained;
    drained.swap(pending_);

    for (auto& [id, entry] : drained) {
        entry.reject(error);
    }
    return drained.size();
}

std::optional<RequestCorrelator::TimePoint> RequestCorrelator::NextDeadline() const {
    std::optional<TimePoint> next;
    for (const auto& [id, entry] : pending_) {
        if (!next || entry.deadline < *next) next = entry.deadline;
    }
    return next;
}

} // namespace nanolsp
