// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_request_correlator.hpp
 * @brief Request id allocation and response matching.
 *
 * Ids start at 1 and are never reused. Each pending entry is settled
 * exactly once: by a matching response, by its deadline passing, or by
 * RejectAll(). Callbacks run after the entry has been removed, so they
 * may issue new requests.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "lsp_error.hpp"
#include "lsp_message.hpp"
#include "lsp_transport.hpp"

namespace nanolsp {

class RequestCorrelator {
public:
    using ResolveFn = std::function<void(const json& result)>;
    using RejectFn = std::function<void(const LspError& error)>;
    using TimePoint = Clock::TimePoint;

    static constexpr std::chrono::milliseconds kDefaultTimeout{ 30000 };

    explicit RequestCorrelator(std::chrono::milliseconds timeout = kDefaultTimeout)
        : timeout_(timeout) {}

    // Allocates the next id, records the entry with deadline now + timeout
    // and returns the request to put on the wire.
    Request Register(const std::string& method, json params,
        ResolveFn resolve, RejectFn reject, TimePoint now);

    // Settles the entry matching response.id. False when none matches
    // (unknown id, or the request already timed out).
    bool Complete(const Response& response);

    // Rejects every entry whose deadline is <= now. Returns how many.
    std::size_t ExpireDue(TimePoint now);

    // Rejects one entry (e.g. its frame could not be written).
    bool Reject(long long id, const LspError& error);

    // Rejects every pending entry with error. Returns how many.
    std::size_t RejectAll(const LspError& error);

    std::optional<TimePoint> NextDeadline() const;

    bool IsPending(long long id) const { return pending_.count(id) != 0; }
    std::size_t PendingCount() const { return pending_.size(); }

    // 0 before the first Register().
    long long LastIssuedId() const { return next_id_ - 1; }

    std::chrono::milliseconds Timeout() const { return timeout_; }

private:
    struct PendingRequestEntry {
        long long id = 0;
        std::string method;
        ResolveFn resolve;
        RejectFn reject;
        TimePoint deadline;
    };

    std::chrono::milliseconds timeout_;
    long long next_id_ = 1;
    std::map<long long, PendingRequestEntry> pending_;
};

} // namespace nanolsp
