// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_signal.hpp
 * @brief Typed observer list with on/once/off subscriptions.
 *
 * Handlers run synchronously in registration order. A handler may
 * subscribe or unsubscribe while an emission is in progress: removals
 * take effect immediately, additions start with the next Emit().
 */

#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace nanolsp {

using SubscriptionId = std::uint64_t;

template <typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    SubscriptionId On(Handler handler) { return Add(std::move(handler), false); }

    // Auto-unsubscribes before the first invocation.
    SubscriptionId Once(Handler handler) { return Add(std::move(handler), true); }

    bool Off(SubscriptionId id) {
        auto it = FindSlot(id);
        if (it == slots_.end()) return false;
        slots_.erase(it);
        return true;
    }

    void Emit(Args... args) {
        std::vector<SubscriptionId> snapshot;
        snapshot.reserve(slots_.size());
        for (const auto& s : slots_) snapshot.push_back(s.id);

        for (SubscriptionId id : snapshot) {
            auto it = FindSlot(id);
            if (it == slots_.end()) continue;  // removed by an earlier handler

            Handler handler = it->handler;
            if (it->once) slots_.erase(it);
            handler(args...);
        }
    }

    std::size_t HandlerCount() const { return slots_.size(); }
    void Clear() { slots_.clear(); }

private:
    struct Slot {
        SubscriptionId id;
        Handler handler;
        bool once;
    };

    std::vector<Slot> slots_;
    SubscriptionId next_id_ = 1;

    SubscriptionId Add(Handler handler, bool once) {
        const SubscriptionId id = next_id_++;
        slots_.push_back(Slot{ id, std::move(handler), once });
        return id;
    }

    typename std::vector<Slot>::iterator FindSlot(SubscriptionId id) {
        return std::find_if(slots_.begin(), slots_.end(), [id](const Slot& s) { return s.id == id; });
    }
};

} // namespace nanolsp
