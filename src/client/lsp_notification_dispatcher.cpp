// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_notification_dispatcher.cpp
 * @brief Notification routing.
 */

#include "nanolsp/lsp_notification_dispatcher.hpp"
#include "nanolsp/lsp_log.hpp"

namespace nanolsp {

void NotificationDispatcher::Register(const std::string& method, Handler handler) {
    handlers_[method].push_back(std::move(handler));
}

void NotificationDispatcher::Unregister(const std::string& method) {
    handlers_.erase(method);
}

bool NotificationDispatcher::Dispatch(const Notification& notification) const {
    auto it = handlers_.find(notification.method);
    if (it == handlers_.end()) {
        LogDebug("dispatcher", "Unhandled notification: " + notification.method);
        return false;
    }

    // copy: a handler may re-register while we iterate
    const std::vector<Handler> handlers = it->second;
    for (const auto& h : handlers) {
        h(notification.params);
    }
    return true;
}

bool NotificationDispatcher::Handles(const std::string& method) const {
    return handlers_.find(method) != handlers_.end();
}

} // namespace nanolsp
