// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_notification_dispatcher.hpp
 * @brief Routes server notifications to handlers by method name.
 */

#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lsp_message.hpp"

namespace nanolsp {

class NotificationDispatcher {
public:
    using Handler = std::function<void(const json& params)>;

    // Several handlers per method are allowed; they run in registration order.
    void Register(const std::string& method, Handler handler);
    void Unregister(const std::string& method);

    // Returns false when no handler is registered (the notification is dropped).
    bool Dispatch(const Notification& notification) const;

    bool Handles(const std::string& method) const;

private:
    std::unordered_map<std::string, std::vector<Handler>> handlers_;
};

} // namespace nanolsp
