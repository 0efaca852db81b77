// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lsp_message.cpp
 * @brief JSON-RPC message classification and serialization.
 */

#include "nanolsp/lsp_message.hpp"

namespace nanolsp {

bool operator==(const ResponseError& a, const ResponseError& b) {
    return a.code == b.code && a.message == b.message && a.data == b.data;
}

bool operator==(const Request& a, const Request& b) {
    return a.id == b.id && a.method == b.method && a.params == b.params;
}

bool operator==(const Response& a, const Response& b) {
    return a.id == b.id && a.result == b.result && a.error == b.error;
}

bool operator==(const Notification& a, const Notification& b) {
    return a.method == b.method && a.params == b.params;
}

json ToJson(const Request& req) {
    json j;
    j["jsonrpc"] = "2.0";
    j["id"] = req.id;
    j["method"] = req.method;
    if (!req.params.is_null()) j["params"] = req.params;
    return j;
}

json ToJson(const Response& resp) {
    json j;
    j["jsonrpc"] = "2.0";
    j["id"] = resp.id;
    if (resp.error) {
        json err = { {"code", resp.error->code}, {"message", resp.error->message} };
        if (!resp.error->data.is_null()) err["data"] = resp.error->data;
        j["error"] = std::move(err);
    }
    else {
        j["result"] = resp.result;
    }
    return j;
}

json ToJson(const Notification& note) {
    json j;
    j["jsonrpc"] = "2.0";
    j["method"] = note.method;
    if (!note.params.is_null()) j["params"] = note.params;
    return j;
}

json ToJson(const Message& msg) {
    return std::visit([](const auto& m) { return ToJson(m); }, msg);
}

std::optional<Message> MessageFromJson(const json& body) {
    if (!body.is_object()) return std::nullopt;

    const auto idIt = body.find("id");
    const bool hasId = idIt != body.end() && !idIt->is_null();
    const auto methodIt = body.find("method");

    if (methodIt != body.end()) {
        if (!methodIt->is_string()) return std::nullopt;
        json params = body.value("params", json());
        if (hasId) {
            return Message{ Request{ *idIt, methodIt->get<std::string>(), std::move(params) } };
        }
        return Message{ Notification{ methodIt->get<std::string>(), std::move(params) } };
    }

    if (idIt == body.end()) return std::nullopt;

    Response resp;
    resp.id = *idIt;
    const auto errIt = body.find("error");
    if (errIt != body.end() && errIt->is_object()) {
        ResponseError err;
        const auto codeIt = errIt->find("code");
        if (codeIt != errIt->end() && codeIt->is_number_integer()) err.code = codeIt->get<int>();
        const auto msgIt = errIt->find("message");
        if (msgIt != errIt->end() && msgIt->is_string()) err.message = msgIt->get<std::string>();
        err.data = errIt->value("data", json());
        resp.error = std::move(err);
    }
    else if (errIt != body.end() && !errIt->is_null()) {
        // not a JSON-RPC error object, but still a failure
        ResponseError err;
        err.code = error_codes::kInternalError;
        err.message = errIt->is_string() ? errIt->get<std::string>() : errIt->dump();
        err.data = *errIt;
        resp.error = std::move(err);
    }
    else {
        resp.result = body.value("result", json());
    }
    return Message{ std::move(resp) };
}

Response MakeResponse(const json& id, const json& result) {
    Response resp;
    resp.id = id;
    resp.result = result;
    return resp;
}

Response MakeErrorResponse(const json& id, int code, const std::string& message) {
    Response resp;
    resp.id = id;
    resp.error = ResponseError{ code, message, json() };
    return resp;
}

std::optional<long long> IntegerId(const json& id) {
    if (id.is_number_integer()) return id.get<long long>();
    return std::nullopt;
}

} // namespace nanolsp
