// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "nanolsp/lsp_request_correlator.hpp"

using namespace nanolsp;
using namespace std::chrono_literals;

namespace {

struct Recorder {
    std::vector<json> results;
    std::vector<LspError> errors;

    RequestCorrelator::ResolveFn Resolve() {
        return [this](const json& r) { results.push_back(r); };
    }
    RequestCorrelator::RejectFn Reject() {
        return [this](const LspError& e) { errors.push_back(e); };
    }
};

const Clock::TimePoint kT0{};

} // namespace

TEST(RequestCorrelatorTests, IdsStartAtOneAndIncrement) {
    RequestCorrelator correlator;
    Recorder rec;

    EXPECT_EQ(correlator.LastIssuedId(), 0);
    for (int expected = 1; expected <= 5; ++expected) {
        const Request req = correlator.Register("m", nullptr, rec.Resolve(), rec.Reject(), kT0);
        EXPECT_EQ(req.id, json(expected));
        EXPECT_EQ(req.method, "m");
    }
    EXPECT_EQ(correlator.PendingCount(), 5u);
    EXPECT_EQ(correlator.LastIssuedId(), 5);
}

TEST(RequestCorrelatorTests, ResultResolvesAndRemovesEntry) {
    RequestCorrelator correlator;
    Recorder rec;
    correlator.Register("textDocument/completion", json::object(), rec.Resolve(), rec.Reject(), kT0);

    EXPECT_TRUE(correlator.Complete(MakeResponse(json(1), json::array({ 1 }))));
    ASSERT_EQ(rec.results.size(), 1u);
    EXPECT_EQ(rec.results[0], json::array({ 1 }));
    EXPECT_TRUE(rec.errors.empty());
    EXPECT_FALSE(correlator.IsPending(1));

    // a second response for the same id is ignored
    EXPECT_FALSE(correlator.Complete(MakeResponse(json(1), json::array())));
    EXPECT_EQ(rec.results.size(), 1u);
}

TEST(RequestCorrelatorTests, ErrorResponseRejectsWithServerMessage) {
    RequestCorrelator correlator;
    Recorder rec;
    correlator.Register("textDocument/formatting", nullptr, rec.Resolve(), rec.Reject(), kT0);

    EXPECT_TRUE(correlator.Complete(MakeErrorResponse(json(1), -32603, "formatter crashed")));
    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].Kind(), LspErrorKind::ServerError);
    EXPECT_STREQ(rec.errors[0].what(), "formatter crashed");
    EXPECT_EQ(rec.errors[0].Code(), std::optional<int>(-32603));
}

TEST(RequestCorrelatorTests, OutOfOrderResponsesMatchById) {
    RequestCorrelator correlator;
    std::vector<std::string> order;
    auto resolveAs = [&order](std::string name) {
        return [&order, name](const json&) { order.push_back(name); };
    };
    auto ignore = [](const LspError&) {};

    correlator.Register("a", nullptr, resolveAs("a"), ignore, kT0);
    correlator.Register("b", nullptr, resolveAs("b"), ignore, kT0);
    correlator.Register("c", nullptr, resolveAs("c"), ignore, kT0);

    correlator.Complete(MakeResponse(json(3), nullptr));
    correlator.Complete(MakeResponse(json(1), nullptr));
    correlator.Complete(MakeResponse(json(2), nullptr));
    EXPECT_EQ(order, (std::vector<std::string>{ "c", "a", "b" }));
}

TEST(RequestCorrelatorTests, TimeoutRejectsWithMethodAndIgnoresLateResponse) {
    RequestCorrelator correlator(30000ms);
    Recorder rec;
    correlator.Register("textDocument/completion", nullptr, rec.Resolve(), rec.Reject(), kT0);

    EXPECT_EQ(correlator.ExpireDue(kT0 + 29999ms), 0u);
    EXPECT_TRUE(rec.errors.empty());

    EXPECT_EQ(correlator.ExpireDue(kT0 + 30000ms), 1u);
    ASSERT_EQ(rec.errors.size(), 1u);
    EXPECT_EQ(rec.errors[0].Kind(), LspErrorKind::Timeout);
    EXPECT_STREQ(rec.errors[0].what(), "LSP request timeout: textDocument/completion");

    EXPECT_FALSE(correlator.Complete(MakeResponse(json(1), json::array())));
    EXPECT_TRUE(rec.results.empty());
    EXPECT_EQ(rec.errors.size(), 1u);
}

TEST(RequestCorrelatorTests, TimeoutOnlyAffectsExpiredEntries) {
    RequestCorrelator correlator(1000ms);
    Recorder rec;
    correlator.Register("early", nullptr, rec.Resolve(), rec.Reject(), kT0);
    correlator.Register("late", nullptr, rec.Resolve(), rec.Reject(), kT0 + 500ms);

    ASSERT_TRUE(correlator.NextDeadline().has_value());
    EXPECT_EQ(*correlator.NextDeadline(), kT0 + 1000ms);

    EXPECT_EQ(correlator.ExpireDue(kT0 + 1200ms), 1u);
    EXPECT_FALSE(correlator.IsPending(1));
    EXPECT_TRUE(correlator.IsPending(2));
    EXPECT_EQ(*correlator.NextDeadline(), kT0 + 1500ms);
}

TEST(RequestCorrelatorTests, RejectAllSettlesEveryEntryOnce) {
    RequestCorrelator correlator;
    Recorder rec;
    correlator.Register("a", nullptr, rec.Resolve(), rec.Reject(), kT0);
    correlator.Register("b", nullptr, rec.Resolve(), rec.Reject(), kT0);

    EXPECT_EQ(correlator.RejectAll(LspError(LspErrorKind::ClientShutdown, "LSP client stopped")), 2u);
    EXPECT_EQ(rec.errors.size(), 2u);
    EXPECT_EQ(correlator.PendingCount(), 0u);
    EXPECT_FALSE(correlator.NextDeadline().has_value());

    EXPECT_EQ(correlator.RejectAll(LspError(LspErrorKind::ClientShutdown, "again")), 0u);
    EXPECT_EQ(correlator.ExpireDue(kT0 + 1h), 0u);
    EXPECT_EQ(rec.errors.size(), 2u);

    // ids keep counting after a flush
    const Request next = correlator.Register("c", nullptr, rec.Resolve(), rec.Reject(), kT0);
    EXPECT_EQ(next.id, json(3));
}

TEST(RequestCorrelatorTests, CallbackMayRegisterFollowUp) {
    RequestCorrelator correlator;
    Recorder rec;
    correlator.Register("first", nullptr,
        [&](const json&) { correlator.Register("second", nullptr, rec.Resolve(), rec.Reject(), kT0); },
        rec.Reject(), kT0);

    EXPECT_TRUE(correlator.Complete(MakeResponse(json(1), nullptr)));
    EXPECT_TRUE(correlator.IsPending(2));
}

TEST(RequestCorrelatorTests, NonIntegerIdDoesNotMatch) {
    RequestCorrelator correlator;
    Recorder rec;
    correlator.Register("a", nullptr, rec.Resolve(), rec.Reject(), kT0);

    EXPECT_FALSE(correlator.Complete(MakeResponse(json("1"), nullptr)));
    EXPECT_TRUE(correlator.IsPending(1));
}

TEST(RequestCorrelatorTests, RejectSingleEntry) {
    RequestCorrelator correlator;
    Recorder rec;
    correlator.Register("a", nullptr, rec.Resolve(), rec.Reject(), kT0);
    correlator.Register("b", nullptr, rec.Resolve(), rec.Reject(), kT0);

    EXPECT_TRUE(correlator.Reject(1, LspError(LspErrorKind::NotRunning, "LSP process not running")));
    EXPECT_FALSE(correlator.Reject(1, LspError(LspErrorKind::NotRunning, "again")));
    EXPECT_EQ(rec.errors.size(), 1u);
    EXPECT_TRUE(correlator.IsPending(2));
}
