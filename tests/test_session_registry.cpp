//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_registry.cpp
// Purpose: Tests for SessionRegistry bookkeeping
//==========================================================================================================

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "lsp/SessionRegistry.h"
#include "support/LoopbackServer.h"

using namespace lsp;

namespace {
class SessionRegistryTest : public ::testing::Test {
protected:
    void TearDown() override {
        sessions.clear();
        // Drain teardown work queued by released sessions
        io.run();
    }

    std::shared_ptr<Session> makeSession(const std::string& id) {
        auto server = std::make_shared<lsp::testing::FakeLanguageServer>();
        SessionConfig config;
        config.sessionId = id;
        config.languageId = "typescript";
        auto session = std::make_shared<Session>(io, std::move(config), server->Attach(), nullptr);
        sessions.push_back(session);
        servers.push_back(server);
        return session;
    }

    boost::asio::io_context io;
    std::vector<std::shared_ptr<lsp::testing::FakeLanguageServer>> servers;
    std::vector<std::shared_ptr<Session>> sessions;
};
} // namespace

TEST_F(SessionRegistryTest, InsertFindRemove) {
    SessionRegistry registry;
    auto a = makeSession("lsp-a");
    EXPECT_TRUE(registry.Insert(a));
    EXPECT_EQ(registry.Find("lsp-a"), a);
    EXPECT_EQ(registry.Find("lsp-a")->LanguageId(), "typescript");
    EXPECT_EQ(registry.Find("lsp-a")->State(), SessionState::Starting);
    EXPECT_EQ(registry.Find("lsp-missing"), nullptr);
    EXPECT_EQ(registry.Remove("lsp-a"), a);
    EXPECT_EQ(registry.Remove("lsp-a"), nullptr);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(SessionRegistryTest, DuplicateIdIsRejected) {
    SessionRegistry registry;
    auto first = makeSession("lsp-dup");
    auto second = makeSession("lsp-dup");
    EXPECT_TRUE(registry.Insert(first));
    EXPECT_FALSE(registry.Insert(second));
    EXPECT_EQ(registry.Find("lsp-dup"), first);
    EXPECT_FALSE(registry.Insert(nullptr));
}

TEST_F(SessionRegistryTest, IdsAreSorted) {
    SessionRegistry registry;
    registry.Insert(makeSession("lsp-c"));
    registry.Insert(makeSession("lsp-a"));
    registry.Insert(makeSession("lsp-b"));
    EXPECT_EQ(registry.Ids(), (std::vector<std::string>{"lsp-a", "lsp-b", "lsp-c"}));
    EXPECT_EQ(registry.Snapshot().size(), 3u);
}
