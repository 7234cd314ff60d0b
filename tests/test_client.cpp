//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: Client tests: launch resolution, status events, session registry and feature result shaping
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "lsp/Client.h"
#include "lsp/errors/Errors.h"
#include "support/LoopbackServer.h"

using namespace lsp;
using namespace std::chrono_literals;
using lsp::testing::FakeLanguageServer;
using lsp::testing::LoopbackLauncher;

namespace {

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver = std::make_shared<StaticLaunchResolver>();
        resolver->Register("typescript", LaunchSpec{"fake-ts-server", {"--stdio"}, true});
        launcher = std::make_shared<LoopbackLauncher>([this]() {
            auto server = std::make_shared<FakeLanguageServer>();
            server->SetCapabilities(ParseJSON(R"({"textDocumentSync":1,"hoverProvider":true})"));
            if (configureServer) {
                configureServer(*server);
            }
            return server;
        });
        sink = std::make_shared<CallbackEventSink>([this](const std::string& topic, const JSONValue& payload) {
            {
                std::lock_guard<std::mutex> lk(mutex);
                events.emplace_back(topic, payload);
            }
            cv.notify_all();
        });
        EngineOptions options;
        options.workerThreads = 2;
        client = std::make_unique<Client>(options, resolver, sink, launcher);
    }

    void TearDown() override {
        client.reset();
    }

    std::string startTypescript() {
        StartSessionRequest request;
        request.language = "typescript";
        request.rootUri = "file:///work/app";
        return client->StartSession(request).get().sessionId;
    }

    // Status strings in emission order
    std::vector<std::string> statuses() {
        std::lock_guard<std::mutex> lk(mutex);
        std::vector<std::string> out;
        for (const auto& [topic, payload] : events) {
            if (topic == Topics::ServerStatus) {
                out.push_back(GetStringMember(payload, "status").value_or(""));
            }
        }
        return out;
    }

    std::optional<JSONValue> waitForStatus(const std::string& status, std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lk(mutex);
        std::optional<JSONValue> found;
        cv.wait_for(lk, timeout, [&]() {
            for (const auto& [topic, payload] : events) {
                if (topic == Topics::ServerStatus && GetStringMember(payload, "status") == status) {
                    found = payload;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    std::optional<JSONValue> waitForDiagnostics(std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lk(mutex);
        std::optional<JSONValue> found;
        cv.wait_for(lk, timeout, [&]() {
            for (const auto& [topic, payload] : events) {
                if (topic == Topics::Diagnostics) {
                    found = payload;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    template <typename Fn>
    static errors::ErrorCategory categoryOf(Fn&& fn) {
        try {
            fn();
        } catch (const errors::LspException& e) {
            return e.category();
        }
        ADD_FAILURE() << "expected LspException";
        return errors::ErrorCategory::Transport;
    }

    std::shared_ptr<StaticLaunchResolver> resolver;
    std::shared_ptr<LoopbackLauncher> launcher;
    std::function<void(FakeLanguageServer&)> configureServer;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<std::string, JSONValue>> events;
    std::shared_ptr<IEventSink> sink;
    std::unique_ptr<Client> client;
};

} // namespace

TEST_F(ClientTest, StartSessionReportsCapabilitiesAndStatus) {
    StartSessionRequest request;
    request.language = "TSX";
    request.rootUri = "file:///work/app";
    StartSessionResult result = client->StartSession(request).get();

    EXPECT_EQ(result.sessionId.rfind("lsp-", 0), 0u);
    EXPECT_EQ(result.resolvedCommand, "fake-ts-server");
    EXPECT_EQ(result.resolvedArgs, (std::vector<std::string>{"--stdio"}));
    EXPECT_TRUE(JSONEquals(result.capabilities, ParseJSON(R"({"textDocumentSync":1,"hoverProvider":true})")));
    EXPECT_EQ(client->ListSessions(), (std::vector<std::string>{result.sessionId}));
    EXPECT_EQ(client->GetSessionState(result.sessionId), SessionState::Ready);

    EXPECT_EQ(statuses(), (std::vector<std::string>{"starting", "connected"}));
    auto connected = waitForStatus("connected");
    ASSERT_TRUE(connected.has_value());
    EXPECT_EQ(GetStringMember(*connected, "languageId").value_or(""), "typescript");
    EXPECT_EQ(GetStringMember(*connected, "sessionId").value_or(""), result.sessionId);
}

TEST_F(ClientTest, SessionIdsAreUnique) {
    const std::string a = startTypescript();
    const std::string b = startTypescript();
    EXPECT_NE(a, b);
    EXPECT_EQ(client->ListSessions().size(), 2u);
    EXPECT_EQ(launcher->Launches().size(), 2u);
}

TEST_F(ClientTest, EmptyLanguageIsInvalidArgument) {
    StartSessionRequest request;
    request.language = "  ";
    auto fut = client->StartSession(request);
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::InvalidArgument);
    EXPECT_TRUE(launcher->Launches().empty());
}

TEST_F(ClientTest, ExplicitCommandMustBeAllowed) {
    StartSessionRequest request;
    request.language = "typescript";
    request.command = "/tmp/evil-server";
    auto denied = client->StartSession(request);
    EXPECT_EQ(categoryOf([&]() { denied.get(); }), errors::ErrorCategory::CommandNotTrusted);
    EXPECT_TRUE(launcher->Launches().empty());
    EXPECT_EQ(statuses(), (std::vector<std::string>{"error"}));

    resolver->AllowCommand("/opt/bin/ts-lsp");
    request.command = "/opt/bin/ts-lsp";
    request.args = std::vector<std::string>{"--stdio", "--log-level=4"};
    StartSessionResult result = client->StartSession(request).get();
    EXPECT_EQ(result.resolvedCommand, "/opt/bin/ts-lsp");
    ASSERT_EQ(launcher->Launches().size(), 1u);
    EXPECT_EQ(launcher->Launches()[0].second, (std::vector<std::string>{"--stdio", "--log-level=4"}));
}

TEST_F(ClientTest, UntrustedResolvedCommandIsRejected) {
    resolver->Register("go", LaunchSpec{"gopls-unvetted", {}, false});
    StartSessionRequest request;
    request.language = "go";
    auto fut = client->StartSession(request);
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::CommandNotTrusted);
}

TEST_F(ClientTest, FallsBackToBuiltInServer) {
    StartSessionRequest request;
    request.language = "python";
    StartSessionResult result = client->StartSession(request).get();
    EXPECT_EQ(result.resolvedCommand, "pyright-langserver");
    EXPECT_EQ(result.resolvedArgs, (std::vector<std::string>{"--stdio"}));

    request.allowFallback = false;
    auto fut = client->StartSession(request);
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::LaunchUnavailable);
}

TEST_F(ClientTest, SpawnFailureEmitsError) {
    launcher->FailSpawns(true);
    StartSessionRequest request;
    request.language = "typescript";
    auto fut = client->StartSession(request);
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::SpawnFailed);
    EXPECT_EQ(statuses(), (std::vector<std::string>{"starting", "error"}));
    EXPECT_TRUE(client->ListSessions().empty());
}

TEST_F(ClientTest, InitializeFailureTearsDownSession) {
    configureServer = [](FakeLanguageServer& server) {
        server.OnRequestError("initialize", JSONRPCErrorCodes::InternalError, "server crashed on startup");
    };
    StartSessionRequest request;
    request.language = "typescript";
    auto fut = client->StartSession(request);
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::Protocol);
    EXPECT_TRUE(client->ListSessions().empty());
    auto error = waitForStatus("error");
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(GetStringMember(*error, "reason").value_or("").find("initialize failed"), std::string::npos);
    EXPECT_TRUE(launcher->LastServer()->Killed());
}

TEST_F(ClientTest, UnknownSessionIsReported) {
    PositionRequest hover;
    hover.sessionId = "lsp-nope";
    hover.uri = "file:///a.ts";
    auto fut = client->Hover(hover);
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::SessionNotFound);
    EXPECT_EQ(categoryOf([&]() { client->OpenDocument(OpenDocumentRequest{"lsp-nope", "file:///a.ts", "typescript", 1, ""}); }),
              errors::ErrorCategory::SessionNotFound);
    EXPECT_FALSE(client->GetSessionState("lsp-nope").has_value());
    EXPECT_FALSE(client->CancelRequest("lsp-nope", "t"));
    EXPECT_NO_THROW(client->ShutdownSession("lsp-nope").get());
}

TEST_F(ClientTest, DefinitionResultsAreNormalized) {
    configureServer = [](FakeLanguageServer& server) {
        server.OnRequest("textDocument/definition", [](const JSONValue&) -> std::optional<JSONValue> {
            return ParseJSON(R"([{"targetUri":"file:///b.ts",
                                  "targetRange":{"start":{"line":0,"character":0},"end":{"line":9,"character":0}},
                                  "targetSelectionRange":{"start":{"line":2,"character":4},"end":{"line":2,"character":7}}}])");
        });
        server.OnRequest("textDocument/typeDefinition", [](const JSONValue&) -> std::optional<JSONValue> {
            return ParseJSON(R"({"uri":"file:///c.ts","range":{"start":{"line":1,"character":0},"end":{"line":1,"character":3}}})");
        });
    };
    const std::string id = startTypescript();
    PositionRequest request{id, "file:///a.ts", Position{3, 5}, {}};

    JSONValue definition = client->Definition(request).get();
    EXPECT_TRUE(JSONEquals(definition, ParseJSON(
        R"([{"uri":"file:///b.ts","range":{"start":{"line":2,"character":4},"end":{"line":2,"character":7}}}])")));
    JSONValue typeDefinition = client->TypeDefinition(request).get();
    EXPECT_TRUE(JSONEquals(typeDefinition, ParseJSON(
        R"([{"uri":"file:///c.ts","range":{"start":{"line":1,"character":0},"end":{"line":1,"character":3}}}])")));
    // Default server answers null
    EXPECT_TRUE(JSONEquals(client->Implementation(request).get(), ParseJSON("[]")));

    auto sent = launcher->LastServer()->WaitForMethod("textDocument/definition");
    ASSERT_TRUE(sent.has_value());
    EXPECT_TRUE(JSONEquals(*FindMember(*sent, "params"), ParseJSON(
        R"({"textDocument":{"uri":"file:///a.ts"},"position":{"line":3,"character":5}})")));
}

TEST_F(ClientTest, NullResultsKeepTheirShape) {
    const std::string id = startTypescript();
    PositionRequest position{id, "file:///a.ts", Position{0, 0}, {}};
    EXPECT_TRUE(client->Hover(position).get().isNull());
    EXPECT_TRUE(client->Completion(position).get().isNull());
    EXPECT_TRUE(JSONEquals(client->DocumentHighlights(position).get(), ParseJSON("[]")));
    EXPECT_TRUE(JSONEquals(client->References(ReferencesRequest{id, "file:///a.ts", Position{0, 0}, false, {}}).get(),
                           ParseJSON("[]")));
    EXPECT_TRUE(JSONEquals(client->DocumentSymbols(DocumentRequest{id, "file:///a.ts", {}}).get(), ParseJSON("[]")));
    EXPECT_TRUE(JSONEquals(client->WorkspaceSymbols(WorkspaceSymbolsRequest{id, "Foo", {}}).get(), ParseJSON("[]")));
    EXPECT_TRUE(JSONEquals(client->ResolveCodeAction(ResolveCodeActionRequest{id, ParseJSON(R"({"title":"fix"})"), {}}).get(),
                           ParseJSON("{}")));
    EXPECT_TRUE(client->SemanticTokensFull(DocumentRequest{id, "file:///a.ts", {}}).get().isNull());
}

TEST_F(ClientTest, FeatureRequestsCarryTheirParams) {
    const std::string id = startTypescript();
    auto server = launcher->LastServer();

    client->References(ReferencesRequest{id, "file:///a.ts", Position{1, 2}, false, {}}).get();
    client->Rename(RenameRequest{id, "file:///a.ts", Position{1, 2}, "renamed", {}}).get();
    FormatDocumentRequest format;
    format.sessionId = id;
    format.uri = "file:///a.ts";
    format.tabSize = 4;
    format.insertSpaces = false;
    client->FormatDocument(format).get();
    CodeActionsRequest actions;
    actions.sessionId = id;
    actions.uri = "file:///a.ts";
    actions.range = Range{Position{0, 0}, Position{0, 3}};
    client->CodeActions(actions).get();
    client->WorkspaceSymbols(WorkspaceSymbolsRequest{id, "Widget", {}}).get();
    client->ExecuteCommand(ExecuteCommandRequest{id, "_typescript.organizeImports", std::nullopt, {}}).get();

    auto paramsOf = [&](const std::string& method) {
        auto msg = server->WaitForMethod(method);
        EXPECT_TRUE(msg.has_value()) << method;
        return msg.has_value() ? *FindMember(*msg, "params") : JSONValue(nullptr);
    };
    EXPECT_TRUE(JSONEquals(*FindMember(paramsOf("textDocument/references"), "context"),
                           ParseJSON(R"({"includeDeclaration":false})")));
    EXPECT_EQ(GetStringMember(paramsOf("textDocument/rename"), "newName").value_or(""), "renamed");
    EXPECT_TRUE(JSONEquals(*FindMember(paramsOf("textDocument/formatting"), "options"),
                           ParseJSON(R"({"tabSize":4,"insertSpaces":false})")));
    EXPECT_TRUE(JSONEquals(*FindMember(paramsOf("textDocument/codeAction"), "context"),
                           ParseJSON(R"({"diagnostics":[],"triggerKind":1})")));
    EXPECT_TRUE(JSONEquals(paramsOf("workspace/symbol"), ParseJSON(R"({"query":"Widget"})")));
    EXPECT_TRUE(JSONEquals(paramsOf("workspace/executeCommand"),
                           ParseJSON(R"({"command":"_typescript.organizeImports","arguments":[]})")));
}

TEST_F(ClientTest, DiagnosticsReachTheSink) {
    const std::string id = startTypescript();
    client->OpenDocument(OpenDocumentRequest{id, "file:///work/app/main.ts", "typescript", 1, "const x = ;"});
    auto server = launcher->LastServer();
    ASSERT_TRUE(server->WaitForMethod("textDocument/didOpen").has_value());
    server->Notify("textDocument/publishDiagnostics", ParseJSON(
        R"({"uri":"file:///work/app/main.ts","version":1,"diagnostics":[{"message":"Expression expected."}]})"));
    auto diagnostics = waitForDiagnostics();
    ASSERT_TRUE(diagnostics.has_value());
    EXPECT_EQ(GetStringMember(*diagnostics, "sessionId").value_or(""), id);
    EXPECT_EQ(std::get<JSONValue::Array>(FindMember(*diagnostics, "diagnostics")->value).size(), 1u);
}

TEST_F(ClientTest, CancelThroughClient) {
    configureServer = [](FakeLanguageServer& server) {
        server.OnRequest("textDocument/completion", [](const JSONValue&) { return std::optional<JSONValue>(); });
    };
    const std::string id = startTypescript();
    PositionRequest request{id, "file:///a.ts", Position{0, 0}, {}};
    request.options.callerToken = "req-7";
    auto fut = client->Completion(request);
    ASSERT_TRUE(launcher->LastServer()->WaitForMethod("textDocument/completion").has_value());
    EXPECT_TRUE(client->CancelRequest(id, "req-7"));
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::Canceled);
    EXPECT_EQ(client->GetSessionState(id), SessionState::Ready);
}

TEST_F(ClientTest, ShutdownSessionEmitsDisconnected) {
    const std::string id = startTypescript();
    client->ShutdownSession(id).get();
    EXPECT_TRUE(client->ListSessions().empty());
    auto disconnected = waitForStatus("disconnected");
    ASSERT_TRUE(disconnected.has_value());
    EXPECT_EQ(GetStringMember(*disconnected, "sessionId").value_or(""), id);
    EXPECT_TRUE(launcher->LastServer()->WaitForMethod("exit").has_value());
}

TEST_F(ClientTest, ServerExitRemovesSession) {
    const std::string id = startTypescript();
    launcher->LastServer()->CloseOutput();
    auto disconnected = waitForStatus("disconnected");
    ASSERT_TRUE(disconnected.has_value());
    EXPECT_EQ(GetStringMember(*disconnected, "reason").value_or(""), "language server closed its output");
    EXPECT_TRUE(client->ListSessions().empty());
    auto fut = client->Hover(PositionRequest{id, "file:///a.ts", Position{0, 0}, {}});
    EXPECT_EQ(categoryOf([&]() { fut.get(); }), errors::ErrorCategory::SessionNotFound);
    // Shutting down a session that already ended is a no-op
    EXPECT_NO_THROW(client->ShutdownSession(id).get());
    EXPECT_NO_THROW(client->ShutdownSession(id).get());
}

TEST_F(ClientTest, ClientDestroyedWhileServerExitIsReported) {
    std::promise<void> reporting;
    std::promise<void> released;
    auto releasedFuture = released.get_future().share();
    std::atomic<bool> reported{false};
    auto blockingSink = std::make_shared<CallbackEventSink>(
        [&, releasedFuture](const std::string& topic, const JSONValue& payload) {
            if (topic != Topics::ServerStatus || GetStringMember(payload, "status") != "disconnected") {
                return;
            }
            // Hold the worker inside the termination handler until the host has let go of the client
            reporting.set_value();
            releasedFuture.wait();
            std::this_thread::sleep_for(50ms);
            reported.store(true);
        });
    EngineOptions options;
    options.workerThreads = 2;
    auto local = std::make_unique<Client>(options, resolver, blockingSink, launcher);
    StartSessionRequest request;
    request.language = "typescript";
    local->StartSession(request).get();

    launcher->LastServer()->CloseOutput();
    ASSERT_EQ(reporting.get_future().wait_for(5s), std::future_status::ready);
    released.set_value();
    local.reset();
    EXPECT_TRUE(reported.load());
}

TEST_F(ClientTest, ShutdownAllStopsEverySession) {
    startTypescript();
    startTypescript();
    client->ShutdownAll();
    EXPECT_TRUE(client->ListSessions().empty());
}
