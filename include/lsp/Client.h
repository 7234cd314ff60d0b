//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: LSP client engine interface - host-facing facade over language server sessions
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lsp/Config.h"
#include "lsp/EventSink.h"
#include "lsp/JSONRPCTypes.h"
#include "lsp/LaunchResolver.h"
#include "lsp/Process.h"
#include "lsp/Protocol.h"
#include "lsp/Session.h"

namespace lsp {

//==========================================================================================================
// LSP Client interface
// Purpose: Host-facing operations. Every call names its session by id; an unknown id fails with
//          errors::ErrorCategory::SessionNotFound. Asynchronous results carry errors::LspException.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Session management //////////////////////////////////////////////
    //==========================================================================================================
    // Resolves a launch, spawns the language server and performs the initialize handshake.
    // Args:
    //   request: Language, workspace roots, optional explicit command/args and resolver hints.
    // Returns:
    //   A future with the new session id, the server capabilities and the command actually launched.
    //   Fails with CommandNotTrusted, LaunchUnavailable, SpawnFailed or the handshake error; a session
    //   whose handshake fails is torn down and never becomes visible as ready.
    //==========================================================================================================
    virtual std::future<StartSessionResult> StartSession(const StartSessionRequest& request) = 0;

    //==========================================================================================================
    // Gracefully stops a session: shutdown request, exit notification, then kill.
    // Args:
    //   sessionId: Session to stop. An unknown id is a no-op.
    // Returns:
    //   A future that completes once the session has been torn down.
    //==========================================================================================================
    virtual std::future<void> ShutdownSession(const std::string& sessionId) = 0;

    // Ids of the live sessions, sorted.
    virtual std::vector<std::string> ListSessions() const = 0;

    // Lifecycle state of a live session, std::nullopt when the id is unknown.
    virtual std::optional<SessionState> GetSessionState(const std::string& sessionId) const = 0;

    // Gracefully stops every live session and waits for all of them.
    virtual void ShutdownAll() = 0;

    ////////////////////////////////////////// Document synchronization ////////////////////////////////////////
    //==========================================================================================================
    // textDocument/didOpen, didChange and didClose. These are notifications: they return once the message
    // has been written and throw errors::LspException (SessionNotFound, Transport) otherwise.
    // Closing a document also emits an empty diagnostics event for its URI.
    //==========================================================================================================
    virtual void OpenDocument(const OpenDocumentRequest& request) = 0;
    virtual void ChangeDocument(const ChangeDocumentRequest& request) = 0;
    virtual void CloseDocument(const CloseDocumentRequest& request) = 0;

    //==========================================================================================================
    // Cancels the in-flight request registered under callerToken (see RequestOptions::callerToken).
    // Returns:
    //   true when a pending request was found; its future then fails with ErrorCategory::Canceled.
    //   Unknown or already completed tokens return false and are not an error.
    //==========================================================================================================
    virtual bool CancelRequest(const std::string& sessionId, const std::string& callerToken) = 0;

    ////////////////////////////////////////// Language features ///////////////////////////////////////////////
    // Each returns the server's `result`. Definition-like results are normalized into [{uri, range}];
    // list-shaped results default to [] when the server answers null.
    virtual std::future<JSONValue> Completion(const PositionRequest& request) = 0;
    virtual std::future<JSONValue> Hover(const PositionRequest& request) = 0;
    virtual std::future<JSONValue> Definition(const PositionRequest& request) = 0;
    virtual std::future<JSONValue> References(const ReferencesRequest& request) = 0;
    virtual std::future<JSONValue> Rename(const RenameRequest& request) = 0;
    virtual std::future<JSONValue> Implementation(const PositionRequest& request) = 0;
    virtual std::future<JSONValue> TypeDefinition(const PositionRequest& request) = 0;
    virtual std::future<JSONValue> SignatureHelp(const PositionRequest& request) = 0;
    virtual std::future<JSONValue> DocumentHighlights(const PositionRequest& request) = 0;
    virtual std::future<JSONValue> DocumentSymbols(const DocumentRequest& request) = 0;
    virtual std::future<JSONValue> FormatDocument(const FormatDocumentRequest& request) = 0;
    virtual std::future<JSONValue> InlayHints(const RangeRequest& request) = 0;
    virtual std::future<JSONValue> SemanticTokensFull(const DocumentRequest& request) = 0;
    virtual std::future<JSONValue> CodeActions(const CodeActionsRequest& request) = 0;
    virtual std::future<JSONValue> ResolveCodeAction(const ResolveCodeActionRequest& request) = 0;
    virtual std::future<JSONValue> WorkspaceSymbols(const WorkspaceSymbolsRequest& request) = 0;
    virtual std::future<JSONValue> ExecuteCommand(const ExecuteCommandRequest& request) = 0;
};

// Standard LSP client engine
class Client : public IClient {
public:
    //==========================================================================================================
    // Constructs the engine and starts its worker threads.
    // Args:
    //   options: Timeouts, frame limits, worker count and client identity.
    //   resolver: Launch resolution and command allow-list.
    //   sink: Receives diagnostics and server-status events (may be null).
    //   launcher: Process spawner; defaults to PosixProcessLauncher.
    //==========================================================================================================
    Client(EngineOptions options,
           std::shared_ptr<ILaunchResolver> resolver,
           std::shared_ptr<IEventSink> sink,
           std::shared_ptr<IProcessLauncher> launcher = nullptr);
    virtual ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    ////////////////////////////////////////// IClient implementation //////////////////////////////////////////
    std::future<StartSessionResult> StartSession(const StartSessionRequest& request) override;
    std::future<void> ShutdownSession(const std::string& sessionId) override;
    std::vector<std::string> ListSessions() const override;
    std::optional<SessionState> GetSessionState(const std::string& sessionId) const override;
    void ShutdownAll() override;

    void OpenDocument(const OpenDocumentRequest& request) override;
    void ChangeDocument(const ChangeDocumentRequest& request) override;
    void CloseDocument(const CloseDocumentRequest& request) override;
    bool CancelRequest(const std::string& sessionId, const std::string& callerToken) override;

    std::future<JSONValue> Completion(const PositionRequest& request) override;
    std::future<JSONValue> Hover(const PositionRequest& request) override;
    std::future<JSONValue> Definition(const PositionRequest& request) override;
    std::future<JSONValue> References(const ReferencesRequest& request) override;
    std::future<JSONValue> Rename(const RenameRequest& request) override;
    std::future<JSONValue> Implementation(const PositionRequest& request) override;
    std::future<JSONValue> TypeDefinition(const PositionRequest& request) override;
    std::future<JSONValue> SignatureHelp(const PositionRequest& request) override;
    std::future<JSONValue> DocumentHighlights(const PositionRequest& request) override;
    std::future<JSONValue> DocumentSymbols(const DocumentRequest& request) override;
    std::future<JSONValue> FormatDocument(const FormatDocumentRequest& request) override;
    std::future<JSONValue> InlayHints(const RangeRequest& request) override;
    std::future<JSONValue> SemanticTokensFull(const DocumentRequest& request) override;
    std::future<JSONValue> CodeActions(const CodeActionsRequest& request) override;
    std::future<JSONValue> ResolveCodeAction(const ResolveCodeActionRequest& request) override;
    std::future<JSONValue> WorkspaceSymbols(const WorkspaceSymbolsRequest& request) override;
    std::future<JSONValue> ExecuteCommand(const ExecuteCommandRequest& request) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

// Client factory interface
class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<IClient> CreateClient(EngineOptions options,
                                                  std::shared_ptr<ILaunchResolver> resolver,
                                                  std::shared_ptr<IEventSink> sink) = 0;
};

// Standard client factory (POSIX process launcher)
class ClientFactory : public IClientFactory {
public:
    std::unique_ptr<IClient> CreateClient(EngineOptions options,
                                          std::shared_ptr<ILaunchResolver> resolver,
                                          std::shared_ptr<IEventSink> sink) override;
};

} // namespace lsp
