//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One running language server: stdio readers, handshake, request/notification traffic, teardown
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lsp/Config.h"
#include "lsp/DocumentTracker.h"
#include "lsp/EventSink.h"
#include "lsp/JSONRPCTypes.h"
#include "lsp/Process.h"
#include "lsp/Protocol.h"
#include "lsp/RequestCorrelator.h"
#include "lsp/ServerRequestRouter.h"

namespace boost { namespace asio { class io_context; } }

namespace lsp {

enum class SessionState {
    Starting,
    Initializing,
    Ready,
    ShuttingDown,
    Terminated,
    Failed
};

const char* SessionStateName(SessionState state);

struct SessionConfig {
    std::string sessionId;
    std::string languageId;
    std::optional<std::string> rootUri;
    std::vector<WorkspaceFolder> workspaceFolders;
    EngineOptions options;
};

//==========================================================================================================
// Session
// Purpose: Owns the child process and its pipes. Two coroutines run on a per-session strand of the shared
//          io_context: the stdout frame loop (responses, server requests, notifications) and the stderr
//          line logger.
// Notes:
//   Teardown happens exactly once, whichever comes first: Shutdown(), Terminate(), stdout EOF or a
//   malformed frame. It kills the process, closes the pipes, resolves every pending request as
//   "connection closed", clears open documents (emitting empty diagnostics) and then invokes the
//   termination handler.
//==========================================================================================================
class Session {
public:
    // (sessionId, reason, graceful)
    using TerminationHandler = std::function<void(const std::string&, const std::string&, bool)>;

    Session(boost::asio::io_context& io, SessionConfig config, std::unique_ptr<IChildProcess> process,
            std::shared_ptr<IEventSink> sink);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const;
    const std::string& LanguageId() const;
    SessionState State() const;
    int Pid() const;

    // Takes the pipes and starts both reader loops. Called once, right after the session is registered.
    void Start(TerminationHandler onTerminated);

    //======================================================================================================
    // Initialize
    // Purpose: initialize/initialized handshake. Stores the server capabilities and derives the sync kind.
    // Args:
    //   initializationOptions: Passed through verbatim when present.
    // Returns:
    //   The full initialize result ({capabilities, serverInfo?}).
    // Throws:
    //   errors::LspException; the caller is expected to Terminate() the session on failure.
    //======================================================================================================
    JSONValue Initialize(const std::optional<JSONValue>& initializationOptions);

    JSONValue Capabilities() const;
    SyncKind GetSyncKind() const;

    //======================================================================================================
    // SendRequest
    // Purpose: Registers a response slot, writes the request, and returns a deferred future.
    // Notes:
    //   The wait (bounded by the effective timeout, whose deadline starts now) runs in the thread that
    //   calls get(). A write failure is reported through the future without waiting.
    // Returns:
    //   Future of the `result` member; exceptions are errors::LspException.
    //======================================================================================================
    std::future<JSONValue> SendRequest(const std::string& method, std::optional<JSONValue> params,
                                       const RequestOptions& options = {});

    // Writes a notification. Throws errors::LspException(Transport) when the pipe is gone.
    void SendNotification(const std::string& method, std::optional<JSONValue> params);

    // Cancels the request registered under callerToken and tells the server. False when unknown.
    bool CancelRequest(const std::string& callerToken);

    void OpenDocument(const std::string& uri, const std::string& languageId, int64_t version,
                      const std::string& text);
    void ChangeDocument(const std::string& uri, int64_t version, const std::string& text,
                        const std::vector<TextDocumentContentChange>& changes);
    void CloseDocument(const std::string& uri);

    // shutdown request (default timeout), exit notification, then unconditional kill. Idempotent.
    void Shutdown();

    // Forced teardown without the shutdown/exit exchange. Idempotent.
    void Terminate(const std::string& reason);

    // Blocks until teardown has completed or the timeout passes. Returns true when torn down.
    bool WaitTerminated(std::chrono::milliseconds timeout) const;

    const RequestCorrelator& Correlator() const;
    const DocumentTracker& Documents() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

// Initialize params sent by Session::Initialize; exposed for inspection.
JSONValue BuildInitializeParams(const SessionConfig& config, const std::optional<JSONValue>& initializationOptions);

} // namespace lsp
