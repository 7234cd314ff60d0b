//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session lifecycle: Boost.Asio stdout/stderr readers, initialize handshake, writes and teardown
//==========================================================================================================

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <utility>

#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "lsp/ContentFramer.h"
#include "lsp/JsonRpcMessageRouter.h"
#include "lsp/NotificationDispatcher.h"
#include "lsp/Session.h"
#include "lsp/errors/Errors.h"

namespace lsp {

namespace net = boost::asio;

namespace {
constexpr std::size_t kMaxStderrLine = 64 * 1024;

template <typename T>
std::future<T> failedFuture(std::exception_ptr ep) {
    std::promise<T> p;
    p.set_exception(std::move(ep));
    return p.get_future();
}

std::vector<WorkspaceFolder> effectiveFolders(const SessionConfig& config) {
    if (!config.workspaceFolders.empty() || !config.rootUri.has_value()) {
        return config.workspaceFolders;
    }
    return { WorkspaceFolder{config.rootUri.value(), WorkspaceFolderName(config.rootUri.value())} };
}

JSONValue stringArray(std::initializer_list<const char*> items) {
    std::vector<JSONValue> out;
    for (const char* s : items) {
        out.push_back(JSONValue(s));
    }
    return MakeArray(std::move(out));
}

JSONValue clientCapabilities() {
    const JSONValue yes(true);
    const JSONValue markup = stringArray({"markdown", "plaintext"});
    JSONValue textDocument = MakeObject({
        {"synchronization", MakeObject({{"didSave", JSONValue(false)}, {"dynamicRegistration", JSONValue(false)}})},
        {"completion", MakeObject({
            {"completionItem", MakeObject({
                {"snippetSupport", yes},
                {"documentationFormat", markup}
            })}
        })},
        {"hover", MakeObject({{"contentFormat", markup}})},
        {"signatureHelp", MakeObject({
            {"signatureInformation", MakeObject({{"documentationFormat", markup}})}
        })},
        {"definition", MakeObject({{"linkSupport", yes}})},
        {"implementation", MakeObject({{"linkSupport", yes}})},
        {"typeDefinition", MakeObject({{"linkSupport", yes}})},
        {"references", MakeObject({{"dynamicRegistration", JSONValue(false)}})},
        {"documentHighlight", MakeObject({{"dynamicRegistration", JSONValue(false)}})},
        {"documentSymbol", MakeObject({{"hierarchicalDocumentSymbolSupport", yes}})},
        {"rename", MakeObject({{"prepareSupport", JSONValue(false)}})},
        {"codeAction", MakeObject({
            {"codeActionLiteralSupport", MakeObject({
                {"codeActionKind", MakeObject({
                    {"valueSet", stringArray({"", "quickfix", "refactor", "refactor.extract", "refactor.inline", "source"})}
                })}
            })},
            {"resolveSupport", MakeObject({{"properties", stringArray({"edit"})}})}
        })},
        {"formatting", MakeObject({{"dynamicRegistration", JSONValue(false)}})},
        {"inlayHint", MakeObject({{"dynamicRegistration", JSONValue(false)}})},
        {"semanticTokens", MakeObject({
            {"requests", MakeObject({{"full", yes}})},
            {"tokenTypes", MakeArray({})},
            {"tokenModifiers", MakeArray({})},
            {"formats", stringArray({"relative"})}
        })},
        {"publishDiagnostics", MakeObject({
            {"relatedInformation", yes},
            {"versionSupport", yes}
        })}
    });
    JSONValue workspace = MakeObject({
        {"workspaceFolders", yes},
        {"configuration", yes},
        {"symbol", MakeObject({{"dynamicRegistration", JSONValue(false)}})},
        {"executeCommand", MakeObject({{"dynamicRegistration", JSONValue(false)}})}
    });
    JSONValue window = MakeObject({{"workDoneProgress", yes}});
    return MakeObject({
        {"textDocument", textDocument},
        {"workspace", workspace},
        {"window", window}
    });
}
} // namespace

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "starting";
        case SessionState::Initializing: return "initializing";
        case SessionState::Ready: return "ready";
        case SessionState::ShuttingDown: return "shutting_down";
        case SessionState::Terminated: return "terminated";
        case SessionState::Failed: return "failed";
    }
    return "failed";
}

JSONValue BuildInitializeParams(const SessionConfig& config, const std::optional<JSONValue>& initializationOptions) {
    std::vector<JSONValue> folders;
    for (const auto& folder : effectiveFolders(config)) {
        folders.push_back(MakeObject({{"uri", JSONValue(folder.uri)}, {"name", JSONValue(folder.name)}}));
    }
    JSONValue params = MakeObject({
        {"processId", JSONValue(nullptr)},
        {"rootUri", config.rootUri.has_value() ? JSONValue(config.rootUri.value()) : JSONValue(nullptr)},
        {"workspaceFolders", folders.empty() ? JSONValue(nullptr) : MakeArray(std::move(folders))},
        {"clientInfo", MakeObject({
            {"name", JSONValue(config.options.clientName)},
            {"version", JSONValue(config.options.clientVersion)}
        })},
        {"capabilities", clientCapabilities()}
    });
    if (initializationOptions.has_value()) {
        SetMember(params, "initializationOptions", initializationOptions.value());
    }
    return params;
}

//==========================================================================================================
// Session::Impl
//==========================================================================================================
class Session::Impl : public std::enable_shared_from_this<Session::Impl> {
public:
    net::io_context& io;
    net::strand<net::io_context::executor_type> strand;
    SessionConfig config;
    std::unique_ptr<IChildProcess> process;
    std::shared_ptr<IEventSink> eventSink;

    std::shared_ptr<RequestCorrelator> correlator;
    std::shared_ptr<DocumentTracker> documents;
    NotificationDispatcher dispatcher;
    ServerRequestRouter serverRequests;
    std::unique_ptr<IJsonRpcMessageRouter> router;
    std::unique_ptr<IContentFramer> framer;
    RouterHandlers handlers;

    net::posix::stream_descriptor stdoutStream;
    net::posix::stream_descriptor stderrStream;

    std::mutex writeMutex;
    int stdinFd{-1};

    std::atomic<SessionState> state{SessionState::Starting};
    std::atomic<bool> tornDown{false};
    std::atomic<bool> gracefulRequested{false};

    mutable std::mutex capsMutex;
    JSONValue capabilities{JSONValue::Object{}};

    std::mutex handlerMutex;
    TerminationHandler onTerminated;

    mutable std::mutex doneMutex;
    mutable std::condition_variable doneCv;
    bool done{false};

    Impl(net::io_context& ioc, SessionConfig cfg, std::unique_ptr<IChildProcess> proc,
         std::shared_ptr<IEventSink> sink)
        : io(ioc),
          strand(net::make_strand(ioc)),
          config(std::move(cfg)),
          process(std::move(proc)),
          eventSink(std::move(sink)),
          correlator(std::make_shared<RequestCorrelator>()),
          documents(std::make_shared<DocumentTracker>()),
          dispatcher(config.sessionId, documents, eventSink),
          serverRequests(effectiveFolders(config)),
          router(MakeDefaultJsonRpcMessageRouter()),
          framer(MakeContentLengthFramer(config.options.maxContentLength, config.options.maxHeaderBytes)),
          stdoutStream(strand),
          stderrStream(strand) {
        handlers.requestHandler = [this](const JSONRPCRequest& request) {
            LOG_DEBUG("[{}] server request {}", config.sessionId, request.method);
            return serverRequests.Handle(request);
        };
        handlers.notificationHandler = [this](const JSONRPCNotification& notification) {
            auto outcome = dispatcher.Dispatch(notification);
            LOG_DEBUG("[{}] notification {} {}", config.sessionId, notification.method, OutcomeName(outcome));
        };
        handlers.errorHandler = [this](const std::string& err) {
            LOG_WARN("[{}] {}", config.sessionId, err);
        };
    }

    void start(TerminationHandler handler) {
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            onTerminated = std::move(handler);
        }
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            stdinFd = process->TakeStdin();
        }
        boost::system::error_code ec;
        stdoutStream.assign(process->TakeStdout(), ec);
        if (!ec) {
            stderrStream.assign(process->TakeStderr(), ec);
        }
        if (ec) {
            teardown(std::format("cannot attach to language server pipes: {}", ec.message()), false);
            return;
        }
        auto self = shared_from_this();
        net::co_spawn(strand, readStdout(self), net::detached);
        net::co_spawn(strand, readStderr(self), net::detached);
    }

    net::awaitable<void> readStdout(std::shared_ptr<Impl> self) {
        std::string buffer;
        std::array<char, 16384> chunk{};
        std::string reason = "language server closed its output";
        bool running = true;
        while (running) {
            boost::system::error_code ec;
            std::size_t n = co_await stdoutStream.async_read_some(
                net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (ec == net::error::operation_aborted) {
                    reason = "stdout reader stopped";
                } else if (ec != net::error::eof) {
                    reason = std::format("stdout read failed: {}", ec.message());
                }
                break;
            }
            buffer.append(chunk.data(), n);
            while (running) {
                auto decoded = framer->tryDecodeEx(buffer);
                if (decoded.status == IContentFramer::DecodeStatus::Incomplete) {
                    break;
                }
                if (decoded.status != IContentFramer::DecodeStatus::Ok) {
                    reason = std::format("malformed frame from language server: {}", DecodeStatusName(decoded.status));
                    LOG_WARN("[{}] {}", config.sessionId, reason);
                    running = false;
                    break;
                }
                std::string payload = std::move(decoded.payload.value());
                buffer.erase(0, decoded.bytesConsumed);
                JSONValue message;
                try {
                    message = ParseJSON(payload);
                } catch (const std::runtime_error& e) {
                    reason = std::format("invalid JSON from language server: {}", e.what());
                    LOG_WARN("[{}] {}", config.sessionId, reason);
                    running = false;
                    break;
                }
                handleMessage(std::move(message));
            }
        }
        self->teardown(reason, false);
    }

    net::awaitable<void> readStderr(std::shared_ptr<Impl> self) {
        std::string pending;
        std::array<char, 4096> chunk{};
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = co_await stderrStream.async_read_some(
                net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                break;
            }
            pending.append(chunk.data(), n);
            std::size_t nl = 0;
            while ((nl = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, nl);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (!line.empty()) {
                    LOG_DEBUG("[{}] stderr: {}", self->config.sessionId, line);
                }
                pending.erase(0, nl + 1);
            }
            if (pending.size() > kMaxStderrLine) {
                LOG_DEBUG("[{}] stderr: {}", self->config.sessionId, pending);
                pending.clear();
            }
        }
        if (!pending.empty()) {
            LOG_DEBUG("[{}] stderr: {}", self->config.sessionId, pending);
        }
    }

    void handleMessage(JSONValue message) {
        try {
            auto reply = router->route(std::move(message), handlers, [this](int64_t id, JSONValue&& response) {
                if (!correlator->Resolve(id, std::move(response))) {
                    LOG_DEBUG("[{}] response for unknown or abandoned request {}", config.sessionId, id);
                }
            });
            if (reply.has_value()) {
                // Answered off the strand so a blocking stdin write never stalls the stdout reader
                net::post(io, [self = shared_from_this(), payload = reply->Serialize()]() {
                    try {
                        self->writeMessage(payload);
                    } catch (const errors::LspException& e) {
                        LOG_WARN("[{}] failed to answer server request: {}", self->config.sessionId, e.what());
                    }
                });
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] failed to handle inbound message: {}", config.sessionId, e.what());
        }
    }

    void writeMessage(const std::string& payload) {
        const std::string frame = framer->encode(payload);
        int err = 0;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (stdinFd < 0) {
                throw errors::makeException(errors::ErrorCategory::Transport,
                    std::format("LSP session {} stdin is closed", config.sessionId));
            }
            err = WriteAll(stdinFd, frame.data(), frame.size());
        }
        if (err != 0) {
            LOG_ERROR("[{}] write to language server failed: {}", config.sessionId, std::strerror(err));
            net::post(io, [self = shared_from_this()]() {
                self->teardown("stdin write failed", false);
            });
            throw errors::makeException(errors::ErrorCategory::Transport,
                std::format("Failed to write to LSP stdin: {}", std::strerror(err)));
        }
    }

    std::future<JSONValue> sendRequest(const std::string& method, std::optional<JSONValue> params,
                                       const RequestOptions& options) {
        auto closed = [&]() {
            return failedFuture<JSONValue>(std::make_exception_ptr(errors::makeException(
                errors::ErrorCategory::ConnectionClosed,
                std::format("LSP session {} is closed", config.sessionId), method)));
        };
        if (tornDown.load()) {
            return closed();
        }
        const auto timeout = EffectiveTimeout(method, options.timeoutMs, config.options.timeouts);
        PendingCall call = correlator->Register(method, options.callerToken, timeout);
        // Teardown sets tornDown before failing the table; re-check so a late registration is not stranded
        if (tornDown.load()) {
            call.Abandon();
            return closed();
        }
        JSONRPCRequest request(call.Id(), method, std::move(params));
        try {
            writeMessage(request.Serialize());
        } catch (const errors::LspException&) {
            call.Abandon();
            return failedFuture<JSONValue>(std::current_exception());
        }
        LOG_DEBUG("[{}] -> {} (id={}, timeout={} ms)", config.sessionId, method, call.Id(), timeout.count());
        return std::async(std::launch::deferred, [call = std::move(call)]() mutable {
            return call.Await();
        });
    }

    void sendNotification(const std::string& method, std::optional<JSONValue> params) {
        JSONRPCNotification notification(method, std::move(params));
        writeMessage(notification.Serialize());
    }

    void teardown(const std::string& reason, bool graceful) {
        bool expected = false;
        if (!tornDown.compare_exchange_strong(expected, true)) {
            return;
        }
        // The termination handler may drop the last Session reference
        auto self = shared_from_this();
        graceful = graceful || gracefulRequested.load();
        const SessionState prev = state.load();
        state.store((prev == SessionState::Starting || prev == SessionState::Initializing)
                        ? SessionState::Failed : SessionState::Terminated);

        // Kill first: a writer blocked on a full stdin pipe gets EPIPE and releases the write lock
        process->Kill();
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (stdinFd >= 0) {
                ::close(stdinFd);
                stdinFd = -1;
            }
        }
        net::dispatch(strand, [self = shared_from_this()]() {
            boost::system::error_code ec;
            self->stdoutStream.close(ec);
            self->stderrStream.close(ec);
        });

        const std::size_t closedRequests = correlator->FailAll();
        for (const auto& uri : documents->Clear()) {
            dispatcher.EmitCleared(uri);
        }
        LOG_INFO("[{}] session {}: {} ({} pending request(s) closed)", config.sessionId,
                 SessionStateName(state.load()), reason, closedRequests);

        TerminationHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = std::move(onTerminated);
            onTerminated = nullptr;
        }
        if (handler) {
            try {
                handler(config.sessionId, reason, graceful);
            } catch (const std::exception& e) {
                LOG_ERROR("[{}] termination handler failed: {}", config.sessionId, e.what());
            }
        }
        {
            std::lock_guard<std::mutex> lk(doneMutex);
            done = true;
        }
        doneCv.notify_all();
    }
};

//==========================================================================================================
// Session
//==========================================================================================================
Session::Session(net::io_context& io, SessionConfig config, std::unique_ptr<IChildProcess> process,
                 std::shared_ptr<IEventSink> sink)
    : pImpl(std::make_shared<Impl>(io, std::move(config), std::move(process), std::move(sink))) {}

Session::~Session() {
    pImpl->teardown("session released", false);
}

const std::string& Session::Id() const { return pImpl->config.sessionId; }
const std::string& Session::LanguageId() const { return pImpl->config.languageId; }
SessionState Session::State() const { return pImpl->state.load(); }
int Session::Pid() const { return pImpl->process->Pid(); }

void Session::Start(TerminationHandler onTerminated) {
    FUNC_SCOPE();
    pImpl->start(std::move(onTerminated));
}

JSONValue Session::Initialize(const std::optional<JSONValue>& initializationOptions) {
    FUNC_SCOPE();
    SessionState expected = SessionState::Starting;
    pImpl->state.compare_exchange_strong(expected, SessionState::Initializing);

    JSONValue params = BuildInitializeParams(pImpl->config, initializationOptions);
    JSONValue result = pImpl->sendRequest(Methods::Initialize, std::move(params), {}).get();

    const JSONValue* caps = FindMember(result, "capabilities");
    JSONValue capabilities = (caps != nullptr && caps->isObject()) ? *caps : JSONValue(JSONValue::Object{});
    {
        std::lock_guard<std::mutex> lk(pImpl->capsMutex);
        pImpl->capabilities = capabilities;
    }
    const SyncKind kind = NegotiateSyncKind(capabilities);
    pImpl->documents->SetSyncKind(kind);

    pImpl->sendNotification(Methods::Initialized, JSONValue(JSONValue::Object{}));

    expected = SessionState::Initializing;
    if (!pImpl->state.compare_exchange_strong(expected, SessionState::Ready)) {
        throw errors::makeException(errors::ErrorCategory::ConnectionClosed,
            std::format("LSP session {} ended during initialization", Id()), Methods::Initialize);
    }
    LOG_INFO("[{}] language server ready ({} sync)", Id(), SyncKindName(kind));
    return result;
}

JSONValue Session::Capabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->capsMutex);
    return pImpl->capabilities;
}

SyncKind Session::GetSyncKind() const {
    return pImpl->documents->GetSyncKind();
}

std::future<JSONValue> Session::SendRequest(const std::string& method, std::optional<JSONValue> params,
                                            const RequestOptions& options) {
    return pImpl->sendRequest(method, std::move(params), options);
}

void Session::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    pImpl->sendNotification(method, std::move(params));
}

bool Session::CancelRequest(const std::string& callerToken) {
    auto id = pImpl->correlator->Cancel(callerToken);
    if (!id.has_value()) {
        LOG_DEBUG("[{}] cancel for unknown token '{}' ignored", Id(), callerToken);
        return false;
    }
    try {
        pImpl->sendNotification(Methods::CancelRequest, MakeObject({{"id", JSONValue(id.value())}}));
    } catch (const errors::LspException& e) {
        LOG_DEBUG("[{}] could not send $/cancelRequest for {}: {}", Id(), id.value(), e.what());
    }
    return true;
}

void Session::OpenDocument(const std::string& uri, const std::string& languageId, int64_t version,
                           const std::string& text) {
    // Recorded before sending so diagnostics racing the didOpen are accepted
    pImpl->documents->Open(uri, version);
    try {
        pImpl->sendNotification(Methods::DidOpen, MakeObject({
            {"textDocument", MakeObject({
                {"uri", JSONValue(uri)},
                {"languageId", JSONValue(languageId)},
                {"version", JSONValue(version)},
                {"text", JSONValue(text)}
            })}
        }));
    } catch (const errors::LspException&) {
        pImpl->documents->Close(uri);
        throw;
    }
}

void Session::ChangeDocument(const std::string& uri, int64_t version, const std::string& text,
                             const std::vector<TextDocumentContentChange>& changes) {
    if (!pImpl->documents->Change(uri, version)) {
        LOG_WARN("[{}] didChange for {} which is not open", Id(), uri);
    }
    JSONValue contentChanges = BuildContentChanges(pImpl->documents->GetSyncKind(), text, changes);
    pImpl->sendNotification(Methods::DidChange, MakeObject({
        {"textDocument", MakeObject({
            {"uri", JSONValue(uri)},
            {"version", JSONValue(version)}
        })},
        {"contentChanges", std::move(contentChanges)}
    }));
}

void Session::CloseDocument(const std::string& uri) {
    pImpl->documents->Close(uri);
    pImpl->dispatcher.EmitCleared(uri);
    pImpl->sendNotification(Methods::DidClose, MakeObject({
        {"textDocument", MakeObject({{"uri", JSONValue(uri)}})}
    }));
}

void Session::Shutdown() {
    FUNC_SCOPE();
    // Only a live session moves to ShuttingDown; a concurrent teardown keeps its final state
    SessionState current = pImpl->state.load();
    do {
        if (pImpl->tornDown.load() || current == SessionState::ShuttingDown ||
            current == SessionState::Terminated || current == SessionState::Failed) {
            return;
        }
    } while (!pImpl->state.compare_exchange_weak(current, SessionState::ShuttingDown));
    pImpl->gracefulRequested.store(true);
    try {
        pImpl->sendRequest(Methods::Shutdown, std::nullopt, {}).get();
    } catch (const errors::LspException& e) {
        LOG_DEBUG("[{}] shutdown request failed: {}", Id(), e.what());
    }
    try {
        pImpl->sendNotification(Methods::Exit, std::nullopt);
    } catch (const errors::LspException& e) {
        LOG_DEBUG("[{}] exit notification failed: {}", Id(), e.what());
    }
    pImpl->teardown("shutdown requested", true);
}

void Session::Terminate(const std::string& reason) {
    pImpl->teardown(reason, false);
}

bool Session::WaitTerminated(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(pImpl->doneMutex);
    return pImpl->doneCv.wait_for(lk, timeout, [this]() { return pImpl->done; });
}

const RequestCorrelator& Session::Correlator() const {
    return *pImpl->correlator;
}

const DocumentTracker& Session::Documents() const {
    return *pImpl->documents;
}

} // namespace lsp
