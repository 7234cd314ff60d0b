//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: LSP client engine implementation
//==========================================================================================================

#include <format>
#include <random>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "logging/Logger.h"
#include "lsp/Client.h"
#include "lsp/SessionRegistry.h"
#include "lsp/errors/Errors.h"

namespace lsp {

namespace net = boost::asio;

namespace {
template <typename T>
std::future<T> failedFuture(const errors::LspException& e) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(e));
    return p.get_future();
}

JSONValue textDocumentId(const std::string& uri) {
    return MakeObject({{"uri", JSONValue(uri)}});
}

JSONValue positionParams(const std::string& uri, const Position& position) {
    return MakeObject({
        {"textDocument", textDocumentId(uri)},
        {"position", ToJSON(position)}
    });
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        out += ' ';
        out += a;
    }
    return out;
}
} // namespace

//==========================================================================================================
// SessionBook
// Purpose: Registry and status reporting shared with termination handlers. Handlers running on a worker
//          may hold the last reference, so it owns nothing that a worker runs on.
//==========================================================================================================
struct SessionBook {
    SessionRegistry registry;
    std::shared_ptr<IEventSink> sink;

    void emitStatus(const std::string& languageId, ServerStatus status,
                    const std::optional<std::string>& sessionId, const std::optional<std::string>& reason) {
        if (!sink) {
            return;
        }
        try {
            sink->Emit(Topics::ServerStatus, MakeStatusPayload(languageId, status, sessionId, reason));
        } catch (const std::exception& e) {
            LOG_WARN("Event sink failed for {}: {}", Topics::ServerStatus, e.what());
        }
    }
};

//==========================================================================================================
// Client::Impl
//==========================================================================================================
class Client::Impl {
public:
    using Shape = std::function<JSONValue(JSONValue)>;

    net::io_context io;
    net::executor_work_guard<net::io_context::executor_type> work;
    std::vector<std::thread> workers;

    EngineOptions options;
    std::shared_ptr<ILaunchResolver> resolver;
    std::shared_ptr<IProcessLauncher> launcher;
    std::shared_ptr<SessionBook> book;
    SessionRegistry& registry;

    Impl(EngineOptions opts, std::shared_ptr<ILaunchResolver> res, std::shared_ptr<IEventSink> eventSink,
         std::shared_ptr<IProcessLauncher> processLauncher)
        : work(net::make_work_guard(io)),
          options(std::move(opts)),
          resolver(res ? std::move(res) : std::make_shared<StaticLaunchResolver>()),
          launcher(processLauncher ? std::move(processLauncher) : std::make_shared<PosixProcessLauncher>()),
          book(std::make_shared<SessionBook>()),
          registry(book->registry) {
        book->sink = std::move(eventSink);
        IgnoreSigpipe();
        const unsigned int n = options.workerThreads == 0 ? 1 : options.workerThreads;
        workers.reserve(n);
        for (unsigned int i = 0; i < n; ++i) {
            workers.emplace_back([this]() { io.run(); });
        }
        LOG_INFO("LSP engine started ({} worker thread(s))", n);
    }

    // Never runs on a worker: workers only reach the SessionBook.
    ~Impl() {
        work.reset();
        io.stop();
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
        // Sessions still registered reference io; release them before it goes away
        book.reset();
    }

    void emitStatus(const std::string& languageId, ServerStatus status,
                    const std::optional<std::string>& sessionId, const std::optional<std::string>& reason) {
        book->emitStatus(languageId, status, sessionId, reason);
    }

    std::string newSessionId() {
        static thread_local std::mt19937_64 gen{std::random_device{}()};
        for (;;) {
            std::string id = std::format("lsp-{:016x}", gen());
            if (!registry.Find(id)) {
                return id;
            }
        }
    }

    std::shared_ptr<Session> requireSession(const std::string& sessionId) const {
        auto session = registry.Find(sessionId);
        if (!session) {
            throw errors::makeException(errors::ErrorCategory::SessionNotFound,
                std::format("LSP session not found: {}", sessionId));
        }
        return session;
    }

    LaunchSpec resolveLaunch(const std::string& languageId, const StartSessionRequest& request) {
        if (request.command.has_value() && !request.command->empty()) {
            if (!resolver->IsCommandAllowed(request.command.value())) {
                throw errors::makeException(errors::ErrorCategory::CommandNotTrusted,
                    std::format("LSP_COMMAND_NOT_TRUSTED: '{}' is not an allowed language server command",
                                request.command.value()));
            }
            return LaunchSpec{request.command.value(), request.args.value_or(std::vector<std::string>{}), true};
        }

        LaunchSpec launch;
        try {
            launch = resolver->ResolveLaunch(languageId, request.preferredProviders, request.autoInstall);
        } catch (const errors::LspException& e) {
            if (!request.allowFallback) {
                throw;
            }
            auto [command, args] = DefaultServerForLanguage(languageId);
            LOG_WARN("Launch resolution for '{}' failed ({}); falling back to {}", languageId, e.what(), command);
            // Built-in defaults are engine-owned and need no allow-list entry
            return LaunchSpec{std::move(command), std::move(args), true};
        }
        if (request.args.has_value()) {
            launch.args = request.args.value();
        }
        if (!launch.trusted && !resolver->IsCommandAllowed(launch.command)) {
            throw errors::makeException(errors::ErrorCategory::CommandNotTrusted,
                std::format("LSP_COMMAND_NOT_TRUSTED: resolved command '{}' is not allowed", launch.command));
        }
        return launch;
    }

    Session::TerminationHandler makeTerminationHandler(const std::string& languageId) {
        std::weak_ptr<SessionBook> weak = book;
        return [weak, languageId](const std::string& sessionId, const std::string& reason, bool graceful) {
            auto shared = weak.lock();
            if (!shared) {
                return;
            }
            auto removed = shared->registry.Remove(sessionId);
            const bool failed = removed && removed->State() == SessionState::Failed;
            LOG_DEBUG("[{}] removed from registry ({}, graceful={})", sessionId, reason, graceful);
            shared->emitStatus(languageId, failed ? ServerStatus::Error : ServerStatus::Disconnected,
                             sessionId, reason);
        };
    }

    StartSessionResult startSession(const StartSessionRequest& request) {
        const std::string languageId = resolver->NormalizeLanguageId(request.language);
        if (languageId.empty()) {
            throw errors::makeException(errors::ErrorCategory::InvalidArgument, "LSP language is required");
        }

        LaunchSpec launch;
        try {
            launch = resolveLaunch(languageId, request);
        } catch (const errors::LspException& e) {
            emitStatus(languageId, ServerStatus::Error, std::nullopt, std::string(e.what()));
            throw;
        }
        emitStatus(languageId, ServerStatus::Starting, std::nullopt, std::nullopt);

        std::unique_ptr<IChildProcess> child;
        try {
            child = launcher->Spawn(launch.command, launch.args);
        } catch (const errors::LspException& e) {
            LOG_ERROR("Spawn failed for '{}': {}", languageId, e.what());
            emitStatus(languageId, ServerStatus::Error, std::nullopt, std::string(e.what()));
            throw;
        }

        SessionConfig config;
        config.sessionId = newSessionId();
        config.languageId = languageId;
        config.rootUri = request.rootUri;
        for (const auto& uri : request.workspaceFolders) {
            config.workspaceFolders.push_back(WorkspaceFolder{uri, WorkspaceFolderName(uri)});
        }
        config.options = options;
        const std::string sessionId = config.sessionId;
        LOG_INFO("[{}] spawned {}{} (pid {}) for {}", sessionId, launch.command, joinArgs(launch.args),
                 child->Pid(), languageId);

        auto session = std::make_shared<Session>(io, std::move(config), std::move(child), book->sink);
        if (!registry.Insert(session)) {
            session->Terminate("duplicate session id");
            throw errors::makeException(errors::ErrorCategory::InvalidArgument,
                std::format("LSP session id collision: {}", sessionId));
        }
        session->Start(makeTerminationHandler(languageId));

        JSONValue initResult;
        try {
            initResult = session->Initialize(request.initializationOptions);
        } catch (const errors::LspException& e) {
            // Teardown reports the Error status and unregisters the session
            session->Terminate(std::format("initialize failed: {}", e.what()));
            throw;
        }

        emitStatus(languageId, ServerStatus::Connected, sessionId, std::nullopt);
        StartSessionResult result;
        result.sessionId = sessionId;
        result.capabilities = session->Capabilities();
        result.resolvedCommand = launch.command;
        result.resolvedArgs = launch.args;
        return result;
    }

    std::future<JSONValue> call(const std::string& sessionId, const char* method, JSONValue params,
                                const RequestOptions& requestOptions, Shape shape = nullptr) {
        std::shared_ptr<Session> session;
        try {
            session = requireSession(sessionId);
        } catch (const errors::LspException& e) {
            return failedFuture<JSONValue>(e);
        }
        auto pending = session->SendRequest(method, std::move(params), requestOptions);
        if (!shape) {
            return pending;
        }
        return std::async(std::launch::deferred,
            [pending = std::move(pending), shape = std::move(shape)]() mutable {
                return shape(pending.get());
            });
    }

    static Shape nullAs(JSONValue fallback) {
        return [fallback](JSONValue raw) { return NullAs(std::move(raw), fallback); };
    }

    static Shape locations() {
        return [](JSONValue raw) { return NormalizeLocationResult(raw); };
    }
};

//==========================================================================================================
// Client
//==========================================================================================================
Client::Client(EngineOptions options, std::shared_ptr<ILaunchResolver> resolver,
               std::shared_ptr<IEventSink> sink, std::shared_ptr<IProcessLauncher> launcher)
    : pImpl(std::make_shared<Impl>(std::move(options), std::move(resolver), std::move(sink), std::move(launcher))) {}

Client::~Client() {
    ShutdownAll();
}

std::future<StartSessionResult> Client::StartSession(const StartSessionRequest& request) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [impl = pImpl, request]() {
        return impl->startSession(request);
    });
}

std::future<void> Client::ShutdownSession(const std::string& sessionId) {
    FUNC_SCOPE();
    auto session = pImpl->registry.Find(sessionId);
    if (!session) {
        LOG_DEBUG("[{}] shutdown for unknown session ignored", sessionId);
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
    return std::async(std::launch::async, [session]() {
        session->Shutdown();
    });
}

std::vector<std::string> Client::ListSessions() const {
    return pImpl->registry.Ids();
}

std::optional<SessionState> Client::GetSessionState(const std::string& sessionId) const {
    auto session = pImpl->registry.Find(sessionId);
    if (!session) {
        return std::nullopt;
    }
    return session->State();
}

void Client::ShutdownAll() {
    FUNC_SCOPE();
    std::vector<std::future<void>> pending;
    for (const auto& session : pImpl->registry.Snapshot()) {
        pending.push_back(std::async(std::launch::async, [session]() { session->Shutdown(); }));
    }
    for (auto& f : pending) {
        f.get();
    }
}

void Client::OpenDocument(const OpenDocumentRequest& request) {
    pImpl->requireSession(request.sessionId)->OpenDocument(request.uri, request.languageId, request.version,
                                                           request.text);
}

void Client::ChangeDocument(const ChangeDocumentRequest& request) {
    pImpl->requireSession(request.sessionId)->ChangeDocument(request.uri, request.version, request.text,
                                                             request.changes);
}

void Client::CloseDocument(const CloseDocumentRequest& request) {
    pImpl->requireSession(request.sessionId)->CloseDocument(request.uri);
}

bool Client::CancelRequest(const std::string& sessionId, const std::string& callerToken) {
    auto session = pImpl->registry.Find(sessionId);
    if (!session) {
        return false;
    }
    return session->CancelRequest(callerToken);
}

std::future<JSONValue> Client::Completion(const PositionRequest& request) {
    return pImpl->call(request.sessionId, Methods::Completion,
                       positionParams(request.uri, request.position), request.options);
}

std::future<JSONValue> Client::Hover(const PositionRequest& request) {
    return pImpl->call(request.sessionId, Methods::Hover,
                       positionParams(request.uri, request.position), request.options);
}

std::future<JSONValue> Client::Definition(const PositionRequest& request) {
    return pImpl->call(request.sessionId, Methods::Definition,
                       positionParams(request.uri, request.position), request.options, Impl::locations());
}

std::future<JSONValue> Client::References(const ReferencesRequest& request) {
    JSONValue params = positionParams(request.uri, request.position);
    SetMember(params, "context", MakeObject({{"includeDeclaration", JSONValue(request.includeDeclaration)}}));
    return pImpl->call(request.sessionId, Methods::References, std::move(params), request.options,
                       Impl::nullAs(MakeArray({})));
}

std::future<JSONValue> Client::Rename(const RenameRequest& request) {
    JSONValue params = positionParams(request.uri, request.position);
    SetMember(params, "newName", JSONValue(request.newName));
    return pImpl->call(request.sessionId, Methods::Rename, std::move(params), request.options);
}

std::future<JSONValue> Client::Implementation(const PositionRequest& request) {
    return pImpl->call(request.sessionId, Methods::Implementation,
                       positionParams(request.uri, request.position), request.options, Impl::locations());
}

std::future<JSONValue> Client::TypeDefinition(const PositionRequest& request) {
    return pImpl->call(request.sessionId, Methods::TypeDefinition,
                       positionParams(request.uri, request.position), request.options, Impl::locations());
}

std::future<JSONValue> Client::SignatureHelp(const PositionRequest& request) {
    return pImpl->call(request.sessionId, Methods::SignatureHelp,
                       positionParams(request.uri, request.position), request.options);
}

std::future<JSONValue> Client::DocumentHighlights(const PositionRequest& request) {
    return pImpl->call(request.sessionId, Methods::DocumentHighlight,
                       positionParams(request.uri, request.position), request.options,
                       Impl::nullAs(MakeArray({})));
}

std::future<JSONValue> Client::DocumentSymbols(const DocumentRequest& request) {
    return pImpl->call(request.sessionId, Methods::DocumentSymbol,
                       MakeObject({{"textDocument", textDocumentId(request.uri)}}), request.options,
                       Impl::nullAs(MakeArray({})));
}

std::future<JSONValue> Client::FormatDocument(const FormatDocumentRequest& request) {
    JSONValue params = MakeObject({
        {"textDocument", textDocumentId(request.uri)},
        {"options", MakeObject({
            {"tabSize", JSONValue(request.tabSize)},
            {"insertSpaces", JSONValue(request.insertSpaces)}
        })}
    });
    return pImpl->call(request.sessionId, Methods::Formatting, std::move(params), request.options,
                       Impl::nullAs(MakeArray({})));
}

std::future<JSONValue> Client::InlayHints(const RangeRequest& request) {
    JSONValue params = MakeObject({
        {"textDocument", textDocumentId(request.uri)},
        {"range", ToJSON(request.range)}
    });
    return pImpl->call(request.sessionId, Methods::InlayHint, std::move(params), request.options,
                       Impl::nullAs(MakeArray({})));
}

std::future<JSONValue> Client::SemanticTokensFull(const DocumentRequest& request) {
    return pImpl->call(request.sessionId, Methods::SemanticTokensFull,
                       MakeObject({{"textDocument", textDocumentId(request.uri)}}), request.options);
}

std::future<JSONValue> Client::CodeActions(const CodeActionsRequest& request) {
    JSONValue diagnostics = request.diagnostics.has_value() && request.diagnostics->isArray()
                                ? request.diagnostics.value() : MakeArray({});
    JSONValue params = MakeObject({
        {"textDocument", textDocumentId(request.uri)},
        {"range", ToJSON(request.range)},
        {"context", MakeObject({
            {"diagnostics", std::move(diagnostics)},
            {"triggerKind", JSONValue(static_cast<int64_t>(1))}
        })}
    });
    return pImpl->call(request.sessionId, Methods::CodeAction, std::move(params), request.options,
                       Impl::nullAs(MakeArray({})));
}

std::future<JSONValue> Client::ResolveCodeAction(const ResolveCodeActionRequest& request) {
    return pImpl->call(request.sessionId, Methods::CodeActionResolve, request.action, request.options,
                       Impl::nullAs(JSONValue(JSONValue::Object{})));
}

std::future<JSONValue> Client::WorkspaceSymbols(const WorkspaceSymbolsRequest& request) {
    return pImpl->call(request.sessionId, Methods::WorkspaceSymbol,
                       MakeObject({{"query", JSONValue(request.query)}}), request.options,
                       Impl::nullAs(MakeArray({})));
}

std::future<JSONValue> Client::ExecuteCommand(const ExecuteCommandRequest& request) {
    JSONValue params = MakeObject({
        {"command", JSONValue(request.command)},
        {"arguments", request.arguments.has_value() ? request.arguments.value() : MakeArray({})}
    });
    return pImpl->call(request.sessionId, Methods::ExecuteCommand, std::move(params), request.options);
}

std::unique_ptr<IClient> ClientFactory::CreateClient(EngineOptions options,
                                                     std::shared_ptr<ILaunchResolver> resolver,
                                                     std::shared_ptr<IEventSink> sink) {
    return std::make_unique<Client>(std::move(options), std::move(resolver), std::move(sink));
}

} // namespace lsp
