//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: LSP method names, positional types and the host-facing request/response structures
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace lsp {
//==========================================================================================================
// LSP Protocol types and constants
// Purpose: Shared protocol structures and method names.
//==========================================================================================================
///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Lifecycle
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "initialized";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* Exit = "exit";
    constexpr const char* CancelRequest = "$/cancelRequest";

    // Document synchronization (client to server notifications)
    constexpr const char* DidOpen = "textDocument/didOpen";
    constexpr const char* DidChange = "textDocument/didChange";
    constexpr const char* DidClose = "textDocument/didClose";

    // Feature requests
    constexpr const char* Completion = "textDocument/completion";
    constexpr const char* Hover = "textDocument/hover";
    constexpr const char* Definition = "textDocument/definition";
    constexpr const char* References = "textDocument/references";
    constexpr const char* Rename = "textDocument/rename";
    constexpr const char* Implementation = "textDocument/implementation";
    constexpr const char* TypeDefinition = "textDocument/typeDefinition";
    constexpr const char* SignatureHelp = "textDocument/signatureHelp";
    constexpr const char* DocumentHighlight = "textDocument/documentHighlight";
    constexpr const char* DocumentSymbol = "textDocument/documentSymbol";
    constexpr const char* Formatting = "textDocument/formatting";
    constexpr const char* InlayHint = "textDocument/inlayHint";
    constexpr const char* SemanticTokensFull = "textDocument/semanticTokens/full";
    constexpr const char* CodeAction = "textDocument/codeAction";
    constexpr const char* CodeActionResolve = "codeAction/resolve";
    constexpr const char* WorkspaceSymbol = "workspace/symbol";
    constexpr const char* ExecuteCommand = "workspace/executeCommand";

    // Server to client
    constexpr const char* PublishDiagnostics = "textDocument/publishDiagnostics";
    constexpr const char* WorkspaceConfiguration = "workspace/configuration";
    constexpr const char* WorkspaceFolders = "workspace/workspaceFolders";
    constexpr const char* WorkDoneProgressCreate = "window/workDoneProgress/create";
    constexpr const char* LogMessage = "window/logMessage";
}

///////////////////////////////////////// Positions ///////////////////////////////////////////
// Zero-based line and UTF-16 character offset, as LSP defines them.
struct Position {
    int64_t line{0};
    int64_t character{0};
};

struct Range {
    Position start;
    Position end;
};

JSONValue ToJSON(const Position& position);
JSONValue ToJSON(const Range& range);

// One entry of a didChange contentChanges array. A change without range replaces the whole document.
struct TextDocumentContentChange {
    std::string text;
    std::optional<Range> range;
    std::optional<int64_t> rangeLength;
};

JSONValue ToJSON(const TextDocumentContentChange& change);

///////////////////////////////////////// Host requests ///////////////////////////////////////////
// Per-call knobs shared by all feature requests.
struct RequestOptions {
    std::optional<std::string> callerToken; // opaque handle for CancelRequest
    std::optional<int64_t> timeoutMs;       // zero or absent selects the per-method default
};

struct StartSessionRequest {
    std::string language;
    std::optional<std::string> rootUri;
    std::vector<std::string> workspaceFolders;  // folder URIs
    std::optional<JSONValue> initializationOptions;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    bool autoInstall{false};
    std::vector<std::string> preferredProviders;
    bool allowFallback{true};
};

struct StartSessionResult {
    std::string sessionId;
    JSONValue capabilities;
    std::string resolvedCommand;
    std::vector<std::string> resolvedArgs;
};

struct OpenDocumentRequest {
    std::string sessionId;
    std::string uri;
    std::string languageId;
    int64_t version{0};
    std::string text;
};

struct ChangeDocumentRequest {
    std::string sessionId;
    std::string uri;
    int64_t version{0};
    std::string text;                                // full document text after the edit
    std::vector<TextDocumentContentChange> changes;  // range edits, used only under incremental sync
};

struct CloseDocumentRequest {
    std::string sessionId;
    std::string uri;
};

struct PositionRequest {
    std::string sessionId;
    std::string uri;
    Position position;
    RequestOptions options;
};

struct ReferencesRequest {
    std::string sessionId;
    std::string uri;
    Position position;
    bool includeDeclaration{true};
    RequestOptions options;
};

struct RenameRequest {
    std::string sessionId;
    std::string uri;
    Position position;
    std::string newName;
    RequestOptions options;
};

struct DocumentRequest {
    std::string sessionId;
    std::string uri;
    RequestOptions options;
};

struct RangeRequest {
    std::string sessionId;
    std::string uri;
    Range range;
    RequestOptions options;
};

struct FormatDocumentRequest {
    std::string sessionId;
    std::string uri;
    int64_t tabSize{2};
    bool insertSpaces{true};
    RequestOptions options;
};

struct CodeActionsRequest {
    std::string sessionId;
    std::string uri;
    Range range;
    std::optional<JSONValue> diagnostics;  // array of LSP Diagnostic objects
    RequestOptions options;
};

struct ResolveCodeActionRequest {
    std::string sessionId;
    JSONValue action;
    RequestOptions options;
};

struct WorkspaceSymbolsRequest {
    std::string sessionId;
    std::string query;
    RequestOptions options;
};

struct ExecuteCommandRequest {
    std::string sessionId;
    std::string command;
    std::optional<JSONValue> arguments;
    RequestOptions options;
};

///////////////////////////////////////// Result shaping ///////////////////////////////////////////
// Normalizes definition-like results into [{uri, range}]. Location and LocationLink are accepted,
// a single object becomes a one-element array, anything else becomes [].
JSONValue NormalizeLocationResult(const JSONValue& raw);

// Replaces a null result with `fallback`; any other value is returned unchanged.
JSONValue NullAs(JSONValue raw, JSONValue fallback);

} // namespace lsp
