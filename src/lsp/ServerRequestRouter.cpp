//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRequestRouter.cpp
// Purpose: Default answers for server-initiated requests
//==========================================================================================================

#include "logging/Logger.h"
#include "lsp/Protocol.h"
#include "lsp/ServerRequestRouter.h"
#include "lsp/errors/Errors.h"

namespace lsp {

std::string WorkspaceFolderName(const std::string& uri) {
    std::string path = uri;
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.find_last_of('/');
    std::string segment = (slash == std::string::npos) ? path : path.substr(slash + 1);
    // "file:" alone (from "file:///") is a scheme, not a folder name
    if (segment.empty() || segment.back() == ':') {
        return "workspace";
    }
    return segment;
}

std::vector<WorkspaceFolder> MakeWorkspaceFolders(const std::vector<std::string>& uris) {
    std::vector<WorkspaceFolder> out;
    out.reserve(uris.size());
    for (const auto& uri : uris) {
        out.push_back(WorkspaceFolder{uri, WorkspaceFolderName(uri)});
    }
    return out;
}

ServerRequestRouter::ServerRequestRouter(std::vector<WorkspaceFolder> folders)
    : folders(std::move(folders)) {}

JSONRPCResponse ServerRequestRouter::Handle(const JSONRPCRequest& request) const {
    const std::string& method = request.method;
    if (method == Methods::WorkspaceConfiguration) {
        return JSONRPCResponse(request.id, configurationResult(request));
    }
    if (method == Methods::WorkspaceFolders) {
        return JSONRPCResponse(request.id, workspaceFoldersResult());
    }
    if (method == Methods::WorkDoneProgressCreate || method == Methods::CancelRequest) {
        return JSONRPCResponse(request.id, JSONValue(nullptr));
    }
    LOG_DEBUG("Unsupported server request {}", method);
    return *errors::makeErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                      "Method not found: " + method);
}

JSONValue ServerRequestRouter::configurationResult(const JSONRPCRequest& request) const {
    std::size_t count = 0;
    if (request.params.has_value()) {
        const JSONValue* items = FindMember(request.params.value(), "items");
        if (items != nullptr && items->isArray()) {
            count = std::get<JSONValue::Array>(items->value).size();
        }
    }
    std::vector<JSONValue> out(count, JSONValue(JSONValue::Object{}));
    return MakeArray(std::move(out));
}

JSONValue ServerRequestRouter::workspaceFoldersResult() const {
    std::vector<JSONValue> out;
    out.reserve(folders.size());
    for (const auto& folder : folders) {
        out.push_back(MakeObject({
            {"uri", JSONValue(folder.uri)},
            {"name", JSONValue(folder.name)}
        }));
    }
    return MakeArray(std::move(out));
}

} // namespace lsp
