//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRequestRouter.h
// Purpose: Answers requests a language server sends to its client (reverse RPC)
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "lsp/JSONRPCTypes.h"

namespace lsp {

struct WorkspaceFolder {
    std::string uri;
    std::string name;
};

// Last non-empty path segment of a folder URI (trailing slash ignored), or "workspace" when there is none.
std::string WorkspaceFolderName(const std::string& uri);

std::vector<WorkspaceFolder> MakeWorkspaceFolders(const std::vector<std::string>& uris);

//==========================================================================================================
// ServerRequestRouter
// Purpose: Closed method table for server-initiated requests:
//   workspace/configuration        -> [{}, ...] one empty object per requested item
//   workspace/workspaceFolders     -> [{uri, name}, ...]
//   window/workDoneProgress/create -> null
//   $/cancelRequest (with an id)   -> null
//   anything else                  -> MethodNotFound error naming the method
//==========================================================================================================
class ServerRequestRouter {
public:
    explicit ServerRequestRouter(std::vector<WorkspaceFolder> folders);

    JSONRPCResponse Handle(const JSONRPCRequest& request) const;

private:
    JSONValue configurationResult(const JSONRPCRequest& request) const;
    JSONValue workspaceFoldersResult() const;

    std::vector<WorkspaceFolder> folders;
};

} // namespace lsp
