//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.h
// Purpose: Table of live sessions keyed by session id
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lsp/Session.h"

namespace lsp {

//==========================================================================================================
// SessionRegistry
// Purpose: Owns the live sessions of one engine. All operations take a single lock and never call into a
//          session while holding it, so a session's termination handler may remove itself safely.
// Notes:
//   Remove returns the removed session so the caller decides where its last reference is dropped.
//==========================================================================================================
class SessionRegistry {
public:
    // False when the id is already taken; the registry is left unchanged.
    bool Insert(std::shared_ptr<Session> session);
    std::shared_ptr<Session> Find(const std::string& sessionId) const;
    // No-op (returns nullptr) for an unknown id.
    std::shared_ptr<Session> Remove(const std::string& sessionId);
    std::vector<std::string> Ids() const;
    std::vector<std::shared_ptr<Session>> Snapshot() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
};

} // namespace lsp
