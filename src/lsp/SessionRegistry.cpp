//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.cpp
// Purpose: Table of live sessions keyed by session id
//==========================================================================================================

#include <algorithm>

#include "lsp/SessionRegistry.h"

namespace lsp {

bool SessionRegistry::Insert(std::shared_ptr<Session> session) {
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lk(mutex);
    const std::string id = session->Id();
    return sessions.emplace(id, std::move(session)).second;
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = sessions.find(sessionId);
    return it == sessions.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::Remove(const std::string& sessionId) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        return nullptr;
    }
    auto session = std::move(it->second);
    sessions.erase(it);
    return session;
}

std::vector<std::string> SessionRegistry::Ids() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mutex);
        ids.reserve(sessions.size());
        for (const auto& [id, session] : sessions) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions.size());
    for (const auto& [id, session] : sessions) {
        out.push_back(session);
    }
    return out;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return sessions.size();
}

} // namespace lsp
