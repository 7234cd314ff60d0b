//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DocumentTracker.cpp
// Purpose: Sync kind negotiation, content change shaping and the open-document table
//==========================================================================================================

#include "lsp/DocumentTracker.h"

namespace lsp {

namespace {
SyncKind syncKindFromNumber(const JSONValue& v) {
    if (!std::holds_alternative<int64_t>(v.value)) {
        return SyncKind::Full;
    }
    switch (std::get<int64_t>(v.value)) {
        case 0: return SyncKind::None;
        case 2: return SyncKind::Incremental;
        default: return SyncKind::Full;
    }
}
} // namespace

const char* SyncKindName(SyncKind kind) {
    switch (kind) {
        case SyncKind::None: return "none";
        case SyncKind::Full: return "full";
        case SyncKind::Incremental: return "incremental";
    }
    return "full";
}

SyncKind NegotiateSyncKind(const JSONValue& capabilities) {
    const JSONValue* sync = FindMember(capabilities, "textDocumentSync");
    if (sync == nullptr) {
        return SyncKind::Full;
    }
    if (sync->isObject()) {
        const JSONValue* change = FindMember(*sync, "change");
        return change != nullptr ? syncKindFromNumber(*change) : SyncKind::Full;
    }
    return syncKindFromNumber(*sync);
}

JSONValue BuildContentChanges(SyncKind kind, const std::string& fullText,
                              const std::vector<TextDocumentContentChange>& changes) {
    std::vector<JSONValue> out;
    if (kind == SyncKind::Incremental && !changes.empty()) {
        out.reserve(changes.size());
        for (const auto& change : changes) {
            out.push_back(ToJSON(change));
        }
    } else {
        out.push_back(MakeObject({{"text", JSONValue(fullText)}}));
    }
    return MakeArray(std::move(out));
}

void DocumentTracker::Open(const std::string& uri, int64_t version) {
    std::lock_guard<std::mutex> lk(mutex);
    versions[uri] = version;
}

bool DocumentTracker::Change(const std::string& uri, int64_t version) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = versions.find(uri);
    if (it == versions.end()) {
        return false;
    }
    it->second = version;
    return true;
}

bool DocumentTracker::Close(const std::string& uri) {
    std::lock_guard<std::mutex> lk(mutex);
    return versions.erase(uri) > 0;
}

bool DocumentTracker::IsOpen(const std::string& uri) const {
    std::lock_guard<std::mutex> lk(mutex);
    return versions.count(uri) > 0;
}

std::optional<int64_t> DocumentTracker::VersionOf(const std::string& uri) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = versions.find(uri);
    if (it == versions.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DocumentTracker::AcceptsDiagnostics(const std::string& uri, std::optional<int64_t> version) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = versions.find(uri);
    if (it == versions.end()) {
        return false;
    }
    return !version.has_value() || version.value() >= it->second;
}

std::vector<std::string> DocumentTracker::Clear() {
    std::unordered_map<std::string, int64_t> removed;
    {
        std::lock_guard<std::mutex> lk(mutex);
        removed.swap(versions);
    }
    std::vector<std::string> uris;
    uris.reserve(removed.size());
    for (const auto& [uri, version] : removed) {
        (void)version;
        uris.push_back(uri);
    }
    return uris;
}

std::size_t DocumentTracker::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return versions.size();
}

} // namespace lsp
