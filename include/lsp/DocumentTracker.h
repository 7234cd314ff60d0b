//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DocumentTracker.h
// Purpose: Open-document versions and negotiated text synchronization mode for one session
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lsp/JSONRPCTypes.h"
#include "lsp/Protocol.h"

namespace lsp {

enum class SyncKind {
    None = 0,
    Full = 1,
    Incremental = 2
};

const char* SyncKindName(SyncKind kind);

// Reads capabilities.textDocumentSync (bare number or {change: number}); anything unrecognized is Full.
SyncKind NegotiateSyncKind(const JSONValue& capabilities);

// Builds didChange contentChanges: range edits verbatim under Incremental when any were supplied,
// otherwise a single full replacement [{text}].
JSONValue BuildContentChanges(SyncKind kind, const std::string& fullText,
                              const std::vector<TextDocumentContentChange>& changes);

//==========================================================================================================
// DocumentTracker
// Purpose: uri -> last version sent by the host. Only URIs the host opened are ever present.
//==========================================================================================================
class DocumentTracker {
public:
    void SetSyncKind(SyncKind kind) { syncKind.store(kind); }
    SyncKind GetSyncKind() const { return syncKind.load(); }

    // Records (or re-records) an opened document.
    void Open(const std::string& uri, int64_t version);

    // Updates the version of an open document. Returns false when the URI is not open.
    bool Change(const std::string& uri, int64_t version);

    // Forgets the URI. Returns false when it was not open.
    bool Close(const std::string& uri);

    bool IsOpen(const std::string& uri) const;
    std::optional<int64_t> VersionOf(const std::string& uri) const;

    // Diagnostics gate: URI open and (no version or version >= recorded version).
    bool AcceptsDiagnostics(const std::string& uri, std::optional<int64_t> version) const;

    // Removes everything; returns the URIs that were open so their diagnostics can be cleared.
    std::vector<std::string> Clear();

    std::size_t Size() const;

private:
    std::atomic<SyncKind> syncKind{SyncKind::Full};
    mutable std::mutex mutex;
    std::unordered_map<std::string, int64_t> versions;
};

} // namespace lsp
