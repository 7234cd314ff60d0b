//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Per-session table correlating outbound request ids with waiting callers, plus cancellation tokens
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "lsp/Config.h"
#include "lsp/JSONRPCTypes.h"

namespace lsp {

class PendingCall;

//==========================================================================================================
// RequestCorrelator
// Purpose: Owns the id -> response slot map, the caller token -> id index and the canceled id set.
// Notes:
//   Each table has its own mutex. When two are needed the order is tokens -> canceled; the pending table
//   is never locked together with another table. No I/O happens under any of these locks.
//   A response slot is a std::promise<JSONValue> holding the whole response message; dropping the
//   promise (FailAll, Cancel) is observed by the waiter as std::future_errc::broken_promise.
//==========================================================================================================
class RequestCorrelator : public std::enable_shared_from_this<RequestCorrelator> {
public:
    RequestCorrelator() = default;
    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //======================================================================================================
    // Register
    // Purpose: Allocates the next id and registers its response slot (and caller token) before any bytes
    //          are written, so a fast response can never miss its waiter.
    // Args:
    //   method: Request method, kept for error messages.
    //   callerToken: Optional cancellation handle. A token already in use is re-pointed at the new id.
    //   timeout: Effective timeout; the deadline is fixed now.
    // Returns:
    //   PendingCall owning the waiter side.
    //======================================================================================================
    PendingCall Register(const std::string& method,
                         const std::optional<std::string>& callerToken,
                         std::chrono::milliseconds timeout);

    // Delivers a response message to the waiter registered under id. Returns false for unknown ids
    // (late responses after timeout/cancel, or ids we never issued).
    bool Resolve(int64_t id, JSONValue message);

    //======================================================================================================
    // Cancel
    // Purpose: Removes the token mapping, marks the id canceled and drops its pending slot.
    // Returns:
    //   The request id to announce via $/cancelRequest, or nullopt when the token is unknown.
    //======================================================================================================
    std::optional<int64_t> Cancel(const std::string& callerToken);

    // Resolution bookkeeping for a waiter: clears the token mapping (if it still points at id) and
    // consumes the canceled mark. Returns true when the id had been canceled.
    bool Finish(int64_t id, const std::optional<std::string>& callerToken);

    // Removes every trace of id (pending slot, token mapping, canceled mark). Used on timeout, write failure
    // and when a waiter is dropped unresolved.
    void Abandon(int64_t id, const std::optional<std::string>& callerToken);

    // Drops every pending slot; all waiters observe "connection closed". Returns how many were dropped.
    std::size_t FailAll();

    std::size_t PendingCount() const;
    std::size_t TokenCount() const;
    std::size_t CanceledCount() const;
    bool IsPending(int64_t id) const;

private:
    std::atomic<int64_t> nextId{1};

    mutable std::mutex pendingMutex;
    std::unordered_map<int64_t, std::promise<JSONValue>> pending;

    mutable std::mutex tokensMutex;
    std::unordered_map<std::string, int64_t> tokenToId;

    mutable std::mutex canceledMutex;
    std::unordered_set<int64_t> canceledIds;
};

//==========================================================================================================
// PendingCall
// Purpose: Waiter side of one outbound request. Await() is the single point where response, timeout and
//          cancellation are resolved. Destroying an unresolved PendingCall abandons its registration.
//==========================================================================================================
class PendingCall {
public:
    PendingCall(std::shared_ptr<RequestCorrelator> correlator, int64_t id,
                std::optional<std::string> callerToken, std::future<JSONValue> response,
                std::string method, std::chrono::milliseconds timeout);
    PendingCall(PendingCall&& other) noexcept;
    PendingCall& operator=(PendingCall&&) = delete;
    PendingCall(const PendingCall&) = delete;
    PendingCall& operator=(const PendingCall&) = delete;
    ~PendingCall();

    int64_t Id() const { return id; }
    const std::string& Method() const { return method; }

    //======================================================================================================
    // Await
    // Purpose: Blocks until the response arrives or the deadline passes.
    // Returns:
    //   The response `result` member (null when absent).
    // Throws:
    //   errors::LspException with category Timeout, Canceled, ConnectionClosed, or Protocol (server error).
    //======================================================================================================
    JSONValue Await();

    // Removes the registration without waiting (write failure path).
    void Abandon();

private:
    std::shared_ptr<RequestCorrelator> correlator;
    int64_t id;
    std::optional<std::string> callerToken;
    std::future<JSONValue> response;
    std::string method;
    std::chrono::milliseconds timeout;
    std::chrono::steady_clock::time_point deadline;
    bool finished{false};
};

//==========================================================================================================
// EffectiveTimeout
// Purpose: Caller value when present and positive, otherwise the per-method default: initialize,
//          workspace/symbol, everything else. The result never exceeds policy.maxTimeout or kHardMaxTimeout.
//==========================================================================================================
std::chrono::milliseconds EffectiveTimeout(const std::string& method, std::optional<int64_t> requestedMs,
                                           const TimeoutPolicy& policy);

} // namespace lsp
