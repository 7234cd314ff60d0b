//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Request correlation, single-point resolution of response/timeout/cancel, timeout policy
//==========================================================================================================

#include <algorithm>
#include <format>
#include <vector>

#include "logging/Logger.h"
#include "lsp/Protocol.h"
#include "lsp/RequestCorrelator.h"
#include "lsp/errors/Errors.h"

namespace lsp {

PendingCall RequestCorrelator::Register(const std::string& method,
                                        const std::optional<std::string>& callerToken,
                                        std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    const int64_t id = nextId.fetch_add(1);
    std::promise<JSONValue> slot;
    std::future<JSONValue> fut = slot.get_future();
    {
        std::lock_guard<std::mutex> lk(pendingMutex);
        pending.emplace(id, std::move(slot));
    }
    if (callerToken.has_value()) {
        std::lock_guard<std::mutex> lk(tokensMutex);
        auto [it, inserted] = tokenToId.insert_or_assign(callerToken.value(), id);
        (void)it;
        if (!inserted) {
            LOG_DEBUG("Caller token '{}' reused; now tracks request {}", callerToken.value(), id);
        }
    }
    return PendingCall(shared_from_this(), id, callerToken, std::move(fut), method, timeout);
}

bool RequestCorrelator::Resolve(int64_t id, JSONValue message) {
    std::promise<JSONValue> slot;
    {
        std::lock_guard<std::mutex> lk(pendingMutex);
        auto it = pending.find(id);
        if (it == pending.end()) {
            return false;
        }
        slot = std::move(it->second);
        pending.erase(it);
    }
    slot.set_value(std::move(message));
    return true;
}

std::optional<int64_t> RequestCorrelator::Cancel(const std::string& callerToken) {
    int64_t id = 0;
    {
        std::lock_guard<std::mutex> tokensLock(tokensMutex);
        auto it = tokenToId.find(callerToken);
        if (it == tokenToId.end()) {
            return std::nullopt;
        }
        id = it->second;
        tokenToId.erase(it);
        // Marked while the token lock is held so Finish() can never observe "token gone, not canceled"
        std::lock_guard<std::mutex> canceledLock(canceledMutex);
        canceledIds.insert(id);
    }
    std::promise<JSONValue> dropped;
    {
        std::lock_guard<std::mutex> lk(pendingMutex);
        auto it = pending.find(id);
        if (it != pending.end()) {
            dropped = std::move(it->second);
            pending.erase(it);
        }
    }
    return id;
}

bool RequestCorrelator::Finish(int64_t id, const std::optional<std::string>& callerToken) {
    std::lock_guard<std::mutex> tokensLock(tokensMutex);
    if (callerToken.has_value()) {
        auto it = tokenToId.find(callerToken.value());
        if (it != tokenToId.end() && it->second == id) {
            tokenToId.erase(it);
        }
    }
    std::lock_guard<std::mutex> canceledLock(canceledMutex);
    return canceledIds.erase(id) > 0;
}

void RequestCorrelator::Abandon(int64_t id, const std::optional<std::string>& callerToken) {
    (void)Finish(id, callerToken);
    std::promise<JSONValue> dropped;
    {
        std::lock_guard<std::mutex> lk(pendingMutex);
        auto it = pending.find(id);
        if (it != pending.end()) {
            dropped = std::move(it->second);
            pending.erase(it);
        }
    }
}

std::size_t RequestCorrelator::FailAll() {
    std::unordered_map<int64_t, std::promise<JSONValue>> dropped;
    {
        std::lock_guard<std::mutex> lk(pendingMutex);
        dropped.swap(pending);
    }
    // Promises are destroyed here, outside the lock; waiters see broken_promise
    return dropped.size();
}

std::size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lk(pendingMutex);
    return pending.size();
}

std::size_t RequestCorrelator::TokenCount() const {
    std::lock_guard<std::mutex> lk(tokensMutex);
    return tokenToId.size();
}

std::size_t RequestCorrelator::CanceledCount() const {
    std::lock_guard<std::mutex> lk(canceledMutex);
    return canceledIds.size();
}

bool RequestCorrelator::IsPending(int64_t id) const {
    std::lock_guard<std::mutex> lk(pendingMutex);
    return pending.count(id) > 0;
}

//----------------------------------------------------------------------------------------------------------
// PendingCall
//----------------------------------------------------------------------------------------------------------
PendingCall::PendingCall(std::shared_ptr<RequestCorrelator> correlator, int64_t id,
                         std::optional<std::string> callerToken, std::future<JSONValue> response,
                         std::string method, std::chrono::milliseconds timeout)
    : correlator(std::move(correlator)), id(id), callerToken(std::move(callerToken)),
      response(std::move(response)), method(std::move(method)), timeout(timeout),
      deadline(std::chrono::steady_clock::now() + timeout) {}

PendingCall::PendingCall(PendingCall&& other) noexcept
    : correlator(std::move(other.correlator)), id(other.id), callerToken(std::move(other.callerToken)),
      response(std::move(other.response)), method(std::move(other.method)), timeout(other.timeout),
      deadline(other.deadline), finished(other.finished) {
    other.finished = true;
}

PendingCall::~PendingCall() {
    if (!finished && correlator) {
        correlator->Abandon(id, callerToken);
    }
}

void PendingCall::Abandon() {
    if (!finished && correlator) {
        correlator->Abandon(id, callerToken);
    }
    finished = true;
}

JSONValue PendingCall::Await() {
    using errors::ErrorCategory;
    if (finished || !response.valid()) {
        throw errors::makeException(ErrorCategory::InvalidArgument,
                                    std::format("LSP request {} was already resolved", method), method);
    }

    if (response.wait_until(deadline) != std::future_status::ready) {
        correlator->Abandon(id, callerToken);
        finished = true;
        LOG_WARN("LSP request {} (id={}) timed out after {} ms", method, id, timeout.count());
        throw errors::makeException(ErrorCategory::Timeout,
                                    std::format("LSP request {} timed out after {} ms", method, timeout.count()),
                                    method);
    }

    const bool canceled = correlator->Finish(id, callerToken);
    finished = true;
    if (canceled) {
        LOG_DEBUG("LSP request {} (id={}) resolved as canceled", method, id);
        throw errors::makeException(ErrorCategory::Canceled,
                                    std::format("LSP request {} was canceled", method), method);
    }

    JSONValue message;
    try {
        message = response.get();
    } catch (const std::future_error&) {
        throw errors::makeException(ErrorCategory::ConnectionClosed,
                                    std::format("LSP connection closed while waiting for {}", method), method);
    }

    const JSONValue* err = FindMember(message, "error");
    if (err != nullptr && !err->isNull()) {
        throw errors::LspException(errors::lspErrorFromErrorValue(*err, method));
    }
    if (const JSONValue* result = FindMember(message, "result")) {
        return *result;
    }
    return JSONValue(nullptr);
}

std::chrono::milliseconds EffectiveTimeout(const std::string& method, std::optional<int64_t> requestedMs,
                                           const TimeoutPolicy& policy) {
    const auto cap = std::clamp(policy.maxTimeout, std::chrono::milliseconds(1), kHardMaxTimeout);
    if (requestedMs.has_value() && requestedMs.value() > 0) {
        return std::min(std::chrono::milliseconds(requestedMs.value()), cap);
    }
    std::chrono::milliseconds timeout = policy.defaultTimeout;
    if (method == Methods::Initialize) {
        timeout = policy.initializeTimeout;
    } else if (method == Methods::WorkspaceSymbol) {
        timeout = policy.workspaceSymbolTimeout;
    }
    return std::clamp(timeout, std::chrono::milliseconds(1), cap);
}

} // namespace lsp
