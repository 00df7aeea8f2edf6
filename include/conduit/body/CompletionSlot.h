#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "conduit/body/Body.h"
#include "conduit/body/ResponseFlags.h"
#include "conduit/common/noncopyable.h"

namespace conduit {
namespace body {

// Receives the final byte count and outcome of a body stream.
using CompletionCallback = std::function<void(uint64_t bytes, ResponseFlags flags)>;

// Single-use holder for a completion callback. take() hands the callback to
// exactly one caller; every later take() returns an empty function.
class CompletionSlot : common::noncopyable {
public:
    CompletionSlot() = default;
    explicit CompletionSlot(CompletionCallback callback) : callback_(std::move(callback)) {}

    CompletionCallback take();
    bool consumed() const;

private:
    mutable std::mutex mutex_;
    CompletionCallback callback_;
};

// Shared by an InstrumentedBody and its CompletionGuard.
class CompletionState : common::noncopyable {
public:
    CompletionState(BodyKind kind, CompletionCallback callback, ErrorClassifier classifier)
        : kind_(kind), classifier_(classifier), slot_(std::move(callback)) {}

    BodyKind kind() const { return kind_; }

    // Only the thread currently polling the body writes the counter.
    void addBytes(uint64_t n) { bytes_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t bytes() const { return bytes_.load(std::memory_order_relaxed); }

    ResponseFlags classify(const BodyError& error) const { return classifier_(error, kind_); }

    // Runs the callback if nobody has yet. Returns true for the caller that ran it.
    // Never throws: whatever the callback throws is logged at ERROR and dropped.
    bool complete(ResponseFlags flags) noexcept;

    bool completed() const { return slot_.consumed(); }

private:
    const BodyKind kind_;
    const ErrorClassifier classifier_;
    std::atomic<uint64_t> bytes_{0};
    CompletionSlot slot_;
};

// Every copy completes the shared state with empty flags on destruction, so
// an abandoned stream still reports. Only the first completion has effect.
class CompletionGuard {
public:
    explicit CompletionGuard(std::shared_ptr<CompletionState> state) : state_(std::move(state)) {}
    CompletionGuard(const CompletionGuard&) = default;
    CompletionGuard& operator=(const CompletionGuard&) = delete;
    CompletionGuard(CompletionGuard&&) = default;
    CompletionGuard& operator=(CompletionGuard&&) = delete;

    ~CompletionGuard() {
        if (state_) state_->complete(ResponseFlags());
    }

private:
    std::shared_ptr<CompletionState> state_;
};

} // namespace body
} // namespace conduit
