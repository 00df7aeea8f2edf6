#pragma once

#include <mutex>
#include <utility>

#include "conduit/common/noncopyable.h"
#include "conduit/tracing/Span.h"

namespace conduit {
namespace tracing {

// The SERVER span (downstream request) and CLIENT span (upstream call) of one
// request. Each slot has its own lock so server-side and client-side work do
// not serialize against each other.
class SpanState : common::noncopyable {
public:
    explicit SpanState(SpanPtr serverSpan) : serverSpan_(std::move(serverSpan)) {}

    // Installs the upstream span. A previous client span (earlier attempt) is
    // ended first.
    void setClientSpan(SpanPtr span);

    // Ends whichever spans are present and clears their slots, so repeated
    // calls are no-ops.
    void end();

    bool hasServerSpan() const;
    bool hasClientSpan() const;

    // Runs fn(Span&) under the slot lock when the slot is populated.
    template <typename Fn>
    bool withServerSpan(Fn&& fn) {
        std::lock_guard<std::mutex> lock(serverMutex_);
        if (!serverSpan_) return false;
        fn(*serverSpan_);
        return true;
    }

    template <typename Fn>
    bool withClientSpan(Fn&& fn) {
        std::lock_guard<std::mutex> lock(clientMutex_);
        if (!clientSpan_) return false;
        fn(*clientSpan_);
        return true;
    }

private:
    mutable std::mutex serverMutex_;
    SpanPtr serverSpan_;

    mutable std::mutex clientMutex_;
    SpanPtr clientSpan_;
};

} // namespace tracing
} // namespace conduit
