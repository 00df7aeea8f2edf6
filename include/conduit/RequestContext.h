#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "conduit/common/noncopyable.h"
#include "conduit/tracing/RequestId.h"
#include "conduit/tracing/SpanState.h"

namespace conduit {

// Observability state of one in-flight request:
// 1. the correlation id chosen by the request-id policy
// 2. the server/client spans (absent when tracing is off)
// Created by RequestObserver::onRequest(), owned by the proxy's session.
class RequestContext : common::noncopyable {
public:
    RequestContext(std::optional<tracing::RequestId> requestId,
                   std::shared_ptr<tracing::SpanState> spanState)
        : requestId_(std::move(requestId)),
          spanState_(std::move(spanState)),
          start_(std::chrono::steady_clock::now()) {}

    // Ends any span still open. Never throws, whatever the span backend does.
    ~RequestContext();

    // Ends the spans. Idempotent; a throwing Span::end() propagates to the caller.
    void teardown() {
        if (spanState_) spanState_->end();
    }

    const std::optional<tracing::RequestId>& requestId() const { return requestId_; }

    // Shared with body completion callbacks that outlive a poll.
    const std::shared_ptr<tracing::SpanState>& spanState() const { return spanState_; }

    // When the request head was observed; the access log reports durations from here.
    std::chrono::steady_clock::time_point start() const { return start_; }

private:
    const std::optional<tracing::RequestId> requestId_;
    const std::shared_ptr<tracing::SpanState> spanState_;
    const std::chrono::steady_clock::time_point start_;
};

} // namespace conduit
