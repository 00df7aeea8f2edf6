#pragma once

#include <memory>
#include <string>

#include "conduit/RequestContext.h"
#include "conduit/body/Body.h"
#include "conduit/common/noncopyable.h"
#include "conduit/monitor/AccessLogger.h"
#include "conduit/monitor/Stats.h"
#include "conduit/protocol/HttpRequest.h"
#include "conduit/protocol/HttpResponse.h"
#include "conduit/tracing/RequestIdManager.h"
#include "conduit/tracing/Span.h"

namespace conduit {

// Entry point the proxy calls at each stage of a request. One instance per
// listener, shared by all of its connections. Collaborators are borrowed and
// must outlive the observer and every body it wraps; any of them may be null.
class RequestObserver : common::noncopyable {
public:
    RequestObserver(tracing::RequestIdManager requestIds,
                    tracing::Tracer* tracer,
                    monitor::Stats* stats,
                    monitor::AccessLogger* accessLog);

    // Request head parsed: apply the X-Request-ID policy (mutates the outbound
    // request) and open the server span.
    std::unique_ptr<RequestContext> onRequest(protocol::HttpRequest* request) const;

    // Upstream call issued: open the client span.
    void startClientSpan(const RequestContext& ctx,
                         const std::string& name,
                         const std::string& upstreamCluster,
                         const std::string& upstreamAddress) const;

    // Wrap a body so its completion lands in stats, the access log and the
    // server span's body-size attribute.
    body::BodyPtr wrapBody(const RequestContext& ctx, body::BodyKind kind, body::BodyPtr inner) const;

    body::BodyPtr wrapResponseBody(const RequestContext& ctx, body::BodyPtr inner) const {
        return wrapBody(ctx, body::BodyKind::kResponse, std::move(inner));
    }

    // Response head about to leave the proxy: stamp X-Request-ID if configured
    // and record the status code.
    void onResponseHeaders(const RequestContext& ctx, protocol::HttpResponse* response) const;

    const tracing::RequestIdManager& requestIds() const { return requestIds_; }
    // A logger whose file failed to open does not count.
    bool accessLogEnabled() const { return accessLog_ && accessLog_->ok(); }

private:
    const tracing::RequestIdManager requestIds_;
    tracing::Tracer* tracer_;
    monitor::Stats* stats_;
    monitor::AccessLogger* accessLog_;
};

} // namespace conduit
