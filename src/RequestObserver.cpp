#include "conduit/RequestObserver.h"
#include "conduit/Features.h"
#include "conduit/body/BodyWithMetrics.h"
#include "conduit/common/Logger.h"
#include "conduit/tracing/TracingAttributes.h"

#include <chrono>
#include <cstdint>

namespace conduit {

RequestObserver::RequestObserver(tracing::RequestIdManager requestIds,
                                 tracing::Tracer* tracer,
                                 monitor::Stats* stats,
                                 monitor::AccessLogger* accessLog)
    : requestIds_(requestIds), tracer_(tracer), stats_(stats), accessLog_(accessLog) {}

std::unique_ptr<RequestContext> RequestObserver::onRequest(protocol::HttpRequest* request) const {
    std::optional<tracing::RequestId> incoming = tracing::RequestId::FromRequest(*request);
    std::optional<tracing::RequestId> id = requestIds_.applyPolicy(request, incoming, kAccessLogEnabled && accessLogEnabled());

    std::shared_ptr<tracing::SpanState> spans;
    if (kTracingEnabled && tracer_) {
        tracing::SpanPtr server = tracer_->startSpan(request->methodString(), tracing::SpanKind::kServer);
        if (server) {
            tracing::SetAttributesFromRequest(*server, *request);
            spans = std::make_shared<tracing::SpanState>(std::move(server));
        }
    }

    LOG_DEBUG << "request " << request->methodString() << " " << request->path()
              << " request_id=" << (id ? id->value() : std::string("-"))
              << (id && id->isInternal() ? " (internal)" : "");
    return std::make_unique<RequestContext>(std::move(id), std::move(spans));
}

void RequestObserver::startClientSpan(const RequestContext& ctx,
                                      const std::string& name,
                                      const std::string& upstreamCluster,
                                      const std::string& upstreamAddress) const {
    if (!kTracingEnabled || !tracer_ || !ctx.spanState()) return;
    tracing::SpanPtr client = tracer_->startSpan(name, tracing::SpanKind::kClient);
    if (!client) return;
    client->setAttribute(tracing::UPSTREAM_CLUSTER_NAME, upstreamCluster);
    client->setAttribute(tracing::UPSTREAM_ADDRESS, upstreamAddress);
    ctx.spanState()->setClientSpan(std::move(client));
}

body::BodyPtr RequestObserver::wrapBody(const RequestContext& ctx, body::BodyKind kind, body::BodyPtr inner) const {
    monitor::Stats* stats = stats_;
    monitor::AccessLogger* accessLog = accessLog_;
    std::optional<tracing::RequestId> id = ctx.requestId();
    std::shared_ptr<tracing::SpanState> spans = ctx.spanState();
    const std::chrono::steady_clock::time_point start = ctx.start();

    auto onComplete = [stats, accessLog, id, spans, kind, start](uint64_t bytes, body::ResponseFlags flags) {
        if (kMetricsEnabled && stats) {
            stats->RecordBodyCompletion(kind, bytes, flags);
        }
        if (kAccessLogEnabled && accessLog) {
            const int64_t elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now() - start)
                                          .count();
            accessLog->AppendLine(monitor::AccessLogger::FormatCompletion(id, kind, bytes, flags, elapsedMs));
        }
        tracing::WithServerSpan(spans.get(), [&](tracing::Span& span) {
            span.setAttribute(kind == body::BodyKind::kResponse ? tracing::HTTP_RESPONSE_BODY_SIZE
                                                                : tracing::HTTP_REQUEST_BODY_SIZE,
                              static_cast<int64_t>(bytes));
        });
    };

    return std::make_unique<body::BodyWithMetrics>(kind, std::move(inner), std::move(onComplete));
}

void RequestObserver::onResponseHeaders(const RequestContext& ctx, protocol::HttpResponse* response) const {
    requestIds_.applyTo(response, ctx.requestId());
    tracing::WithServerSpan(ctx.spanState().get(), [&](tracing::Span& span) {
        span.setAttribute(tracing::HTTP_RESPONSE_STATUS_CODE, static_cast<int64_t>(response->statusCode()));
    });
}

} // namespace conduit
