#include "conduit/tracing/SpanState.h"

namespace conduit {
namespace tracing {

void SpanState::setClientSpan(SpanPtr span) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    SpanPtr previous = std::move(clientSpan_);
    clientSpan_ = std::move(span);
    if (previous) previous->end();
}

// Each slot is emptied before its span ends, so a throwing backend never
// leaves a span to be ended twice.
void SpanState::end() {
    {
        std::lock_guard<std::mutex> lock(serverMutex_);
        SpanPtr server = std::move(serverSpan_);
        if (server) server->end();
    }

    std::lock_guard<std::mutex> lock(clientMutex_);
    SpanPtr client = std::move(clientSpan_);
    if (client) client->end();
}

bool SpanState::hasServerSpan() const {
    std::lock_guard<std::mutex> lock(serverMutex_);
    return serverSpan_ != nullptr;
}

bool SpanState::hasClientSpan() const {
    std::lock_guard<std::mutex> lock(clientMutex_);
    return clientSpan_ != nullptr;
}

} // namespace tracing
} // namespace conduit
