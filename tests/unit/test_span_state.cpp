#include "conduit/tracing/SpanState.h"
#include "conduit/tracing/TracingAttributes.h"
#include "conduit/common/Logger.h"
#include "FakeTracer.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace conduit::tracing;
using conduit::common::Logger;
using conduit::common::LogLevel;
using conduit::protocol::HttpRequest;
using conduit::testing::FakeTracer;
using conduit::testing::MakeSpan;
using conduit::testing::RecordedSpan;

static void testEndsBothSpans() {
    auto server = std::make_shared<RecordedSpan>();
    auto client = std::make_shared<RecordedSpan>();
    SpanState state(MakeSpan(server));
    state.setClientSpan(MakeSpan(client));
    assert(state.hasServerSpan());
    assert(state.hasClientSpan());

    state.end();
    assert(server->endCount == 1);
    assert(client->endCount == 1);
    assert(!state.hasServerSpan());
    assert(!state.hasClientSpan());
}

static void testServerOnly() {
    auto server = std::make_shared<RecordedSpan>();
    SpanState state(MakeSpan(server));
    state.end();
    assert(server->endCount == 1);
}

static void testEmptyStateIsNoop() {
    SpanState state(nullptr);
    assert(!state.hasServerSpan());
    state.end();
    bool ran = state.withServerSpan([](Span&) {});
    assert(!ran);
}

static void testEndIsIdempotent() {
    auto server = std::make_shared<RecordedSpan>();
    auto client = std::make_shared<RecordedSpan>();
    SpanState state(MakeSpan(server));
    state.setClientSpan(MakeSpan(client));
    state.end();
    state.end();
    assert(server->endCount == 1);
    assert(client->endCount == 1);
}

static void testClientSpanReplacementEndsPrevious() {
    auto first = std::make_shared<RecordedSpan>();
    auto retry = std::make_shared<RecordedSpan>();
    SpanState state(nullptr);
    state.setClientSpan(MakeSpan(first));
    state.setClientSpan(MakeSpan(retry));
    assert(first->endCount == 1);
    assert(retry->endCount == 0);
    state.end();
    assert(first->endCount == 1);
    assert(retry->endCount == 1);
}

static void testWithSpanSetsAttributes() {
    auto server = std::make_shared<RecordedSpan>();
    SpanState state(MakeSpan(server));
    bool ran = state.withServerSpan([](Span& s) { s.setAttribute("k", static_cast<int64_t>(7)); });
    assert(ran);
    assert(server->num("k") == 7);
    assert(!state.withClientSpan([](Span&) {}));

    state.end();
    assert(!state.withServerSpan([](Span&) {}));
}

static void testConcurrentAttributeWrites() {
    auto server = std::make_shared<RecordedSpan>();
    auto client = std::make_shared<RecordedSpan>();
    auto state = std::make_shared<SpanState>(MakeSpan(server));
    state->setClientSpan(MakeSpan(client));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([state, t] {
            for (int i = 0; i < 100; ++i) {
                const std::string key = "k" + std::to_string(t);
                state->withServerSpan([&](Span& s) { s.setAttribute(key, static_cast<int64_t>(i)); });
                state->withClientSpan([&](Span& s) { s.setAttribute(key, static_cast<int64_t>(i)); });
            }
        });
    }
    for (auto& th : threads) th.join();
    state->end();

    for (int t = 0; t < 4; ++t) {
        assert(server->num("k" + std::to_string(t)) == 99);
        assert(client->num("k" + std::to_string(t)) == 99);
    }
    assert(server->endCount == 1);
}

static void testRequestAttributes() {
    HttpRequest req;
    req.setMethod("POST");
    req.setVersion(HttpRequest::kHttp11);
    req.setScheme("https");
    req.setAuthority("api.example.com");
    req.setTarget("/v1/items?limit=5");
    req.setHeader("User-Agent", "curl/8.0");

    FakeTracer tracer;
    SpanPtr span = tracer.startSpan("POST", SpanKind::kServer);
    SetAttributesFromRequest(*span, req);
    const RecordedSpan& rec = *tracer.spans.at(0);

    assert(rec.str(HTTP_REQUEST_METHOD) == "POST");
    assert(rec.str(URL_FULL) == "https://api.example.com/v1/items?limit=5");
    assert(rec.str(URL_PATH) == "/v1/items");
    assert(rec.str(URL_QUERY) == "limit=5");
    assert(rec.str(URL_SCHEME) == "https");
    assert(rec.str(NETWORK_PROTOCOL_NAME) == "http");
    assert(rec.str(NETWORK_PROTOCOL_VERSION) == "1.1");
    assert(rec.str(USER_AGENT_ORIGINAL) == "curl/8.0");
}

static void testOriginFormRequestOmitsOptionalAttributes() {
    HttpRequest req;
    req.setMethod("GET");
    req.setTarget("/health");

    FakeTracer tracer;
    SpanPtr span = tracer.startSpan("GET", SpanKind::kServer);
    SetAttributesFromRequest(*span, req);
    const RecordedSpan& rec = *tracer.spans.at(0);

    assert(rec.str(URL_FULL) == "/health");
    assert(!rec.has(URL_QUERY));
    assert(!rec.has(URL_SCHEME));
    assert(rec.str(NETWORK_PROTOCOL_VERSION) == "unknown");
    assert(rec.str(USER_AGENT_ORIGINAL) == "unknown");
}

static void testExtensionMethodAttributes() {
    HttpRequest req;
    req.setMethod("MKCOL");
    assert(req.isExtensionMethod());

    FakeTracer tracer;
    SpanPtr span = tracer.startSpan(req.methodString(), SpanKind::kServer);
    SetAttributesFromRequest(*span, req);
    const RecordedSpan& rec = *tracer.spans.at(0);
    assert(rec.name == "MKCOL");
    assert(rec.str(HTTP_REQUEST_METHOD) == kOtherMethod);
    assert(rec.str(HTTP_REQUEST_METHOD_ORIGINAL) == "MKCOL");

    // Registered methods carry no original-method attribute.
    HttpRequest get;
    get.setMethod("GET");
    assert(!get.isExtensionMethod());
    SpanPtr span2 = tracer.startSpan(get.methodString(), SpanKind::kServer);
    SetAttributesFromRequest(*span2, get);
    assert(tracer.spans.at(1)->str(HTTP_REQUEST_METHOD) == "GET");
    assert(!tracer.spans.at(1)->has(HTTP_REQUEST_METHOD_ORIGINAL));

    HttpRequest unset;
    assert(std::string(unset.methodString()) == "UNKNOWN");
}

static void testThrowingEndClearsSlot() {
    auto server = std::make_shared<RecordedSpan>();
    server->throwOnEnd = true;
    auto client = std::make_shared<RecordedSpan>();
    SpanState state(MakeSpan(server));
    state.setClientSpan(MakeSpan(client));

    bool threw = false;
    try {
        state.end();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!state.hasServerSpan());
    assert(state.hasClientSpan());

    state.end();
    assert(server->endCount == 1);
    assert(client->endCount == 1);
}

static void testUserAgentSentinels() {
    HttpRequest req;
    assert(UserAgentOf(req) == "unknown");
    req.setHeader("user-agent", "Mozilla/5.0\t(X11)");
    assert(UserAgentOf(req) == "Mozilla/5.0\t(X11)");
    req.setHeader("User-Agent", std::string("bad\x01value"));
    assert(UserAgentOf(req) == "invalid-user-agent");
    req.setHeader("User-Agent", std::string("caf\xc3\xa9"));
    assert(UserAgentOf(req) == "invalid-user-agent");

    req.setVersion(HttpRequest::kHttp2);
    assert(std::string(ProtocolVersionOf(req)) == "2.0");
}

static void testHelpersFollowBuildFlag() {
    auto server = std::make_shared<RecordedSpan>();
    SpanState state(MakeSpan(server));
    int calls = 0;
    WithServerSpan(&state, [&calls](Span&) { ++calls; });
    WithClientSpan(&state, [&calls](Span&) { ++calls; });
    WithServerSpan(nullptr, [&calls](Span&) { ++calls; });
    assert(calls == (conduit::kTracingEnabled ? 1 : 0));
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testEndsBothSpans();
    testServerOnly();
    testEmptyStateIsNoop();
    testEndIsIdempotent();
    testClientSpanReplacementEndsPrevious();
    testWithSpanSetsAttributes();
    testConcurrentAttributeWrites();
    testRequestAttributes();
    testOriginFormRequestOmitsOptionalAttributes();
    testExtensionMethodAttributes();
    testThrowingEndClearsSlot();
    testUserAgentSentinels();
    testHelpersFollowBuildFlag();
    return 0;
}
