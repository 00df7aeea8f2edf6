#include "conduit/body/BodyWithMetrics.h"
#include "conduit/body/FullBody.h"
#include "conduit/common/Logger.h"
#include "TestBodies.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace conduit::body;
using conduit::common::Logger;
using conduit::common::LogLevel;
using conduit::testing::CompletionLog;
using conduit::testing::Data;
using conduit::testing::Drain;
using conduit::testing::Fail;
using conduit::testing::Recorder;
using conduit::testing::ScriptedBody;
using conduit::testing::Trailers;

static std::unique_ptr<InstrumentedBody> Wrap(std::vector<PollFrame> script,
                                              std::shared_ptr<CompletionLog> log,
                                              BodyKind kind = BodyKind::kResponse) {
    return std::make_unique<InstrumentedBody>(kind, std::make_unique<ScriptedBody>(std::move(script)),
                                              Recorder(log));
}

static void testEmptyStream() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({}, log);
    assert(Drain(*b).empty());
    assert(log->calls == 1);
    assert(log->bytes == 0);
    assert(log->flags.empty());
    b.reset();
    assert(log->calls == 1);
}

static void testSingleFrame() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({Data("hello")}, log);
    assert(Drain(*b) == "hello");
    assert(log->calls == 1);
    assert(log->bytes == 5);
    assert(log->flags.empty());
}

static void testMultiFrameWithTrailers() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({Data("abc"), Data(""), Data("defgh"), Trailers("grpc-status", "0")}, log);

    Waker waker;
    PollFrame p = b->pollFrame(waker);
    assert(p.isFrame() && *p.frame().dataRef() == "abc");
    assert(log->calls == 0);

    p = b->pollFrame(waker);
    assert(p.isFrame() && p.frame().dataRef()->empty());
    p = b->pollFrame(waker);
    assert(p.isFrame() && *p.frame().dataRef() == "defgh");

    // Trailers pass through untouched and are not counted.
    p = b->pollFrame(waker);
    assert(p.isFrame() && p.frame().isTrailers());
    assert(*p.frame().trailersRef()->get("grpc-status") == "0");
    assert(log->calls == 0);

    p = b->pollFrame(waker);
    assert(p.isEnd());
    assert(log->calls == 1);
    assert(log->bytes == 8);
    assert(log->flags.empty());
}

static void testErrorTerminatedStream() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({Data("1234"), Fail(BodyError::kReset, "upstream reset")}, log);

    Waker waker;
    assert(b->pollFrame(waker).isFrame());
    PollFrame p = b->pollFrame(waker);

    // The consumer sees the original error.
    assert(p.isError());
    assert(p.error().code == BodyError::kReset);
    assert(p.error().message == "upstream reset");

    assert(log->calls == 1);
    assert(log->bytes == 4);
    assert(log->flags.has(ResponseFlags::kUpstreamConnectionTermination));

    b.reset();
    assert(log->calls == 1);
}

static void testRequestBodyErrorIsDownstream() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({Fail(BodyError::kProtocol, "bad chunk")}, log, BodyKind::kRequest);
    bool sawError = false;
    Drain(*b, &sawError);
    assert(sawError);
    assert(log->flags.has(ResponseFlags::kDownstreamProtocolError));
}

static ResponseFlags AlwaysOverflow(const BodyError&, BodyKind) {
    return ResponseFlags(ResponseFlags::kUpstreamConnectionFailure);
}

static void testInjectedClassifier() {
    auto log = std::make_shared<CompletionLog>();
    InstrumentedBody b(BodyKind::kResponse,
                       std::make_unique<ScriptedBody>(std::vector<PollFrame>{Fail(BodyError::kTimeout, "idle")}),
                       Recorder(log), &AlwaysOverflow);
    bool sawError = false;
    Drain(b, &sawError);
    assert(sawError);
    assert(log->flags == ResponseFlags(ResponseFlags::kUpstreamConnectionFailure));
}

static void testPendingHasNoSideEffect() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({PollFrame::Pending(), Data("xy"), PollFrame::Pending()}, log);
    Waker waker;
    assert(b->pollFrame(waker).isPending());
    assert(log->calls == 0);
    assert(b->pollFrame(waker).isFrame());
    assert(b->pollFrame(waker).isPending());
    assert(log->calls == 0);
    assert(b->pollFrame(waker).isEnd());
    assert(log->calls == 1);
    assert(log->bytes == 2);
}

static void testDropBeforeEnd() {
    auto log = std::make_shared<CompletionLog>();
    auto destroyed = std::make_shared<bool>(false);
    {
        auto inner = std::make_unique<ScriptedBody>(std::vector<PollFrame>{Data("part"), Data("rest")});
        inner->trackDestruction(destroyed);
        InstrumentedBody b(BodyKind::kResponse, std::move(inner), Recorder(log));
        Waker waker;
        assert(b.pollFrame(waker).isFrame());
        assert(log->calls == 0);
    }
    assert(*destroyed);
    assert(log->calls == 1);
    assert(log->bytes == 4);
    assert(log->flags.empty());
}

static void testDropWithoutPolling() {
    auto log = std::make_shared<CompletionLog>();
    {
        auto b = Wrap({Data("never read")}, log);
    }
    assert(log->calls == 1);
    assert(log->bytes == 0);
}

static void testThrowingPollStillCompletesOnDrop() {
    auto log = std::make_shared<CompletionLog>();
    {
        InstrumentedBody b(BodyKind::kResponse,
                           std::make_unique<ScriptedBody>(std::vector<PollFrame>{Data("abc"), Data("def")}, 1),
                           Recorder(log));
        Waker waker;
        assert(b.pollFrame(waker).isFrame());
        bool threw = false;
        try {
            b.pollFrame(waker);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(log->calls == 0);
    }
    assert(log->calls == 1);
    assert(log->bytes == 3);
    assert(log->flags.empty());
}

static void testPollAfterEndDoesNotRefire() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({Data("z")}, log);
    Drain(*b);
    Waker waker;
    assert(b->pollFrame(waker).isEnd());
    assert(b->pollFrame(waker).isEnd());
    assert(log->calls == 1);
}

static void testHintsDelegate() {
    auto log = std::make_shared<CompletionLog>();
    auto b = Wrap({Data("12345"), Data("678")}, log);
    assert(!b->isEndStream());
    assert(b->sizeHint().exact() && *b->sizeHint().exact() == 8);
    Waker waker;
    b->pollFrame(waker);
    assert(*b->sizeHint().exact() == 3);
    b->pollFrame(waker);
    assert(b->isEndStream());
    assert(*b->sizeHint().exact() == 0);
}

static void testNullInnerRejectedWithoutFiring() {
    auto log = std::make_shared<CompletionLog>();
    bool threw = false;
    try {
        InstrumentedBody b(BodyKind::kResponse, nullptr, Recorder(log));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(log->calls == 0);

    threw = false;
    try {
        PassthroughBody b(BodyKind::kResponse, nullptr, Recorder(log));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void testPassthroughMatchesInstrumented() {
    const std::vector<PollFrame> script = {Data("a"), PollFrame::Pending(), Data("bcd"),
                                           Trailers("x-checksum", "9"), Fail(BodyError::kIo, "eof")};

    auto log = std::make_shared<CompletionLog>();
    InstrumentedBody inst(BodyKind::kResponse, std::make_unique<ScriptedBody>(script), Recorder(log));

    int passthroughCalls = 0;
    PassthroughBody pass(BodyKind::kResponse, std::make_unique<ScriptedBody>(script),
                         [&passthroughCalls](uint64_t, ResponseFlags) { ++passthroughCalls; });

    Waker waker;
    for (size_t i = 0; i < script.size() + 1; ++i) {
        assert(inst.isEndStream() == pass.isEndStream());
        PollFrame a = inst.pollFrame(waker);
        PollFrame b = pass.pollFrame(waker);
        assert(a.state() == b.state());
        if (a.isFrame()) {
            assert(a.frame().isData() == b.frame().isData());
            if (a.frame().isData()) assert(*a.frame().dataRef() == *b.frame().dataRef());
        }
        if (a.isError()) assert(a.error().message == b.error().message);
    }

    assert(log->calls == 1);
    assert(log->bytes == 4);
    assert(passthroughCalls == 0);
}

static void testFullBody() {
    auto log = std::make_shared<CompletionLog>();
    InstrumentedBody b(BodyKind::kResponse, std::make_unique<FullBody>("payload"), Recorder(log));
    assert(*b.sizeHint().exact() == 7);
    assert(Drain(b) == "payload");
    assert(b.isEndStream());
    assert(log->bytes == 7);
    assert(b.completed());
    assert(b.bytesObserved() == 7);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testEmptyStream();
    testSingleFrame();
    testMultiFrameWithTrailers();
    testErrorTerminatedStream();
    testRequestBodyErrorIsDownstream();
    testInjectedClassifier();
    testPendingHasNoSideEffect();
    testDropBeforeEnd();
    testDropWithoutPolling();
    testThrowingPollStillCompletesOnDrop();
    testPollAfterEndDoesNotRefire();
    testHintsDelegate();
    testNullInnerRejectedWithoutFiring();
    testPassthroughMatchesInstrumented();
    testFullBody();
    return 0;
}
