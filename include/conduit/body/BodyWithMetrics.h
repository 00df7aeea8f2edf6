#pragma once

#include <memory>
#include <stdexcept>
#include <utility>

#include "conduit/Features.h"
#include "conduit/body/Body.h"
#include "conduit/body/CompletionSlot.h"
#include "conduit/body/ResponseFlags.h"

namespace conduit {
namespace body {

inline BodyPtr RequireInnerBody(BodyPtr inner) {
    if (!inner) throw std::invalid_argument("body wrapper requires an inner body");
    return inner;
}

// Wraps a body, counts the data bytes it yields and reports the total plus an
// outcome exactly once: on End, on Error, or when the wrapper is destroyed
// first. Frames, errors and end-of-stream are passed through untouched.
class InstrumentedBody final : public Body {
public:
    template <typename F>
    InstrumentedBody(BodyKind kind, BodyPtr inner, F&& onComplete,
                     ErrorClassifier classifier = &ClassifyBodyError)
        : inner_(RequireInnerBody(std::move(inner))),
          state_(std::make_shared<CompletionState>(kind, CompletionCallback(std::forward<F>(onComplete)),
                                                   classifier ? classifier : &ClassifyBodyError)),
          guard_(state_) {}

    PollFrame pollFrame(const Waker& waker) override;

    bool isEndStream() const override { return inner_->isEndStream(); }
    SizeHint sizeHint() const override { return inner_->sizeHint(); }

    // For tests/diagnostics; meaningful once the stream has completed.
    uint64_t bytesObserved() const { return state_->bytes(); }
    bool completed() const { return state_->completed(); }

private:
    BodyPtr inner_;
    std::shared_ptr<CompletionState> state_;
    CompletionGuard guard_;
};

// Same constructor and body semantics as InstrumentedBody with no counter, no
// guard and no stored callback.
class PassthroughBody final : public Body {
public:
    template <typename F>
    PassthroughBody(BodyKind /*kind*/, BodyPtr inner, F&& /*onComplete*/,
                    ErrorClassifier /*classifier*/ = nullptr)
        : inner_(RequireInnerBody(std::move(inner))) {}

    PollFrame pollFrame(const Waker& waker) override { return inner_->pollFrame(waker); }
    bool isEndStream() const override { return inner_->isEndStream(); }
    SizeHint sizeHint() const override { return inner_->sizeHint(); }

private:
    BodyPtr inner_;
};

#if CONDUIT_ENABLE_BODY_METRICS
using BodyWithMetrics = InstrumentedBody;
#else
using BodyWithMetrics = PassthroughBody;
#endif

} // namespace body
} // namespace conduit
