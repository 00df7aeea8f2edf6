#pragma once

#include "conduit/body/Body.h"
#include "conduit/body/CompletionSlot.h"
#include "conduit/body/ResponseFlags.h"

#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace conduit {
namespace testing {

// Replays a fixed list of poll results, then End forever. Optionally throws
// from the poll with index throwAt.
class ScriptedBody : public body::Body {
public:
    explicit ScriptedBody(std::vector<body::PollFrame> script, int throwAt = -1)
        : script_(script.begin(), script.end()), throwAt_(throwAt) {}

    ~ScriptedBody() override {
        if (destroyed_) *destroyed_ = true;
    }

    body::PollFrame pollFrame(const body::Waker& /*waker*/) override {
        const int idx = polls_++;
        if (idx == throwAt_) throw std::runtime_error("scripted poll failure");
        if (script_.empty()) return body::PollFrame::End();
        body::PollFrame p = std::move(script_.front());
        script_.pop_front();
        return p;
    }

    bool isEndStream() const override { return script_.empty(); }

    body::SizeHint sizeHint() const override {
        uint64_t n = 0;
        for (const auto& p : script_) {
            if (p.isFrame() && p.frame().dataRef()) n += p.frame().dataRef()->size();
        }
        return body::SizeHint::Exact(n);
    }

    int polls() const { return polls_; }
    void trackDestruction(std::shared_ptr<bool> flag) { destroyed_ = std::move(flag); }

private:
    std::deque<body::PollFrame> script_;
    int throwAt_;
    int polls_{0};
    std::shared_ptr<bool> destroyed_;
};

inline body::PollFrame Data(const std::string& s) {
    return body::PollFrame::Ready(body::Frame::Data(s));
}

inline body::PollFrame Trailers(const std::string& name, const std::string& value) {
    protocol::HeaderMap t;
    t.set(name, value);
    return body::PollFrame::Ready(body::Frame::Trailers(std::move(t)));
}

inline body::PollFrame Fail(body::BodyError::Code code, const std::string& msg) {
    return body::PollFrame::Error(body::BodyError(code, msg));
}

// Polls until End or Error; returns the concatenated data bytes.
inline std::string Drain(body::Body& b, bool* sawError = nullptr) {
    std::string out;
    body::Waker waker;
    for (;;) {
        body::PollFrame p = b.pollFrame(waker);
        if (p.isEnd()) break;
        if (p.isError()) {
            if (sawError) *sawError = true;
            break;
        }
        if (p.isPending()) continue;
        if (const std::string* d = p.frame().dataRef()) out += *d;
    }
    return out;
}

// Records every completion the callback receives.
struct CompletionLog {
    int calls{0};
    uint64_t bytes{0};
    body::ResponseFlags flags;
};

inline body::CompletionCallback Recorder(std::shared_ptr<CompletionLog> log) {
    return [log](uint64_t bytes, body::ResponseFlags flags) {
        log->calls += 1;
        log->bytes = bytes;
        log->flags = flags;
    };
}

} // namespace testing
} // namespace conduit
