#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "conduit/common/noncopyable.h"
#include "conduit/protocol/HeaderMap.h"

namespace conduit {
namespace body {

// Direction of a body through the proxy.
enum class BodyKind {
    kRequest,
    kResponse
};

inline const char* BodyKindName(BodyKind kind) {
    return kind == BodyKind::kRequest ? "request" : "response";
}

// Terminal failure of a body stream. Delivered as a value, never thrown.
struct BodyError {
    enum Code {
        kIo,        // read/write failure on the underlying connection
        kReset,     // peer reset the stream
        kTimeout,   // idle or overall deadline expired
        kProtocol,  // malformed framing
        kAborted    // producer went away before finishing
    };

    BodyError(Code c, std::string msg) : code(c), message(std::move(msg)) {}

    Code code;
    std::string message;
};

// One unit of body payload: a data chunk or the trailer block.
class Frame {
public:
    static Frame Data(std::string bytes) { return Frame(std::move(bytes)); }
    static Frame Trailers(protocol::HeaderMap trailers) { return Frame(std::move(trailers)); }

    bool isData() const { return std::holds_alternative<std::string>(payload_); }
    bool isTrailers() const { return std::holds_alternative<protocol::HeaderMap>(payload_); }

    // nullptr when this is not a data frame.
    const std::string* dataRef() const { return std::get_if<std::string>(&payload_); }
    const protocol::HeaderMap* trailersRef() const { return std::get_if<protocol::HeaderMap>(&payload_); }

private:
    explicit Frame(std::string bytes) : payload_(std::move(bytes)) {}
    explicit Frame(protocol::HeaderMap trailers) : payload_(std::move(trailers)) {}

    std::variant<std::string, protocol::HeaderMap> payload_;
};

// Bounds on the number of data bytes still to come.
struct SizeHint {
    uint64_t lower{0};
    std::optional<uint64_t> upper;

    static SizeHint Exact(uint64_t n) {
        SizeHint h;
        h.lower = n;
        h.upper = n;
        return h;
    }

    std::optional<uint64_t> exact() const {
        if (upper && *upper == lower) return lower;
        return std::nullopt;
    }
};

// Handed to pollFrame(); a body that returns Pending must call wake() once it
// can make progress.
class Waker {
public:
    Waker() = default;
    explicit Waker(std::function<void()> fn) : fn_(std::move(fn)) {}

    void wake() const {
        if (fn_) fn_();
    }

private:
    std::function<void()> fn_;
};

// Outcome of one poll: not ready, a frame, a terminal error, or end of stream.
class PollFrame {
public:
    enum State { kPending, kFrame, kError, kEnd };

    static PollFrame Pending() { return PollFrame(kPending); }
    static PollFrame End() { return PollFrame(kEnd); }
    static PollFrame Ready(Frame frame) {
        PollFrame p(kFrame);
        p.frame_.emplace(std::move(frame));
        return p;
    }
    static PollFrame Error(BodyError error) {
        PollFrame p(kError);
        p.error_.emplace(std::move(error));
        return p;
    }

    State state() const { return state_; }
    bool isPending() const { return state_ == kPending; }
    bool isFrame() const { return state_ == kFrame; }
    bool isError() const { return state_ == kError; }
    bool isEnd() const { return state_ == kEnd; }

    // Valid only when isFrame() / isError().
    const Frame& frame() const { return *frame_; }
    Frame& frame() { return *frame_; }
    const BodyError& error() const { return *error_; }

private:
    explicit PollFrame(State s) : state_(s) {}

    State state_;
    std::optional<Frame> frame_;
    std::optional<BodyError> error_;
};

// A lazily produced sequence of frames. One pollFrame() call at a time per
// body; after End or Error no further frames are produced.
class Body : common::noncopyable {
public:
    virtual ~Body() = default;

    virtual PollFrame pollFrame(const Waker& waker) = 0;

    // True when the next poll is known to return End without blocking.
    virtual bool isEndStream() const { return false; }

    virtual SizeHint sizeHint() const { return SizeHint(); }
};

using BodyPtr = std::unique_ptr<Body>;

} // namespace body
} // namespace conduit
