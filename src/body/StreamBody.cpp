#include "conduit/body/StreamBody.h"

namespace conduit {
namespace body {

struct StreamBody::Shared {
    std::mutex mutex;
    std::deque<Frame> frames;
    std::optional<BodyError> error;   // delivered after the queued frames
    bool closed{false};               // no more pushes accepted
    std::optional<Waker> waker;       // consumer parked on Pending
    std::optional<uint64_t> contentLength;
    uint64_t queuedBytes{0};
    uint64_t polledBytes{0};

    // Caller wakes the returned waker after dropping the lock.
    std::optional<Waker> takeWakerLocked() {
        std::optional<Waker> w;
        w.swap(waker);
        return w;
    }
};

namespace {

void WakeIfParked(std::optional<Waker>& w) {
    if (w) w->wake();
}

} // namespace

std::pair<StreamBody::Sender, std::unique_ptr<StreamBody>> StreamBody::Create(
    std::optional<uint64_t> contentLength) {
    auto shared = std::make_shared<Shared>();
    shared->contentLength = contentLength;
    std::unique_ptr<StreamBody> body(new StreamBody(shared));
    return {Sender(shared), std::move(body)};
}

StreamBody::Sender::~Sender() {
    if (!shared_) return;
    fail(BodyError(BodyError::kAborted, "stream producer dropped before finishing"));
}

bool StreamBody::Sender::pushData(std::string bytes) {
    if (!shared_) return false;
    std::optional<Waker> w;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->closed) return false;
        shared_->queuedBytes += bytes.size();
        shared_->frames.push_back(Frame::Data(std::move(bytes)));
        w = shared_->takeWakerLocked();
    }
    WakeIfParked(w);
    return true;
}

bool StreamBody::Sender::pushTrailers(protocol::HeaderMap trailers) {
    if (!shared_) return false;
    std::optional<Waker> w;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->closed) return false;
        // Trailers are the last frame of a stream.
        shared_->frames.push_back(Frame::Trailers(std::move(trailers)));
        shared_->closed = true;
        w = shared_->takeWakerLocked();
    }
    WakeIfParked(w);
    return true;
}

bool StreamBody::Sender::finish() {
    if (!shared_) return false;
    std::optional<Waker> w;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->closed) return false;
        shared_->closed = true;
        w = shared_->takeWakerLocked();
    }
    WakeIfParked(w);
    return true;
}

bool StreamBody::Sender::fail(BodyError error) {
    if (!shared_) return false;
    std::optional<Waker> w;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->closed) return false;
        shared_->closed = true;
        shared_->error.emplace(std::move(error));
        w = shared_->takeWakerLocked();
    }
    WakeIfParked(w);
    return true;
}

PollFrame StreamBody::pollFrame(const Waker& waker) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (!shared_->frames.empty()) {
        Frame frame = std::move(shared_->frames.front());
        shared_->frames.pop_front();
        if (const std::string* data = frame.dataRef()) {
            shared_->queuedBytes -= data->size();
            shared_->polledBytes += data->size();
        }
        return PollFrame::Ready(std::move(frame));
    }
    if (shared_->error) {
        BodyError error = std::move(*shared_->error);
        shared_->error.reset();
        return PollFrame::Error(std::move(error));
    }
    if (shared_->closed) return PollFrame::End();

    shared_->waker = waker;
    return PollFrame::Pending();
}

bool StreamBody::isEndStream() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->closed && shared_->frames.empty() && !shared_->error;
}

SizeHint StreamBody::sizeHint() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->contentLength) {
        const uint64_t cl = *shared_->contentLength;
        return SizeHint::Exact(cl > shared_->polledBytes ? cl - shared_->polledBytes : 0);
    }
    if (shared_->closed) return SizeHint::Exact(shared_->queuedBytes);
    SizeHint h;
    h.lower = shared_->queuedBytes;
    return h;
}

} // namespace body
} // namespace conduit
