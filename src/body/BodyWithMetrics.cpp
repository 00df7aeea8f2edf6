#include "conduit/body/BodyWithMetrics.h"

namespace conduit {
namespace body {

PollFrame InstrumentedBody::pollFrame(const Waker& waker) {
    PollFrame poll = inner_->pollFrame(waker);
    switch (poll.state()) {
        case PollFrame::kFrame:
            if (const std::string* data = poll.frame().dataRef()) {
                state_->addBytes(data->size());
            }
            break;
        case PollFrame::kEnd:
            state_->complete(ResponseFlags());
            break;
        case PollFrame::kError:
            state_->complete(state_->classify(poll.error()));
            break;
        case PollFrame::kPending:
            break;
    }
    return poll;
}

} // namespace body
} // namespace conduit
