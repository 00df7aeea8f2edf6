#pragma once

#include <string>
#include <utility>

#include "conduit/body/Body.h"

namespace conduit {
namespace body {

// Yields its whole payload as one data frame, then End. An empty payload
// ends immediately.
class FullBody final : public Body {
public:
    explicit FullBody(std::string data) : data_(std::move(data)), done_(data_.empty()) {}

    PollFrame pollFrame(const Waker& /*waker*/) override {
        if (done_) return PollFrame::End();
        done_ = true;
        return PollFrame::Ready(Frame::Data(std::move(data_)));
    }

    bool isEndStream() const override { return done_; }

    SizeHint sizeHint() const override { return SizeHint::Exact(done_ ? 0 : data_.size()); }

private:
    std::string data_;
    bool done_;
};

} // namespace body
} // namespace conduit
