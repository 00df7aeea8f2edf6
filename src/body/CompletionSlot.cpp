#include "conduit/body/CompletionSlot.h"
#include "conduit/common/Logger.h"

#include <exception>

namespace conduit {
namespace body {

CompletionCallback CompletionSlot::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    CompletionCallback out;
    out.swap(callback_);
    return out;
}

bool CompletionSlot::consumed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !callback_;
}

bool CompletionState::complete(ResponseFlags flags) noexcept {
    CompletionCallback callback = slot_.take();
    if (!callback) return false;

    const uint64_t total = bytes();
    try {
        callback(total, flags);
    } catch (const std::exception& e) {
        LOG_ERROR << "completion callback threw kind=" << BodyKindName(kind_)
                  << " bytes=" << total << " what=" << e.what();
    } catch (...) {
        LOG_ERROR << "completion callback threw a non-std exception kind=" << BodyKindName(kind_)
                  << " bytes=" << total;
    }
    return true;
}

} // namespace body
} // namespace conduit
