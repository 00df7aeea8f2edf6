#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "conduit/body/Body.h"
#include "conduit/body/ResponseFlags.h"

namespace conduit {
namespace monitor {

// Counters fed by body completion callbacks. All updates are relaxed atomics;
// readers see eventually consistent totals.
class Stats {
public:
    Stats();

    void RecordBodyCompletion(body::BodyKind kind, uint64_t bytes, const body::ResponseFlags& flags);

    uint64_t GetBodyBytes(body::BodyKind kind) const {
        return perKind_[Index(kind)].bytes.load(std::memory_order_relaxed);
    }
    uint64_t GetCompletedBodies(body::BodyKind kind) const {
        return perKind_[Index(kind)].completed.load(std::memory_order_relaxed);
    }
    uint64_t GetErroredBodies(body::BodyKind kind) const {
        return perKind_[Index(kind)].errored.load(std::memory_order_relaxed);
    }

    uint64_t GetFlagCount(body::ResponseFlags::Flag flag) const;

    std::string ToJson() const;

private:
    struct PerKind {
        std::atomic<uint64_t> bytes{0};
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> errored{0};
    };

    static size_t Index(body::BodyKind kind) { return kind == body::BodyKind::kRequest ? 0 : 1; }

    std::array<PerKind, 2> perKind_;
    std::array<std::atomic<uint64_t>, body::ResponseFlags::kFlagCount> flagCounts_;
    std::chrono::system_clock::time_point startTime_;
};

} // namespace monitor
} // namespace conduit
