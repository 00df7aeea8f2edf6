#include "conduit/monitor/Stats.h"

#include <sstream>

namespace conduit {
namespace monitor {

Stats::Stats() {
    for (auto& c : flagCounts_) c.store(0, std::memory_order_relaxed);
    startTime_ = std::chrono::system_clock::now();
}

void Stats::RecordBodyCompletion(body::BodyKind kind, uint64_t bytes, const body::ResponseFlags& flags) {
    PerKind& k = perKind_[Index(kind)];
    k.bytes.fetch_add(bytes, std::memory_order_relaxed);
    k.completed.fetch_add(1, std::memory_order_relaxed);
    if (flags.empty()) return;

    k.errored.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < body::ResponseFlags::kFlagCount; ++i) {
        if (flags.bits() & (1u << i)) flagCounts_[i].fetch_add(1, std::memory_order_relaxed);
    }
}

uint64_t Stats::GetFlagCount(body::ResponseFlags::Flag flag) const {
    for (int i = 0; i < body::ResponseFlags::kFlagCount; ++i) {
        if (static_cast<uint32_t>(flag) == (1u << i)) return flagCounts_[i].load(std::memory_order_relaxed);
    }
    return 0;
}

std::string Stats::ToJson() const {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now() - startTime_)
                            .count();

    std::ostringstream ss;
    ss << "{";
    ss << "\"uptime_seconds\": " << uptime << ", ";
    ss << "\"bodies\": {";
    const body::BodyKind kinds[] = {body::BodyKind::kRequest, body::BodyKind::kResponse};
    for (size_t i = 0; i < 2; ++i) {
        if (i) ss << ", ";
        ss << "\"" << body::BodyKindName(kinds[i]) << "\": {"
           << "\"bytes\": " << GetBodyBytes(kinds[i]) << ", "
           << "\"completed\": " << GetCompletedBodies(kinds[i]) << ", "
           << "\"errored\": " << GetErroredBodies(kinds[i]) << "}";
    }
    ss << "}, ";
    ss << "\"response_flags\": {";
    for (int i = 0; i < body::ResponseFlags::kFlagCount; ++i) {
        if (i) ss << ", ";
        const auto f = static_cast<body::ResponseFlags::Flag>(1u << i);
        ss << "\"" << body::ResponseFlags::ShortName(f) << "\": " << flagCounts_[i].load(std::memory_order_relaxed);
    }
    ss << "}";
    ss << "}";
    return ss.str();
}

} // namespace monitor
} // namespace conduit
