#include "conduit/monitor/AccessLogger.h"
#include "conduit/common/Logger.h"

#include <sstream>

namespace conduit {
namespace monitor {

AccessLogger::AccessLogger(const std::string& path) : path_(path) {
    if (path_.empty()) return;
    fp_ = std::fopen(path_.c_str(), "a");
    if (!fp_) {
        LOG_ERROR << "AccessLogger fopen failed path=" << path_;
    }
}

AccessLogger::~AccessLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fp_) {
        std::fflush(fp_);
        std::fclose(fp_);
        fp_ = nullptr;
    }
}

void AccessLogger::AppendLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fp_) return;
    std::fwrite(line.data(), 1, line.size(), fp_);
    std::fwrite("\n", 1, 1, fp_);
    std::fflush(fp_);
}

std::string AccessLogger::FormatCompletion(const std::optional<tracing::RequestId>& id,
                                           body::BodyKind kind,
                                           uint64_t bytes,
                                           const body::ResponseFlags& flags,
                                           int64_t durationMs) {
    std::ostringstream oss;
    oss << "request_id=" << (id ? id->value() : std::string("-"))
        << " kind=" << body::BodyKindName(kind)
        << " bytes=" << bytes
        << " flags=" << flags.toShortString()
        << " duration_ms=" << durationMs;
    return oss.str();
}

} // namespace monitor
} // namespace conduit
