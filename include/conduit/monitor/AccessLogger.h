#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

#include "conduit/body/Body.h"
#include "conduit/body/ResponseFlags.h"
#include "conduit/common/noncopyable.h"
#include "conduit/tracing/RequestId.h"

namespace conduit {
namespace monitor {

// Append-only access log, one line per completed body.
class AccessLogger : common::noncopyable {
public:
    explicit AccessLogger(const std::string& path);
    ~AccessLogger();

    bool ok() const { return fp_ != nullptr; }

    // Thread-safe append one line (already formatted).
    void AppendLine(const std::string& line);

    // "request_id=<id|-> kind=response bytes=123 flags=UC duration_ms=42"
    static std::string FormatCompletion(const std::optional<tracing::RequestId>& id,
                                        body::BodyKind kind,
                                        uint64_t bytes,
                                        const body::ResponseFlags& flags,
                                        int64_t durationMs);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
    std::FILE* fp_{nullptr};
};

} // namespace monitor
} // namespace conduit
