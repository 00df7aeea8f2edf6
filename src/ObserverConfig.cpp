#include "conduit/ObserverConfig.h"
#include "conduit/Features.h"

#include <sstream>

namespace conduit {

ObserverConfig ObserverConfig::FromConfig(const common::Config& config) {
    ObserverConfig out;
    out.requestIds = tracing::RequestIdManager::FromConfig(config);
    out.accessLogPath = config.GetString("observability", "access_log", "");
    out.logLevel = common::Logger::Instance().ParseLevel(config.GetString("global", "log_level", "INFO"));
    out.sourceFile = config.LoadedFilename();
    return out;
}

std::string ObserverConfig::Describe() const {
    std::ostringstream oss;
    oss << "config.file=" << (sourceFile ? *sourceFile : std::string("-")) << "\n"
        << "request_id.generate=" << requestIds.generate() << "\n"
        << "request_id.preserve_external=" << requestIds.preserveExternal() << "\n"
        << "request_id.always_set_in_response=" << requestIds.alwaysSetInResponse() << "\n"
        << "observability.access_log=" << (accessLogPath.empty() ? "-" : accessLogPath) << "\n"
        << "build.tracing=" << kTracingEnabled << "\n"
        << "build.metrics=" << kMetricsEnabled << "\n"
        << "build.access_log=" << kAccessLogEnabled << "\n";
    return oss.str();
}

} // namespace conduit
