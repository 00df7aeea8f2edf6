#pragma once

#include <optional>
#include <string>

#include "conduit/common/Config.h"
#include "conduit/common/Logger.h"
#include "conduit/tracing/RequestIdManager.h"

namespace conduit {

// Settings a listener needs to build its RequestObserver:
//   [global]        log_level = INFO
//   [request_id]    generate / preserve_external / always_set_in_response
//   [observability] access_log = /var/log/conduit/access.log   (empty disables)
struct ObserverConfig {
    tracing::RequestIdManager requestIds{true, true, false};
    std::string accessLogPath;
    common::LogLevel logLevel{common::LogLevel::INFO};
    std::optional<std::string> sourceFile;  // nullopt when not loaded from a file

    static ObserverConfig FromConfig(const common::Config& config);

    // One line per setting, for -C style checks.
    std::string Describe() const;
};

} // namespace conduit
