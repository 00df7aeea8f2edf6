#pragma once

// Build-time capabilities. CMake sets these to 0/1; a bare include gets the
// everything-off defaults.

#ifndef CONDUIT_ENABLE_TRACING
#define CONDUIT_ENABLE_TRACING 0
#endif

#ifndef CONDUIT_ENABLE_METRICS
#define CONDUIT_ENABLE_METRICS 0
#endif

#ifndef CONDUIT_ENABLE_ACCESS_LOG
#define CONDUIT_ENABLE_ACCESS_LOG 0
#endif

#if CONDUIT_ENABLE_METRICS || CONDUIT_ENABLE_ACCESS_LOG
#define CONDUIT_ENABLE_BODY_METRICS 1
#else
#define CONDUIT_ENABLE_BODY_METRICS 0
#endif

namespace conduit {

constexpr bool kTracingEnabled = CONDUIT_ENABLE_TRACING != 0;
constexpr bool kMetricsEnabled = CONDUIT_ENABLE_METRICS != 0;
constexpr bool kAccessLogEnabled = CONDUIT_ENABLE_ACCESS_LOG != 0;
constexpr bool kBodyMetricsEnabled = CONDUIT_ENABLE_BODY_METRICS != 0;

} // namespace conduit
