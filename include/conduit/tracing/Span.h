#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "conduit/common/noncopyable.h"

namespace conduit {
namespace tracing {

// Pass std::string explicitly for text values: a bare string literal would
// convert to bool.
using AttributeValue = std::variant<bool, int64_t, double, std::string>;

enum class SpanKind {
    kServer,
    kClient
};

// A span produced by the tracer backend. Implementations need not be
// thread-safe; SpanState serializes access.
class Span : common::noncopyable {
public:
    virtual ~Span() = default;

    virtual void setAttribute(const std::string& key, AttributeValue value) = 0;

    // Marks the span finished and hands it to the exporter.
    virtual void end() = 0;
};

using SpanPtr = std::unique_ptr<Span>;

// Backend hook injected into RequestObserver.
class Tracer : common::noncopyable {
public:
    virtual ~Tracer() = default;

    virtual SpanPtr startSpan(const std::string& name, SpanKind kind) = 0;
};

} // namespace tracing
} // namespace conduit
