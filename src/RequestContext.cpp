#include "conduit/RequestContext.h"
#include "conduit/common/Logger.h"

#include <exception>

namespace conduit {

RequestContext::~RequestContext() {
    // SpanState clears a slot before ending its span, so the second pass
    // reaches the client span when the server span's backend threw.
    for (int pass = 0; pass < 2; ++pass) {
        try {
            teardown();
            return;
        } catch (const std::exception& e) {
            LOG_ERROR << "span end threw during request teardown: " << e.what();
        } catch (...) {
            LOG_ERROR << "span end threw a non-std exception during request teardown";
        }
    }
}

} // namespace conduit
