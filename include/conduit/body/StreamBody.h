#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "conduit/body/Body.h"

namespace conduit {
namespace body {

// Body fed by a producer (typically the upstream connection's read path).
// The consumer polls the StreamBody; the producer pushes through the Sender.
// Polling an empty queue returns Pending and the waker fires on the next push.
class StreamBody final : public Body {
    struct Shared;

public:
    class Sender {
    public:
        Sender(Sender&&) noexcept = default;
        Sender& operator=(Sender&&) = delete;
        Sender(const Sender&) = delete;
        Sender& operator=(const Sender&) = delete;

        // Destroying an unfinished sender fails the stream with kAborted.
        ~Sender();

        // Return false once the stream is closed (finished or failed).
        bool pushData(std::string bytes);
        bool pushTrailers(protocol::HeaderMap trailers);
        bool finish();
        bool fail(BodyError error);

    private:
        friend class StreamBody;
        explicit Sender(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

        std::shared_ptr<Shared> shared_;
    };

    // contentLength, when known, feeds sizeHint().
    static std::pair<Sender, std::unique_ptr<StreamBody>> Create(
        std::optional<uint64_t> contentLength = std::nullopt);

    PollFrame pollFrame(const Waker& waker) override;
    bool isEndStream() const override;
    SizeHint sizeHint() const override;

private:
    explicit StreamBody(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

    std::shared_ptr<Shared> shared_;
};

} // namespace body
} // namespace conduit
