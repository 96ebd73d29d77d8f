#pragma once

#include <atomic>
#include <memory>

namespace batchdl {

// Cancellation signal shared by every copy of the same Context. Cancelling is
// sticky: once cancelled() returns true it never returns false again.
class Context {
public:
    Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { cancelled_->store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace batchdl
