#ifndef GEOINSIGHT_CORE_CALL_OPTIONS_H_
#define GEOINSIGHT_CORE_CALL_OPTIONS_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "geoinsight/core/result.h"

namespace geoinsight {
namespace core {

/**
 * @brief Cooperative cancellation flag shared between a caller and the
 * operation it started
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Per-call deadline and cancellation for operations that may block
 * on an external collaborator
 */
struct CallOptions {
    using Clock = std::chrono::steady_clock;

    std::optional<Clock::time_point> deadline;
    std::shared_ptr<CancellationToken> cancellation;

    static CallOptions WithTimeout(std::chrono::milliseconds timeout) {
        CallOptions options;
        options.deadline = Clock::now() + timeout;
        return options;
    }

    /**
     * @brief Copy of these options whose deadline is at most now + timeout
     */
    CallOptions bounded_by(std::chrono::milliseconds timeout) const {
        CallOptions options = *this;
        auto limit = Clock::now() + timeout;
        if (!options.deadline || limit < *options.deadline) {
            options.deadline = limit;
        }
        return options;
    }

    bool cancelled() const { return cancellation && cancellation->cancelled(); }
    bool expired() const { return deadline && Clock::now() >= *deadline; }

    /**
     * @brief Retryable error when the call must stop, ok otherwise
     */
    Result<void> check(const std::string& operation) const {
        if (cancelled()) {
            return Result<void>(CancelledError(operation + " cancelled by caller"));
        }
        if (expired()) {
            return Result<void>(TimeoutError(operation + " exceeded its deadline"));
        }
        return Result<void>();
    }
};

} // namespace core
} // namespace geoinsight

#endif // GEOINSIGHT_CORE_CALL_OPTIONS_H_
