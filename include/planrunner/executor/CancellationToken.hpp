#ifndef PLANRUNNER_EXECUTOR_CANCELLATION_TOKEN_HPP
#define PLANRUNNER_EXECUTOR_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <memory>

namespace planrunner {
namespace executor {

/**
 * @brief Cooperative cancellation flag shared between a caller and a running executor
 *
 * The process runner polls it while a subprocess is alive and forwards
 * SIGTERM (then SIGKILL) once it is set. Cancellation is one-way.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    static std::shared_ptr<CancellationToken> create() {
        return std::make_shared<CancellationToken>();
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace executor
} // namespace planrunner

#endif // PLANRUNNER_EXECUTOR_CANCELLATION_TOKEN_HPP
