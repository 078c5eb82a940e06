/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a job and its controller
 */

#pragma once

#include <atomic>
#include <memory>

namespace util {

/**
 * @class CancellationToken
 * @brief Copyable handle to a shared cancellation flag
 *
 * Copies observe the same flag. The sanitization job checks it only between
 * devices: a command already handed to an external process runs to
 * completion, since interrupting a half-finished secure erase can leave the
 * drive in an inconsistent security state.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void request_cancel() const noexcept { flag_->store(true); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool { return flag_->load(); }

    /**
     * @brief Clear the flag so the token can drive another job
     */
    void reset() const noexcept { flag_->store(false); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace util
