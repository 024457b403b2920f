/**
 * @file operation_context.hpp
 * @brief Cancellation and deadline carried through every remote call.
 *
 * A context is cheap to copy: copies share the same cancellation flag, so a signal
 * handler or a scheduler can stop work that is already in flight.
 */

#ifndef OPERATION_CONTEXT_HPP
#define OPERATION_CONTEXT_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include "error.hpp"

/**
 * @brief Cancellation token with an optional deadline.
 */
class OperationContext {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Constructs a context that never expires and is not cancelled.
     */
    OperationContext();

    /**
     * @brief Returns a copy sharing this context's cancellation flag, expiring after @p timeout.
     *
     * The earlier of the existing deadline and the new one is kept.
     */
    OperationContext withTimeout(std::chrono::milliseconds timeout) const;

    /**
     * @brief Requests cancellation of every copy of this context.
     */
    void cancel() const;

    /**
     * @brief Checks whether work may continue.
     *
     * @return std::expected<void, Error> Success, or Cancelled / Timeout.
     */
    std::expected<void, Error> check() const;

    bool isCancelled() const;

    /**
     * @brief Time left before the deadline, zero once it passed; empty when there is no deadline.
     */
    std::optional<std::chrono::milliseconds> remaining() const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled; ///< Shared between copies.
    std::optional<Clock::time_point> deadline;     ///< Absent means no deadline.
};

#endif // OPERATION_CONTEXT_HPP
