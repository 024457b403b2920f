#include "operation_context.hpp"
#include <algorithm>

OperationContext::OperationContext()
    : cancelled(std::make_shared<std::atomic<bool>>(false)) {}

OperationContext OperationContext::withTimeout(std::chrono::milliseconds timeout) const {
    OperationContext child(*this);
    auto candidate = Clock::now() + timeout;
    if (!child.deadline || candidate < *child.deadline) {
        child.deadline = candidate;
    }
    return child;
}

void OperationContext::cancel() const {
    cancelled->store(true);
}

bool OperationContext::isCancelled() const {
    return cancelled->load();
}

std::expected<void, Error> OperationContext::check() const {
    if (cancelled->load()) {
        return makeError(ErrorCode::Cancelled, "operation cancelled");
    }
    if (deadline && Clock::now() >= *deadline) {
        return makeError(ErrorCode::Timeout, "operation deadline exceeded");
    }
    return {};
}

std::optional<std::chrono::milliseconds> OperationContext::remaining() const {
    if (!deadline) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}
