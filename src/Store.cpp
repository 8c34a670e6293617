/**
 * @file Store.cpp
 * @brief Call context deadlines and cancellation
 */

#include "fieldpatch/Store.hpp"
#include "fieldpatch/Errors.hpp"

namespace fieldpatch {

CallContext::CallContext()
    : token_(std::make_shared<CancelToken>())
{}

CallContext::CallContext(std::chrono::milliseconds timeout)
    : token_(std::make_shared<CancelToken>())
    , deadline_(Clock::now() + timeout)
{}

CallContext CallContext::background() {
    return CallContext();
}

bool CallContext::cancelled() const {
    return token_->cancelled();
}

bool CallContext::expired() const {
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

std::chrono::milliseconds CallContext::remaining() const {
    if (!deadline_) {
        return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void CallContext::check(const std::string& where) const {
    if (cancelled()) {
        throw CancelledError(where);
    }
    if (expired()) {
        throw CancelledError(where + " (deadline exceeded)");
    }
}

} // namespace fieldpatch
