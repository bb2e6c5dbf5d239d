#include "infrastructure/network/PermitPool.hpp"

#include <algorithm>

namespace portprobe::infra {

std::shared_ptr<PermitPool> PermitPool::create(asio::io_context& context, size_t capacity) {
    return std::shared_ptr<PermitPool>(new PermitPool(context, capacity));
}

PermitPool::PermitPool(asio::io_context& context, size_t capacity)
    : context_(context), capacity_(capacity > 0 ? capacity : 1) {}

void PermitPool::acquire(AcquireHandler handler) {
    {
        std::lock_guard lock(mutex_);
        if (inFlight_ >= capacity_) {
            waiters_.push_back(std::move(handler));
            return;
        }
        ++inFlight_;
        ++totalAcquired_;
        peakInFlight_ = std::max(peakInFlight_, inFlight_);
    }

    grant(std::move(handler));
}

void PermitPool::grant(AcquireHandler handler) {
    asio::post(context_, [self = shared_from_this(), handler = std::move(handler)]() {
        handler(Permit(self));
    });
}

void PermitPool::release() {
    AcquireHandler next;
    {
        std::lock_guard lock(mutex_);
        if (waiters_.empty()) {
            --inFlight_;
            return;
        }
        // Hand the slot straight to the next waiter
        next = std::move(waiters_.front());
        waiters_.pop_front();
        ++totalAcquired_;
    }

    grant(std::move(next));
}

size_t PermitPool::inFlight() const {
    std::lock_guard lock(mutex_);
    return inFlight_;
}

size_t PermitPool::peakInFlight() const {
    std::lock_guard lock(mutex_);
    return peakInFlight_;
}

uint64_t PermitPool::totalAcquired() const {
    std::lock_guard lock(mutex_);
    return totalAcquired_;
}

} // namespace portprobe::infra
