#pragma once

#include <asio.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace portprobe::infra {

/**
 * @brief Bounded pool of connection permits shared by all scan tasks.
 *
 * Gates the number of simultaneously in-flight connection attempts across
 * every target of a run. Acquisition never blocks a thread: a waiter is
 * queued and its handler is posted to the I/O context once a permit frees
 * up. Permits are RAII objects, so a permit is returned on every exit path.
 *
 * Always owned through std::shared_ptr; each Permit keeps its pool alive.
 */
class PermitPool : public std::enable_shared_from_this<PermitPool> {
public:
    /**
     * @brief A held permit. Releases itself when destroyed or reset.
     */
    class Permit {
    public:
        Permit() = default;
        ~Permit() { reset(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        Permit(Permit&& other) noexcept : pool_(std::move(other.pool_)) {}
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                reset();
                pool_ = std::move(other.pool_);
            }
            return *this;
        }

        /**
         * @brief Returns the permit to its pool early. Safe to call twice.
         */
        void reset() {
            if (auto pool = std::move(pool_)) {
                pool->release();
            }
        }

    private:
        friend class PermitPool;
        explicit Permit(std::shared_ptr<PermitPool> pool) : pool_(std::move(pool)) {}

        std::shared_ptr<PermitPool> pool_;
    };

    using AcquireHandler = std::function<void(Permit)>;

    /**
     * @brief Creates a pool. Use create() so the pool is shared-owned.
     * @param context I/O context on which granted handlers run.
     * @param capacity Maximum number of permits held at once (at least 1).
     */
    static std::shared_ptr<PermitPool> create(asio::io_context& context, size_t capacity);

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    /**
     * @brief Requests a permit.
     *
     * The handler is posted to the I/O context with the permit once one is
     * available; waiters are served in request order.
     */
    void acquire(AcquireHandler handler);

    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] size_t inFlight() const;
    [[nodiscard]] size_t peakInFlight() const;
    [[nodiscard]] uint64_t totalAcquired() const;

private:
    PermitPool(asio::io_context& context, size_t capacity);

    void grant(AcquireHandler handler);
    void release();

    asio::io_context& context_;
    const size_t capacity_;
    size_t inFlight_{0};
    size_t peakInFlight_{0};
    uint64_t totalAcquired_{0};
    std::deque<AcquireHandler> waiters_;
    mutable std::mutex mutex_;
};

} // namespace portprobe::infra
