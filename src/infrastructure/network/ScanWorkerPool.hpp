#pragma once

#include "infrastructure/config/ConfigManager.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace portprobe::infra {

/**
 * @brief Worker threads multiplexing every scan task of a run.
 *
 * Connect attempts, probe exchanges and UDP probes are all asynchronous
 * operations on io(); the workers only ever wait inside the I/O context,
 * never on a single port. Workers are named "portprobe-io<N>" so they can
 * be told apart in a debugger or in top.
 *
 * A handler that throws is logged and its worker keeps serving the run.
 *
 * @note This class is non-copyable.
 */
class ScanWorkerPool {
public:
    /**
     * @brief Creates a pool of the given size (at least one worker).
     */
    explicit ScanWorkerPool(size_t workers);

    /**
     * @brief Creates a pool sized by the io_threads setting of a run.
     */
    explicit ScanWorkerPool(const ScanConfig& config);

    ~ScanWorkerPool();

    ScanWorkerPool(const ScanWorkerPool&) = delete;
    ScanWorkerPool& operator=(const ScanWorkerPool&) = delete;

    /**
     * @brief Launches the workers. Has no effect if already started.
     */
    void start();

    /**
     * @brief Stops the I/O context and joins the workers.
     *
     * Pending operations are abandoned. The pool can be started again.
     */
    void stop();

    /**
     * @brief I/O context on which scan operations are started.
     */
    asio::io_context& io() { return io_; }

    /**
     * @brief Number of handler exceptions caught since construction.
     */
    [[nodiscard]] uint64_t handlerFailures() const { return handlerFailures_.load(); }

    /**
     * @brief Name given to the worker with the given index.
     */
    static std::string workerName(size_t index);

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    void runWorker(size_t index);

    asio::io_context io_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> workers_;
    const size_t workerCount_;
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> handlerFailures_{0};
    std::chrono::steady_clock::time_point startedAt_;
};

} // namespace portprobe::infra
