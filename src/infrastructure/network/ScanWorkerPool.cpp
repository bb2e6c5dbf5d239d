#include "infrastructure/network/ScanWorkerPool.hpp"

#include <spdlog/spdlog.h>

#ifdef __linux__
#include <pthread.h>
#endif

namespace portprobe::infra {

ScanWorkerPool::ScanWorkerPool(size_t workers) : workerCount_(workers > 0 ? workers : 1) {}

ScanWorkerPool::ScanWorkerPool(const ScanConfig& config)
    : ScanWorkerPool(static_cast<size_t>(config.ioThreads > 0 ? config.ioThreads : 1)) {}

ScanWorkerPool::~ScanWorkerPool() {
    stop();
}

std::string ScanWorkerPool::workerName(size_t index) {
    // Linux limits thread names to 15 characters
    return "portprobe-io" + std::to_string(index);
}

void ScanWorkerPool::start() {
    if (started_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(io_));
    startedAt_ = std::chrono::steady_clock::now();

    workers_.reserve(workerCount_);
    for (size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back([this, i]() { runWorker(i); });
    }

    spdlog::debug("Scan worker pool started with {} workers", workerCount_);
}

void ScanWorkerPool::runWorker(size_t index) {
#ifdef __linux__
    pthread_setname_np(pthread_self(), workerName(index).c_str());
#endif

    // run() returns early when a handler throws; resume until the pool stops
    for (;;) {
        try {
            io_.run();
            return;
        } catch (const std::exception& e) {
            ++handlerFailures_;
            spdlog::error("Scan task failed on {}: {}", workerName(index), e.what());
        }
    }
}

void ScanWorkerPool::stop() {
    if (!started_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    io_.stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    io_.restart();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt_);
    spdlog::debug("Scan worker pool stopped after {}ms ({} failed tasks)", elapsed.count(),
                  handlerFailures_.load());
}

} // namespace portprobe::infra
