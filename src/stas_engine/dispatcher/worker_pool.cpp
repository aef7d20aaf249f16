#include "worker_pool.h"

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

WorkerPool::WorkerPool(size_t thread_count)
    : thread_count_(thread_count == 0 ? 1 : thread_count) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (running_) {
        return;
    }
    running_ = true;
    threads_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    LOG_STAS_DEBUG("Worker pool started with %zu threads.", thread_count_);
}

void WorkerPool::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    jobs_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    LOG_STAS_DEBUG("Worker pool stopped.");
}

bool WorkerPool::submit(Job job) {
    if (!running_) {
        return false;
    }
    return jobs_.push(std::move(job));
}

void WorkerPool::worker_loop(size_t index) {
    LOG_STAS_DEBUG("Worker %zu running.", index);
    Job job;
    while (jobs_.pop(job)) {
        job();
        job = nullptr;
    }
    LOG_STAS_DEBUG("Worker %zu exiting.", index);
}

} // namespace engine
} // namespace nvmestas
