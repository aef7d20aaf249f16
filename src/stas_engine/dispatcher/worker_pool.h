/**
 * @file worker_pool.h
 * @brief Bounded pool of threads that runs the blocking NVMe calls.
 * @details Jobs never touch engine state. Each job computes a result and posts a
 *          completion back to the Dispatcher (see run_blocking()).
 */
#ifndef STAS_WORKER_POOL_H
#define STAS_WORKER_POOL_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "dispatcher.h"
#include "../utils/thread_safe_queue.h"

namespace nvmestas {
namespace engine {

class Executor {
public:
    using Job = std::function<void()>;

    virtual ~Executor() = default;

    /** @brief Queues a job. Returns false if the executor no longer accepts work. */
    virtual bool submit(Job job) = 0;
};

class WorkerPool : public Executor {
public:
    explicit WorkerPool(size_t thread_count);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    /** @brief Stops accepting jobs, lets running jobs finish and joins the threads. */
    void stop();

    bool submit(Job job) override;

    size_t thread_count() const { return thread_count_; }
    size_t pending_jobs() const { return jobs_.size(); }

private:
    void worker_loop(size_t index);

    size_t thread_count_;
    utils::ThreadSafeQueue<Job> jobs_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

/**
 * @brief Runs `work` on the executor and delivers its result to `done` on the dispatcher thread.
 * @return false when the job could not be queued. `done` is never called in that case.
 */
template <typename R>
bool run_blocking(Executor& executor,
                  Dispatcher& dispatcher,
                  std::function<R()> work,
                  std::function<void(R)> done) {
    return executor.submit([&dispatcher, work = std::move(work), done = std::move(done)]() {
        auto result = std::make_shared<R>(work());
        dispatcher.post([done, result]() { done(std::move(*result)); });
    });
}

} // namespace engine
} // namespace nvmestas

#endif // STAS_WORKER_POOL_H
