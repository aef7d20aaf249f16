/**
 * @file dispatcher.h
 * @brief Defines the single-threaded event loop that owns all controller state.
 * @details Every event source (timers, kernel events, service discovery callbacks,
 *          control requests, worker completions) reaches the engine as a task posted
 *          to the Dispatcher. Tasks run strictly in arrival order on the dispatcher
 *          thread; timers fire on the same thread. Nothing else mutates controller
 *          state, so the state machines need no locks.
 */
#ifndef STAS_DISPATCHER_H
#define STAS_DISPATCHER_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>

#include "clock.h"
#include "../utils/thread_safe_queue.h"

namespace nvmestas {
namespace engine {

class Dispatcher {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    explicit Dispatcher(const Clock& clock);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    /**
     * @brief Queues a task. Safe to call from any thread.
     * @return false once the dispatcher has been stopped (the task is dropped).
     */
    bool post(Task task);

    /**
     * @brief Arms a single-shot timer. Dispatcher thread only.
     * @return Identifier usable with cancel(). Never 0.
     */
    TimerId schedule_at(Clock::time_point deadline, Task task);
    TimerId schedule_after(Clock::duration delay, Task task);

    /** @brief Disarms a timer. Returns false if it already fired or never existed. */
    bool cancel(TimerId id);

    bool is_scheduled(TimerId id) const;
    std::optional<Clock::time_point> deadline_of(TimerId id) const;
    std::optional<Clock::time_point> next_deadline() const;
    size_t timer_count() const { return timers_.size(); }

    /** @brief Runs the loop on the calling thread until stop() is called. */
    void run();

    /** @brief Makes run() return. Queued tasks that have not started are dropped. */
    void stop();

    bool is_stopped() const { return queue_.is_stopped(); }

    /**
     * @brief Runs queued tasks and due timers on the calling thread until neither is left.
     * @details Used by the tests together with a manual clock, and by shutdown code to
     *          flush completions.
     * @return Number of tasks and timers executed.
     */
    size_t run_pending();

    /**
     * @brief Runs `fn` on the dispatcher thread and waits for its result.
     * @details Called from the dispatcher thread itself (or when no loop is running),
     *          `fn` runs inline.
     */
    template <typename R>
    R invoke(std::function<R()> fn) {
        if (!loop_running_ || in_dispatcher_thread()) {
            return fn();
        }
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();
        bool queued = post([promise, fn]() {
            if constexpr (std::is_void_v<R>) {
                fn();
                promise->set_value();
            } else {
                promise->set_value(fn());
            }
        });
        if (!queued) {
            return fn();
        }
        return future.get();
    }

    bool in_dispatcher_thread() const;
    bool is_running() const { return loop_running_; }
    const Clock& clock() const { return clock_; }

private:
    struct TimerEntry {
        Clock::time_point deadline;
        Task task;
    };

    /** @brief Fires every timer whose deadline has passed, oldest deadline first. */
    size_t fire_due_timers();

    const Clock& clock_;
    utils::ThreadSafeQueue<Task> queue_;
    std::map<TimerId, TimerEntry> timers_;
    TimerId next_timer_id_ = 1;
    std::atomic<bool> loop_running_{false};
    std::thread::id loop_thread_id_;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_DISPATCHER_H
