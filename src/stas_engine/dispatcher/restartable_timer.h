#ifndef STAS_RESTARTABLE_TIMER_H
#define STAS_RESTARTABLE_TIMER_H

#include <chrono>
#include <functional>

#include "dispatcher.h"

namespace nvmestas {
namespace engine {

/**
 * @brief Single-shot timer bound to a Dispatcher.
 * @details start() on a running timer moves its deadline to now + timeout instead of
 *          arming a second one. The callback runs on the dispatcher thread. Destroying
 *          the timer disarms it. Dispatcher thread only.
 */
class RestartableTimer {
public:
    using Callback = std::function<void()>;

    RestartableTimer(Dispatcher& dispatcher, Clock::duration timeout, Callback callback);
    ~RestartableTimer();

    RestartableTimer(const RestartableTimer&) = delete;
    RestartableTimer& operator=(const RestartableTimer&) = delete;

    void start();
    void start(Clock::duration timeout);
    void stop();

    void set_timeout(Clock::duration timeout) { timeout_ = timeout; }
    Clock::duration timeout() const { return timeout_; }

    bool is_running() const;

    /** @brief Zero when not running. */
    Clock::duration time_remaining() const;

private:
    Dispatcher& dispatcher_;
    Clock::duration timeout_;
    Callback callback_;
    Dispatcher::TimerId timer_id_ = 0;
};

} // namespace engine
} // namespace nvmestas

#endif // STAS_RESTARTABLE_TIMER_H
