#include "restartable_timer.h"

namespace nvmestas {
namespace engine {

RestartableTimer::RestartableTimer(Dispatcher& dispatcher, Clock::duration timeout, Callback callback)
    : dispatcher_(dispatcher), timeout_(timeout), callback_(std::move(callback)) {}

RestartableTimer::~RestartableTimer() {
    stop();
}

void RestartableTimer::start() {
    stop();
    timer_id_ = dispatcher_.schedule_after(timeout_, [this]() {
        timer_id_ = 0;
        if (callback_) {
            callback_();
        }
    });
}

void RestartableTimer::start(Clock::duration timeout) {
    timeout_ = timeout;
    start();
}

void RestartableTimer::stop() {
    if (timer_id_ != 0) {
        dispatcher_.cancel(timer_id_);
        timer_id_ = 0;
    }
}

bool RestartableTimer::is_running() const {
    return timer_id_ != 0 && dispatcher_.is_scheduled(timer_id_);
}

Clock::duration RestartableTimer::time_remaining() const {
    if (timer_id_ == 0) {
        return Clock::duration::zero();
    }
    auto deadline = dispatcher_.deadline_of(timer_id_);
    if (!deadline) {
        return Clock::duration::zero();
    }
    const auto remaining = *deadline - dispatcher_.clock().now();
    return remaining > Clock::duration::zero() ? remaining : Clock::duration::zero();
}

} // namespace engine
} // namespace nvmestas
