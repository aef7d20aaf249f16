#include "dispatcher.h"

#include <algorithm>
#include <vector>

#include "../utils/stas_logger.h"

namespace nvmestas {
namespace engine {

namespace {

// Upper bound on one wait so that stop() and clock changes are noticed promptly.
constexpr auto kMaxIdleWait = std::chrono::milliseconds(500);

} // namespace

Dispatcher::Dispatcher(const Clock& clock) : clock_(clock) {}

Dispatcher::~Dispatcher() {
    stop();
}

bool Dispatcher::post(Task task) {
    return queue_.push(std::move(task));
}

Dispatcher::TimerId Dispatcher::schedule_at(Clock::time_point deadline, Task task) {
    const TimerId id = next_timer_id_++;
    timers_.emplace(id, TimerEntry{deadline, std::move(task)});
    return id;
}

Dispatcher::TimerId Dispatcher::schedule_after(Clock::duration delay, Task task) {
    return schedule_at(clock_.now() + delay, std::move(task));
}

bool Dispatcher::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

bool Dispatcher::is_scheduled(TimerId id) const {
    return timers_.find(id) != timers_.end();
}

std::optional<Clock::time_point> Dispatcher::deadline_of(TimerId id) const {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return std::nullopt;
    }
    return it->second.deadline;
}

std::optional<Clock::time_point> Dispatcher::next_deadline() const {
    std::optional<Clock::time_point> earliest;
    for (const auto& entry : timers_) {
        if (!earliest || entry.second.deadline < *earliest) {
            earliest = entry.second.deadline;
        }
    }
    return earliest;
}

bool Dispatcher::in_dispatcher_thread() const {
    return loop_running_ && std::this_thread::get_id() == loop_thread_id_;
}

size_t Dispatcher::fire_due_timers() {
    const auto now = clock_.now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& entry : timers_) {
        if (entry.second.deadline <= now) {
            due.emplace_back(entry.second.deadline, entry.first);
        }
    }
    std::sort(due.begin(), due.end());

    size_t fired = 0;
    for (const auto& item : due) {
        // An earlier callback may have cancelled or re-armed this one.
        auto it = timers_.find(item.second);
        if (it == timers_.end() || it->second.deadline > now) {
            continue;
        }
        Task task = std::move(it->second.task);
        timers_.erase(it);
        task();
        ++fired;
    }
    return fired;
}

size_t Dispatcher::run_pending() {
    size_t executed = 0;
    for (;;) {
        size_t round = 0;
        Task task;
        while (queue_.try_pop(task)) {
            task();
            ++round;
        }
        round += fire_due_timers();
        if (round == 0) {
            break;
        }
        executed += round;
    }
    return executed;
}

void Dispatcher::run() {
    loop_thread_id_ = std::this_thread::get_id();
    loop_running_ = true;
    LOG_STAS_DEBUG("Dispatcher loop started.");

    while (!queue_.is_stopped()) {
        fire_due_timers();

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(kMaxIdleWait);
        if (auto deadline = next_deadline()) {
            const auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock_.now());
            wait = std::max(std::chrono::milliseconds(0), std::min(wait, until));
        }

        Task task;
        if (queue_.pop_for(task, wait)) {
            task();
            while (!queue_.is_stopped() && queue_.try_pop(task)) {
                task();
            }
        }
    }

    loop_running_ = false;
    queue_.clear();
    LOG_STAS_DEBUG("Dispatcher loop finished.");
}

void Dispatcher::stop() {
    queue_.stop();
    if (!loop_running_) {
        queue_.clear();
    }
}

} // namespace engine
} // namespace nvmestas
