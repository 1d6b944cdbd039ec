#include "pulsesync/scheduler.hpp"
#include <stdexcept>
#include <thread>
#include <algorithm>

namespace pulsesync {

// ============================================================================
// timer_queue
// ============================================================================

timer_service::timer_id timer_queue::add(millis_t due, millis_t interval, timer_service::task fn) {
    auto id = next_id_++;
    timers_.emplace(id, entry{due, interval, std::move(fn)});
    return id;
}

void timer_queue::remove(timer_service::timer_id id) {
    timers_.erase(id);
}

millis_t timer_queue::fire_next(millis_t until) {
    // Earliest due first; ties go to the lower id (registration order)
    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due > until) continue;
        if (next == timers_.end() || it->second.due < next->second.due) {
            next = it;
        }
    }
    if (next == timers_.end()) return -1;

    millis_t due = next->second.due;
    // Copy: the callback may cancel its own timer.
    auto fn = next->second.fn;
    if (next->second.interval > 0) {
        next->second.due += next->second.interval;
    } else {
        timers_.erase(next);
    }

    if (fn) fn();
    return due;
}

std::optional<millis_t> timer_queue::next_due() const {
    std::optional<millis_t> result;
    for (const auto& [id, e] : timers_) {
        if (!result || e.due < *result) result = e.due;
    }
    return result;
}

// ============================================================================
// manual_timer_service
// ============================================================================

timer_service::timer_id manual_timer_service::schedule_every(std::chrono::milliseconds interval, task fn) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("schedule_every requires a positive interval");
    }
    return queue_.add(now_ + interval.count(), interval.count(), std::move(fn));
}

timer_service::timer_id manual_timer_service::schedule_after(std::chrono::milliseconds delay, task fn) {
    return queue_.add(now_ + std::max<millis_t>(0, delay.count()), 0, std::move(fn));
}

void manual_timer_service::cancel(timer_id id) {
    queue_.remove(id);
}

void manual_timer_service::sleep_for(std::chrono::milliseconds d) {
    now_ += d.count();
    slept_ += d;
}

void manual_timer_service::advance(std::chrono::milliseconds d) {
    millis_t target = now_ + d.count();
    while (true) {
        auto due = queue_.next_due();
        if (!due || *due > target) break;
        now_ = std::max(now_, *due);
        queue_.fire_next(now_);
        // A callback that slept may have pushed the clock past the target
        target = std::max(target, now_);
    }
    now_ = target;
}

// ============================================================================
// run_loop_timer_service
// ============================================================================

timer_service::timer_id run_loop_timer_service::schedule_every(std::chrono::milliseconds interval, task fn) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("schedule_every requires a positive interval");
    }
    return queue_.add(now_ms() + interval.count(), interval.count(), std::move(fn));
}

timer_service::timer_id run_loop_timer_service::schedule_after(std::chrono::milliseconds delay, task fn) {
    return queue_.add(now_ms() + std::max<millis_t>(0, delay.count()), 0, std::move(fn));
}

void run_loop_timer_service::cancel(timer_id id) {
    queue_.remove(id);
}

void run_loop_timer_service::sleep_for(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

size_t run_loop_timer_service::run_pending() {
    size_t fired = 0;
    millis_t now = now_ms();
    while (queue_.fire_next(now) >= 0) {
        ++fired;
    }
    return fired;
}

void run_loop_timer_service::run_for(std::chrono::milliseconds d) {
    millis_t deadline = now_ms() + d.count();
    while (true) {
        run_pending();
        millis_t now = now_ms();
        if (now >= deadline) break;

        millis_t wake = deadline;
        if (auto due = queue_.next_due()) {
            wake = std::min(wake, *due);
        }
        if (wake > now) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wake - now));
        }
    }
}

} // namespace pulsesync
