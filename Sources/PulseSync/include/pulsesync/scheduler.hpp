#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <memory>
#include <map>
#include <chrono>
#include <cstdint>

namespace pulsesync {

// ============================================================================
// Timer service - abstract source of time and scheduled callbacks
// ============================================================================
//
// Everything in PulseSync runs on one logical thread. Periodic work (probes,
// queue drains, auto-sync) and write backoff go through this interface so that
// an application can plug in its own run loop and tests can drive virtual time.
//
// Implementations:
// - manual_timer_service: virtual time, advanced explicitly (tests)
// - run_loop_timer_service: wall clock, pumped from the caller's loop

class timer_service {
public:
    using task = std::function<void()>;
    using timer_id = uint64_t;

    virtual ~timer_service() = default;

    [[nodiscard]] virtual millis_t now_ms() const = 0;

    // Run fn every interval (first run one interval from now). Interval must be positive.
    virtual timer_id schedule_every(std::chrono::milliseconds interval, task fn) = 0;

    // Run fn once after delay.
    virtual timer_id schedule_after(std::chrono::milliseconds delay, task fn) = 0;

    // Cancel a pending timer. Unknown or already-fired ids are ignored.
    virtual void cancel(timer_id id) = 0;

    // Block the logical thread for d (write backoff).
    virtual void sleep_for(std::chrono::milliseconds d) = 0;
};

// ============================================================================
// scheduled_task - Retains a timer until destroyed (move-only)
// ============================================================================

class scheduled_task {
public:
    scheduled_task() = default;

    scheduled_task(timer_service& timers, timer_service::timer_id id)
        : timers_(&timers), id_(id) {}

    ~scheduled_task() {
        cancel();
    }

    scheduled_task(const scheduled_task&) = delete;
    scheduled_task& operator=(const scheduled_task&) = delete;

    scheduled_task(scheduled_task&& other) noexcept
        : timers_(other.timers_), id_(other.id_) {
        other.timers_ = nullptr;
        other.id_ = 0;
    }

    scheduled_task& operator=(scheduled_task&& other) noexcept {
        if (this != &other) {
            cancel();
            timers_ = other.timers_;
            id_ = other.id_;
            other.timers_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }

    void cancel() {
        if (timers_) {
            timers_->cancel(id_);
            timers_ = nullptr;
            id_ = 0;
        }
    }

    [[nodiscard]] bool is_active() const noexcept {
        return timers_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_active();
    }

private:
    timer_service* timers_ = nullptr;
    timer_service::timer_id id_ = 0;
};

// ============================================================================
// timer_queue - shared bookkeeping for the concrete services
// ============================================================================

class timer_queue {
public:
    timer_service::timer_id add(millis_t due, millis_t interval, timer_service::task fn);
    void remove(timer_service::timer_id id);

    // Fire the earliest timer due at or before `until`. Returns its due time,
    // or -1 if nothing was due. Callbacks may add or cancel timers.
    millis_t fire_next(millis_t until);

    [[nodiscard]] std::optional<millis_t> next_due() const;
    [[nodiscard]] size_t size() const noexcept { return timers_.size(); }

private:
    struct entry {
        millis_t due;
        millis_t interval;  // 0 = one-shot
        timer_service::task fn;
    };

    std::map<timer_service::timer_id, entry> timers_;
    timer_service::timer_id next_id_ = 1;
};

// ============================================================================
// Manual timer service - virtual time for deterministic tests
// ============================================================================
//
// Time only moves through advance(). sleep_for() moves the clock without
// firing timers (it is called from inside operations, not from the loop) and
// is accounted separately so tests can assert on backoff.

class manual_timer_service : public timer_service {
public:
    explicit manual_timer_service(millis_t start_ms = 1700000000000) : now_(start_ms) {}

    [[nodiscard]] millis_t now_ms() const override { return now_; }

    timer_id schedule_every(std::chrono::milliseconds interval, task fn) override;
    timer_id schedule_after(std::chrono::milliseconds delay, task fn) override;
    void cancel(timer_id id) override;
    void sleep_for(std::chrono::milliseconds d) override;

    // Move virtual time forward, firing every timer that falls due, in order.
    void advance(std::chrono::milliseconds d);

    void set_now(millis_t now) { now_ = now; }

    [[nodiscard]] size_t pending_count() const noexcept { return queue_.size(); }
    [[nodiscard]] std::chrono::milliseconds total_slept() const noexcept { return slept_; }

private:
    millis_t now_;
    std::chrono::milliseconds slept_{0};
    timer_queue queue_;
};

// ============================================================================
// Run loop timer service - wall clock, pumped by the application
// ============================================================================
//
// Call run_pending() from your main loop (or run_for() in a CLI) to deliver
// due timers on the calling thread.

class run_loop_timer_service : public timer_service {
public:
    [[nodiscard]] millis_t now_ms() const override { return system_now_ms(); }

    timer_id schedule_every(std::chrono::milliseconds interval, task fn) override;
    timer_id schedule_after(std::chrono::milliseconds delay, task fn) override;
    void cancel(timer_id id) override;
    void sleep_for(std::chrono::milliseconds d) override;

    // Fire every timer currently due. Returns how many fired.
    size_t run_pending();

    // Pump timers until the deadline passes.
    void run_for(std::chrono::milliseconds d);

private:
    timer_queue queue_;
};

} // namespace pulsesync

#endif // __cplusplus
