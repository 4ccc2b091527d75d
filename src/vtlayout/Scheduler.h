// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace vtlayout
{

/// One-shot deferred callbacks on the (single threaded) UI event loop.
///
/// Callbacks are never invoked synchronously from within schedule().
class Scheduler
{
  public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;
    using Callback = std::function<void()>;
    using TimerId = uint64_t;

    virtual ~Scheduler() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Schedules @p callback to be invoked once after @p delay.
    virtual TimerId schedule(Duration delay, Callback callback) = 0;

    /// Cancels a pending callback. Unknown or already fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

/// Holds at most one pending callback.
///
/// Arming replaces (and cancels) any callback still pending, so that a stale
/// callback can never fire after state has moved on.
class DeferredCallback
{
  public:
    explicit DeferredCallback(Scheduler& scheduler) noexcept: _scheduler { &scheduler } {}
    DeferredCallback(DeferredCallback const&) = delete;
    DeferredCallback& operator=(DeferredCallback const&) = delete;
    ~DeferredCallback() { cancel(); }

    void arm(Scheduler::Duration delay, Scheduler::Callback callback);
    void cancel();

    [[nodiscard]] bool pending() const noexcept { return _pending.has_value(); }

    /// Time at which the pending callback is due, if any.
    [[nodiscard]] std::optional<Scheduler::TimePoint> deadline() const noexcept { return _deadline; }

  private:
    Scheduler* _scheduler;
    std::optional<Scheduler::TimerId> _pending;
    std::optional<Scheduler::TimePoint> _deadline;
    uint64_t _generation = 0;
};

/// Scheduler on a virtual clock that only moves forward when advanced explicitly.
///
/// Used by unit tests and the headless simulation to get deterministic timing.
class ManualScheduler final: public Scheduler
{
  public:
    explicit ManualScheduler(TimePoint start = TimePoint {}) noexcept: _now { start } {}

    [[nodiscard]] TimePoint now() const override { return _now; }
    TimerId schedule(Duration delay, Callback callback) override;
    void cancel(TimerId id) override;

    /// Moves the clock forward by @p duration, invoking every callback that
    /// becomes due in deadline order. Callbacks scheduled while advancing are
    /// honored if they fall within the advanced period.
    ///
    /// @returns number of callbacks invoked.
    size_t advance(Duration duration);

    /// Invokes every callback due at the current time.
    size_t runPending() { return advance(Duration::zero()); }

    [[nodiscard]] size_t pendingCount() const noexcept { return _timers.size(); }

  private:
    // Keyed by (deadline, id) so that equal deadlines fire in scheduling order.
    using Key = std::pair<TimePoint, TimerId>;

    TimePoint _now;
    TimerId _nextId = 1;
    std::map<Key, Callback> _timers;
};

} // namespace vtlayout
