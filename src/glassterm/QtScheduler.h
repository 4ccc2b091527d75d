// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtlayout/Scheduler.h>

#include <QtCore/QObject>
#include <QtCore/QTimer>

#include <unordered_map>

namespace glassterm
{

/// Runs deferred callbacks as single shot timers on the Qt event loop of the calling thread.
class QtScheduler final: public vtlayout::Scheduler
{
  public:
    QtScheduler() = default;
    QtScheduler(QtScheduler const&) = delete;
    QtScheduler& operator=(QtScheduler const&) = delete;
    ~QtScheduler() override;

    [[nodiscard]] TimePoint now() const override { return Clock::now(); }
    TimerId schedule(Duration delay, Callback callback) override;
    void cancel(TimerId id) override;

    [[nodiscard]] size_t pendingCount() const noexcept { return _timers.size(); }

  private:
    QObject _context;
    TimerId _nextId = 1;
    std::unordered_map<TimerId, QTimer*> _timers;
};

} // namespace glassterm
