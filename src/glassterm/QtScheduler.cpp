// SPDX-License-Identifier: Apache-2.0
#include <glassterm/QtScheduler.h>

#include <algorithm>

namespace glassterm
{

QtScheduler::~QtScheduler()
{
    for (auto& [id, timer]: _timers)
        timer->stop();
    _timers.clear();
    // The timers themselves are owned (and deleted) by _context.
}

QtScheduler::TimerId QtScheduler::schedule(Duration delay, Callback callback)
{
    auto const id = _nextId++;
    auto* timer = new QTimer(&_context);
    timer->setSingleShot(true);
    timer->setTimerType(Qt::PreciseTimer);

    QObject::connect(timer, &QTimer::timeout, &_context, [this, id, timer, callback = std::move(callback)]() {
        _timers.erase(id);
        timer->deleteLater();
        callback();
    });

    _timers.emplace(id, timer);
    timer->start(static_cast<int>(std::max(delay, Duration::zero()).count()));
    return id;
}

void QtScheduler::cancel(TimerId id)
{
    auto const i = _timers.find(id);
    if (i == _timers.end())
        return;

    i->second->stop();
    i->second->deleteLater();
    _timers.erase(i);
}

} // namespace glassterm
