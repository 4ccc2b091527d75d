// SPDX-License-Identifier: Apache-2.0
#include <vtlayout/Scheduler.h>

#include <crispy/assert.h>

#include <algorithm>

namespace vtlayout
{

// {{{ DeferredCallback
void DeferredCallback::arm(Scheduler::Duration delay, Scheduler::Callback callback)
{
    Require(callback);
    cancel();

    auto const generation = ++_generation;
    _deadline = _scheduler->now() + delay;
    _pending = _scheduler->schedule(delay, [this, generation, fn = std::move(callback)]() {
        if (generation != _generation)
            return;
        _pending.reset();
        _deadline.reset();
        fn();
    });
}

void DeferredCallback::cancel()
{
    if (_pending)
    {
        _scheduler->cancel(*_pending);
        _pending.reset();
    }
    _deadline.reset();
    ++_generation;
}
// }}}

// {{{ ManualScheduler
Scheduler::TimerId ManualScheduler::schedule(Duration delay, Callback callback)
{
    auto const id = _nextId++;
    _timers.emplace(Key { _now + std::max(delay, Duration::zero()), id }, std::move(callback));
    return id;
}

void ManualScheduler::cancel(TimerId id)
{
    auto const i =
        std::find_if(_timers.begin(), _timers.end(), [id](auto const& entry) { return entry.first.second == id; });
    if (i != _timers.end())
        _timers.erase(i);
}

size_t ManualScheduler::advance(Duration duration)
{
    auto const target = _now + duration;
    auto invoked = size_t { 0 };

    while (!_timers.empty() && _timers.begin()->first.first <= target)
    {
        auto node = _timers.extract(_timers.begin());
        _now = node.key().first;
        node.mapped()();
        ++invoked;
    }

    _now = target;
    return invoked;
}
// }}}

} // namespace vtlayout
