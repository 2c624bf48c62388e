#include <algorithm>
#include <thread>
#include <vector>

#include "sched/event_loop.hpp"
#include "sched/timer.hpp"

namespace sched
{

void EventLoop::post(Task t)
{
    posted_.push_back(std::move(t));
}

EventLoop::TimerId EventLoop::add_periodic(std::chrono::milliseconds period, Task t)
{
    const TimerId id = next_id_++;
    timers_[id]      = Timer{period, Clock::now() + period, std::move(t)};
    return id;
}

void EventLoop::cancel(TimerId id)
{
    timers_.erase(id);
}

bool EventLoop::run_once(std::chrono::milliseconds max_wait)
{
    // tasks posted while these run wait for the next round
    std::deque<Task> ready;
    ready.swap(posted_);
    for (auto &t : ready)
        t();

    if (timers_.empty())
        return !posted_.empty();

    auto now  = Clock::now();
    auto next = timers_.begin()->second.next;
    for (const auto &kv : timers_)
        next = std::min(next, kv.second.next);

    if (next > now)
    {
        if (!posted_.empty())
            return true;
        const Clock::duration wait =
            std::min<Clock::duration>(next - now, std::chrono::duration_cast<Clock::duration>(max_wait));
        std::this_thread::sleep_for(wait);
        now = Clock::now();
    }

    std::vector<TimerId> due;
    for (const auto &kv : timers_)
    {
        if (kv.second.next <= now)
            due.push_back(kv.first);
    }
    for (TimerId id : due)
    {
        auto it = timers_.find(id);
        if (it == timers_.end())
            continue;  // cancelled by an earlier callback
        Timer &t = it->second;
        t.next += t.period;
        if (t.next < now)
            t.next = now + t.period;  // no catch-up bursts after a stall
        // copy: the callback may cancel its own timer
        Task fn = t.fn;
        fn();
    }
    return !timers_.empty() || !posted_.empty();
}

bool EventLoop::run_until(const std::function<bool()> &done, std::chrono::milliseconds timeout)
{
    const auto deadline = Clock::now() + timeout;
    while (!done())
    {
        const auto now = Clock::now();
        if (now >= deadline)
            break;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!run_once(left))
            break;  // nothing left that could make progress
    }
    return done();
}

void LoopTimer::start(std::chrono::milliseconds period, std::function<void()> on_tick)
{
    stop();
    id_ = loop_.add_periodic(period, std::move(on_tick));
}

void LoopTimer::stop()
{
    if (id_ == 0)
        return;
    loop_.cancel(id_);
    id_ = 0;
}

}  // namespace sched
