#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>

namespace sched
{

// Single-threaded loop: posted tasks and periodic timers, all run on the
// thread calling run_once()/run_until(). Not safe to touch from other threads.
class EventLoop
{
  public:
    using Clock   = std::chrono::steady_clock;
    using TimerId = std::uint64_t;
    using Task    = std::function<void()>;

    void    post(Task t);
    TimerId add_periodic(std::chrono::milliseconds period, Task t);
    void    cancel(TimerId id);

    // Runs posted tasks, then due timers; sleeps up to `max_wait` for the next
    // deadline. Returns false when nothing is scheduled at all.
    bool run_once(std::chrono::milliseconds max_wait);
    // Loops until `done()` holds or `timeout` elapses; returns done().
    bool run_until(const std::function<bool()> &done, std::chrono::milliseconds timeout);

    std::size_t timers() const { return timers_.size(); }

  private:
    struct Timer
    {
        std::chrono::milliseconds period;
        Clock::time_point         next;
        Task                      fn;
    };

    std::deque<Task>         posted_;
    std::map<TimerId, Timer> timers_;
    TimerId                  next_id_{1};
};

}  // namespace sched
