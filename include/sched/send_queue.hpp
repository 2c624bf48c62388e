#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

#include "sched/timer.hpp"
#include "transport/itransport.hpp"

namespace sched
{

// Paced FIFO in front of a data channel: one message per tick, a failed
// hand-off goes back to the head so the stream order never changes.
class SendQueue
{
  public:
    using Sink = std::function<bool(const transport::Message &)>;

    SendQueue(std::unique_ptr<ITimer> timer, std::chrono::milliseconds period, Sink sink);
    ~SendQueue();

    SendQueue(const SendQueue &)            = delete;
    SendQueue &operator=(const SendQueue &) = delete;

    void enqueue(transport::Message m);
    // drop everything and stop ticking
    void clear();

    std::size_t size() const { return q_.size(); }
    bool        draining() const { return timer_->active(); }
    std::size_t retries() const { return retries_; }

  private:
    void tick();

    std::unique_ptr<ITimer>        timer_;
    std::chrono::milliseconds      period_;
    Sink                           sink_;
    std::deque<transport::Message> q_;
    std::size_t                    retries_{0};
    std::uint64_t                  epoch_{0};  // bumped by clear()
};

}  // namespace sched
