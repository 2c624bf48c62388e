#include "sched/send_queue.hpp"
#include "util/log.hpp"

namespace sched
{

SendQueue::SendQueue(std::unique_ptr<ITimer> timer, std::chrono::milliseconds period, Sink sink)
    : timer_(std::move(timer)), period_(period), sink_(std::move(sink))
{
}

SendQueue::~SendQueue()
{
    timer_->stop();
}

void SendQueue::enqueue(transport::Message m)
{
    q_.push_back(std::move(m));
    // empty -> non-empty starts the drain loop
    if (!timer_->active())
        timer_->start(period_, [this] { tick(); });
}

void SendQueue::clear()
{
    if (!q_.empty())
        LOG_DEBUG("SendQueue: discarding %zu queued messages", q_.size());
    q_.clear();
    epoch_++;
    timer_->stop();
}

void SendQueue::tick()
{
    if (q_.empty())
    {
        timer_->stop();
        return;
    }

    transport::Message m     = std::move(q_.front());
    const std::uint64_t epoch = epoch_;
    q_.pop_front();

    const bool ok = sink_(m);
    if (epoch != epoch_)
        return;  // cleared from inside the sink

    if (!ok)
    {
        // back to the head: the stream keeps its enqueue order
        retries_++;
        LOG_DEBUG("SendQueue: hand-off failed, retrying next tick (%zu queued)", q_.size() + 1);
        q_.push_front(std::move(m));
        return;
    }

    if (q_.empty())
        timer_->stop();
}

}  // namespace sched
