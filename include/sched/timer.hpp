#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace sched
{

class EventLoop;

// Periodic tick source driving a SendQueue.
struct ITimer
{
    virtual void start(std::chrono::milliseconds period, std::function<void()> on_tick) = 0;
    virtual void stop()                                                                 = 0;
    virtual bool active() const                                                         = 0;
    virtual ~ITimer() = default;
};

class LoopTimer final : public ITimer
{
  public:
    explicit LoopTimer(EventLoop &loop) : loop_(loop) {}
    ~LoopTimer() override { stop(); }

    void start(std::chrono::milliseconds period, std::function<void()> on_tick) override;
    void stop() override;
    bool active() const override { return id_ != 0; }

  private:
    EventLoop    &loop_;
    std::uint64_t id_{0};
};

}  // namespace sched
