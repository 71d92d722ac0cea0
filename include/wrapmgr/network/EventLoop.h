#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "wrapmgr/common/noncopyable.h"
#include "wrapmgr/network/Channel.h"
#include "wrapmgr/network/EpollPoller.h"

namespace wrapmgr {
namespace network {

using TimerId = uint64_t;

class EventLoop : wrapmgr::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    // Timers are backed by one timerfd each and fire on the loop thread.
    // Safe to call from any thread; the returned id is valid immediately.
    TimerId RunAfter(double delaySec, Functor cb);
    TimerId RunEvery(double intervalSec, Functor cb);
    // Cancelling an already-fired one-shot timer or an unknown id is a no-op.
    void Cancel(TimerId id);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    struct Timer;

    void HandleRead(); // For wakeup
    void DoPendingFunctors();
    void AddTimerInLoop(const std::shared_ptr<Timer>& timer);
    void HandleTimer(TimerId id);
    std::shared_ptr<Timer> DetachTimer(TimerId id);

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<EpollPoller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;

    std::atomic<TimerId> next_timer_id_{1};
    std::map<TimerId, std::shared_ptr<Timer>> timers_; // loop thread only
};

} // namespace network
} // namespace wrapmgr
