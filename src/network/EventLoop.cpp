#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"

#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace wrapmgr {
namespace network {

namespace {

__thread EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

int CreateEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL << "Failed in eventfd: " << std::strerror(errno);
    }
    return evtfd;
}

struct itimerspec ToTimerSpec(double delaySec, double intervalSec) {
    struct itimerspec spec;
    std::memset(&spec, 0, sizeof spec);
    // A zero it_value disarms a timerfd; clamp to 1ms so "now" still fires.
    if (delaySec < 0.001) delaySec = 0.001;
    spec.it_value.tv_sec = static_cast<time_t>(delaySec);
    spec.it_value.tv_nsec = static_cast<long>((delaySec - static_cast<double>(spec.it_value.tv_sec)) * 1e9);
    if (intervalSec > 0.0) {
        if (intervalSec < 0.001) intervalSec = 0.001;
        spec.it_interval.tv_sec = static_cast<time_t>(intervalSec);
        spec.it_interval.tv_nsec = static_cast<long>((intervalSec - static_cast<double>(spec.it_interval.tv_sec)) * 1e9);
    }
    return spec;
}

} // namespace

struct EventLoop::Timer {
    TimerId id{0};
    int fd{-1};
    double delaySec{0.0};
    double intervalSec{0.0};
    Functor cb;
    std::unique_ptr<Channel> channel;

    ~Timer() {
        if (fd >= 0) ::close(fd);
    }
};

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new EpollPoller()),
      wakeup_fd_(CreateEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)) {
    LOG_DEBUG << "EventLoop created " << this << " in thread " << thread_id_;

    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in this thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_->SetReadCallback(std::bind(&EventLoop::HandleRead, this));
    wakeup_channel_->EnableReading();
}

EventLoop::~EventLoop() {
    for (auto& kv : timers_) {
        kv.second->channel->Detach();
    }
    timers_.clear();
    {
        // Drop queued work without running it; captured state may reference
        // objects that are already gone.
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.clear();
    }
    wakeup_channel_->Detach();
    ::close(wakeup_fd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    looping_ = true;
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " start looping";

    // Work queued from this thread before Loop() did not wake the poller.
    DoPendingFunctors();

    while (!quit_) {
        active_channels_.clear();
        poller_->Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent();
        }
        DoPendingFunctors();
    }

    LOG_DEBUG << "EventLoop " << this << " stop looping";
    looping_ = false;
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }

    if (!IsInLoopThread() || calling_pending_functors_) {
        WakeUp();
    }
}

TimerId EventLoop::RunAfter(double delaySec, Functor cb) {
    auto timer = std::make_shared<Timer>();
    timer->id = next_timer_id_.fetch_add(1);
    timer->delaySec = delaySec;
    timer->cb = std::move(cb);
    const TimerId id = timer->id;
    RunInLoop([this, timer]() { AddTimerInLoop(timer); });
    return id;
}

TimerId EventLoop::RunEvery(double intervalSec, Functor cb) {
    auto timer = std::make_shared<Timer>();
    timer->id = next_timer_id_.fetch_add(1);
    timer->delaySec = intervalSec;
    timer->intervalSec = intervalSec;
    timer->cb = std::move(cb);
    const TimerId id = timer->id;
    RunInLoop([this, timer]() { AddTimerInLoop(timer); });
    return id;
}

void EventLoop::Cancel(TimerId id) {
    RunInLoop([this, id]() { DetachTimer(id); });
}

void EventLoop::AddTimerInLoop(const std::shared_ptr<Timer>& timer) {
    timer->fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer->fd < 0) {
        LOG_ERROR << "EventLoop timerfd_create failed: " << std::strerror(errno);
        return;
    }
    struct itimerspec spec = ToTimerSpec(timer->delaySec, timer->intervalSec);
    if (::timerfd_settime(timer->fd, 0, &spec, nullptr) < 0) {
        LOG_ERROR << "EventLoop timerfd_settime failed: " << std::strerror(errno);
        return;
    }

    const TimerId id = timer->id;
    timer->channel.reset(new Channel(this, timer->fd));
    timer->channel->SetReadCallback([this, id]() { HandleTimer(id); });
    timer->channel->EnableReading();
    timers_[id] = timer;
}

std::shared_ptr<EventLoop::Timer> EventLoop::DetachTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return nullptr;

    std::shared_ptr<Timer> timer = it->second;
    timers_.erase(it);
    timer->channel->ClearCallbacks();
    timer->channel->Detach();
    // The channel may be in this iteration's active list; free it afterwards.
    QueueInLoop([timer]() {});
    return timer;
}

void EventLoop::HandleTimer(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) return;

    std::shared_ptr<Timer> timer = it->second;
    uint64_t expirations = 0;
    ssize_t n = ::read(timer->fd, &expirations, sizeof expirations);
    if (n != sizeof expirations) {
        LOG_DEBUG << "EventLoop timer " << id << " read " << n << " bytes";
    }

    if (timer->intervalSec <= 0.0) {
        DetachTimer(id);
    }
    if (timer->cb) timer->cb();
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::WakeUp() writes " << n << " bytes instead of 8";
    }
}

void EventLoop::HandleRead() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::HandleRead() reads " << n << " bytes instead of 8";
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) {
    return poller_->HasChannel(channel);
}

void EventLoop::DoPendingFunctors() {
    std::vector<Functor> functors;
    calling_pending_functors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }

    for (const auto& functor : functors) {
        functor();
    }
    calling_pending_functors_ = false;
}

} // namespace network
} // namespace wrapmgr
