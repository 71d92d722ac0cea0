#include "wrapmgr/network/Channel.h"
#include "wrapmgr/network/EventLoop.h"
#include "wrapmgr/common/Logger.h"

#include <sys/epoll.h>

namespace wrapmgr {
namespace network {

const int Channel::kNoneEvent = 0;
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(0),
      revents_(0),
      index_(-1),
      added_to_loop_(false) {
}

Channel::~Channel() {
    if (added_to_loop_) {
        LOG_WARN << "Channel fd=" << fd_ << " destroyed while still registered";
    }
}

void Channel::Update() {
    added_to_loop_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    added_to_loop_ = false;
    loop_->RemoveChannel(this);
}

void Channel::Detach() {
    if (!added_to_loop_) return;
    DisableAll();
    Remove();
}

void Channel::ClearCallbacks() {
    read_callback_ = nullptr;
    write_callback_ = nullptr;
    error_callback_ = nullptr;
}

void Channel::HandleEvent() {
    // A callback may detach this channel; copy the callbacks so the ones that
    // are still pending run against live std::function objects.
    const int revents = revents_;
    // A bare EPOLLHUP after EOF was consumed is left to the owner's next read
    // or write.
    if (revents & EPOLLERR) {
        EventCallback cb = error_callback_;
        if (cb) cb();
    }

    if (revents & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        EventCallback cb = read_callback_;
        if (cb) cb();
    }

    if (revents & EPOLLOUT) {
        EventCallback cb = write_callback_;
        if (cb) cb();
    }
}

} // namespace network
} // namespace wrapmgr
