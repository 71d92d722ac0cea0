#pragma once

#include "wrapmgr/common/noncopyable.h"

#include <functional>

namespace wrapmgr {
namespace network {

class EventLoop;

// Binds one fd to its event callbacks on a single loop. Does not own the fd.
class Channel : wrapmgr::common::noncopyable {
public:
    using EventCallback = std::function<void()>;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void HandleEvent();

    void SetReadCallback(EventCallback cb) { read_callback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { write_callback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { error_callback_ = std::move(cb); }
    void ClearCallbacks();

    int fd() const { return fd_; }
    int events() const { return events_; }
    void set_revents(int revt) { revents_ = revt; }
    bool IsNoneEvent() const { return events_ == kNoneEvent; }

    void EnableReading() { events_ |= kReadEvent; Update(); }
    void DisableReading() { events_ &= ~kReadEvent; Update(); }
    void EnableWriting() { events_ |= kWriteEvent; Update(); }
    void DisableWriting() { events_ &= ~kWriteEvent; Update(); }
    void DisableAll() { events_ = kNoneEvent; Update(); }

    bool IsWriting() const { return events_ & kWriteEvent; }

    int index() const { return index_; }
    void set_index(int idx) { index_ = idx; }

    void Remove();
    // DisableAll + Remove, tolerant of a channel that was never registered.
    void Detach();

private:
    void Update();

    static const int kNoneEvent;
    static const int kReadEvent;
    static const int kWriteEvent;

    EventLoop* loop_;
    const int fd_;
    int events_;
    int revents_;
    int index_; // Used by EpollPoller
    bool added_to_loop_;

    EventCallback read_callback_;
    EventCallback write_callback_;
    EventCallback error_callback_;
};

} // namespace network
} // namespace wrapmgr
