#include "daemon/reactor.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace dockbox::daemon {

Reactor::~Reactor() {
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("epoll_create1 failed: {}", strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    struct epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("epoll_ctl ADD fd={} failed: {}", fd, strerror(errno));
        return false;
    }
    callbacks_[fd] = std::move(callback);
    return true;
}

bool Reactor::modify(int fd, uint32_t events) {
    struct epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        spdlog::error("epoll_ctl MOD fd={} failed: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::remove(int fd) {
    callbacks_.erase(fd);
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        spdlog::debug("epoll_ctl DEL fd={} failed: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

int Reactor::poll(int timeout_ms) {
    int n = epoll_wait(epoll_fd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    for (int i = 0; i < n; ++i) {
        int fd = events_[i].data.fd;
        // A previous callback in this batch may have removed the fd
        auto it = callbacks_.find(fd);
        if (it == callbacks_.end()) {
            continue;
        }
        // Copy: the callback may remove itself
        EventCallback callback = it->second;
        callback(fd, events_[i].events);
    }
    return n;
}

} // namespace dockbox::daemon
