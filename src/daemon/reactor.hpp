/**
 * epoll reactor
 *
 * Single-threaded readiness loop: file descriptors are registered with a
 * callback that runs when epoll reports them ready.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>
#include <sys/epoll.h>

namespace dockbox::daemon {

using EventCallback = std::function<void(int fd, uint32_t events)>;

class Reactor {
public:
    Reactor() = default;
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool init();

    bool add(int fd, uint32_t events, EventCallback callback);
    bool modify(int fd, uint32_t events);
    bool remove(int fd);

    // Wait up to `timeout_ms` and dispatch ready callbacks.
    // Returns the number of events handled, or -1 on error.
    int poll(int timeout_ms);

private:
    int epoll_fd_ = -1;
    std::unordered_map<int, EventCallback> callbacks_;
    std::vector<struct epoll_event> events_ = std::vector<struct epoll_event>(64);
};

} // namespace dockbox::daemon
