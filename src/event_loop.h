#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <vector>

// Single-threaded epoll loop. All callbacks run on the thread that calls
// run().
class EventLoop
{
  public:
    using FdCallback = std::function<void(uint32_t events)>;
    using Step = std::function<void()>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    void add_fd(int fd, uint32_t events, FdCallback callback);
    // Runs once before waiting and after every batch of fd callbacks
    void add_post_step(Step step);

    // SIGINT and SIGTERM call on_signal from the loop thread
    void watch_termination_signals(Step on_signal);

    // Returns after stop()
    void run();
    void stop() { running_ = false; }

  private:
    struct Source {
        int fd;
        FdCallback callback;
    };

    int epoll_fd_ = -1;
    std::list<Source> sources_;
    std::vector<Step> post_steps_;
    bool running_ = false;
    bool signals_installed_ = false;
};
