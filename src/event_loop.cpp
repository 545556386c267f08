#include "event_loop.h"
#include "logger.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/epoll.h>
#include <unistd.h>

namespace
{

// Self-pipe: the handler may only do async-signal-safe work
int g_signal_pipe[2] = {-1, -1};

extern "C" void on_termination_signal(int signal_number)
{
    const int saved_errno = errno;
    const auto byte = static_cast<char>(signal_number);
    [[maybe_unused]] const auto n = write(g_signal_pipe[1], &byte, 1);
    errno = saved_errno;
}

[[noreturn]] void throw_errno(const char *what)
{
    throw std::runtime_error(std::string(what) + ": " + strerror(errno));
}

} // anonymous namespace

EventLoop::EventLoop()
{
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw_errno("epoll_create1 failed");
    }
}

EventLoop::~EventLoop()
{
    if (signals_installed_) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        close(g_signal_pipe[0]);
        close(g_signal_pipe[1]);
        g_signal_pipe[0] = g_signal_pipe[1] = -1;
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

void EventLoop::add_fd(int fd, uint32_t events, FdCallback callback)
{
    epoll_event event{};
    event.events = events;
    event.data.ptr = &sources_.emplace_back(Source{fd, std::move(callback)});
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &event) < 0) {
        sources_.pop_back();
        throw_errno("epoll_ctl(ADD) failed");
    }
}

void EventLoop::add_post_step(Step step)
{
    post_steps_.push_back(std::move(step));
}

void EventLoop::watch_termination_signals(Step on_signal)
{
    if (signals_installed_) {
        throw std::runtime_error("Termination signals are already watched");
    }
    if (pipe2(g_signal_pipe, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw_errno("pipe2 failed");
    }

    struct sigaction action{};
    action.sa_handler = on_termination_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    signals_installed_ = true;

    add_fd(g_signal_pipe[0], EPOLLIN,
           [on_signal = std::move(on_signal)](uint32_t) {
               std::array<char, 16> buffer{};
               ssize_t n = 0;
               int last_signal = 0;
               while ((n = read(g_signal_pipe[0], buffer.data(),
                                buffer.size())) > 0) {
                   last_signal = buffer[static_cast<size_t>(n) - 1];
               }
               LOG_INFO("Received signal %d, shutting down", last_signal);
               on_signal();
           });
}

void EventLoop::run()
{
    running_ = true;

    for (auto &step : post_steps_) {
        step();
    }

    while (running_) {
        std::array<epoll_event, 16> events;
        const int ready = epoll_wait(epoll_fd_, events.data(),
                                     static_cast<int>(events.size()), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("epoll_wait failed");
        }

        for (int i = 0; i < ready && running_; ++i) {
            auto *source = static_cast<Source *>(events[i].data.ptr);
            source->callback(events[i].events);
        }

        for (auto &step : post_steps_) {
            step();
        }
    }
    LOG_INFO("Event loop stopped");
}
