#include "posted_events.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/eventfd.h>
#include <unistd.h>

PostedEvents::PostedEvents()
{
    event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        throw std::runtime_error("Failed to create eventfd: " +
                                 std::string(strerror(errno)));
    }
}

PostedEvents::~PostedEvents()
{
    if (event_fd_ >= 0) {
        close(event_fd_);
    }
}

bool PostedEvents::post(LoopEvent event) noexcept
{
    const auto write = write_pos_.load(std::memory_order_relaxed);
    const auto next_write = (write + 1) & mask_;

    if (next_write == read_pos_.load(std::memory_order_acquire)) {
        return false;
    }

    buffer_[write] = event;
    write_pos_.store(next_write, std::memory_order_release);

    // Counter overflow (EAGAIN) still leaves the fd readable
    const uint64_t one = 1;
    [[maybe_unused]] const auto written = ::write(event_fd_, &one, sizeof(one));
    return true;
}

bool PostedEvents::try_pop(LoopEvent &event) noexcept
{
    const auto read = read_pos_.load(std::memory_order_relaxed);

    if (read == write_pos_.load(std::memory_order_acquire)) {
        return false;
    }

    event = buffer_[read];
    read_pos_.store((read + 1) & mask_, std::memory_order_release);
    return true;
}

void PostedEvents::clear_wakeup() noexcept
{
    // Reset before popping: a post racing with drain() re-arms the fd
    uint64_t count = 0;
    [[maybe_unused]] const auto n = read(event_fd_, &count, sizeof(count));
}
