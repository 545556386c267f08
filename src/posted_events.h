#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

enum class LoopEvent : uint8_t {
    Trigger,
    Quit,
};

// Bounded lock-free queue carrying loop events from one producer thread to
// the UI thread. post() wakes the loop through an eventfd; drain() runs on
// the UI thread only.
class PostedEvents
{
  public:
    static constexpr size_t SIZE = 64;
    static_assert((SIZE & (SIZE - 1)) == 0, "Size must be power of 2");

    PostedEvents();
    ~PostedEvents();

    PostedEvents(const PostedEvents &) = delete;
    PostedEvents &operator=(const PostedEvents &) = delete;
    PostedEvents(PostedEvents &&) = delete;
    PostedEvents &operator=(PostedEvents &&) = delete;

    // Returns false when the queue is full; the event is dropped
    bool post(LoopEvent event) noexcept;

    // Hands every queued event to fn in posting order, returns how many
    template <typename Fn> size_t drain(Fn &&fn)
    {
        clear_wakeup();
        size_t count = 0;
        LoopEvent event;
        while (try_pop(event)) {
            fn(event);
            ++count;
        }
        return count;
    }

    // Readable whenever events are pending
    [[nodiscard]] int fd() const noexcept { return event_fd_; }

    [[nodiscard]] static constexpr size_t capacity() noexcept
    {
        return SIZE - 1;
    }

  private:
    bool try_pop(LoopEvent &event) noexcept;
    void clear_wakeup() noexcept;

    static constexpr size_t mask_ = SIZE - 1;

    // alignas ensures that atomics are on separate cache lines
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::array<LoopEvent, SIZE> buffer_{};

    int event_fd_ = -1;
};
