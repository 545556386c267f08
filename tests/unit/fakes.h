#pragma once

/**
 * @file fakes.h
 * @brief In-memory stand-ins for the windowing collaborators
 *
 * Surfaces record every call in a FakeSurfaceState that outlives the handle,
 * so tests can inspect a surface after its controller has been destroyed.
 */

#include "capture_session.h"
#include "surface.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct FakeSurfaceState {
    ui::ScreenCoord position{0, 0};
    std::vector<ui::ScreenCoord> moves;
    ui::WindowDimension size{.height = 0, .width = 0};
    // Every resize() after the initial size-to-content
    std::vector<ui::WindowDimension> resizes;
    std::string text;
    double opacity = 0.0;
    bool topmost = false;
    bool shown = false;
    int destroy_calls = 0;
    bool throw_on_destroy = false;
    bool throw_on_show = false;
    PointerListener *listener = nullptr;

    bool destroyed() const { return destroy_calls > 0; }
};

class FakeSurface : public SurfaceHandle
{
  public:
    FakeSurface(std::shared_ptr<FakeSurfaceState> state,
                ui::WindowDimension content_size,
                std::vector<std::string> &destroy_log)
        : state_(std::move(state)), content_size_(content_size),
          destroy_log_(destroy_log)
    {
    }

    void move(ui::ScreenCoord top_left) override
    {
        state_->position = top_left;
        state_->moves.push_back(top_left);
    }

    ui::WindowDimension resize_to_content(const std::string &text,
                                          ui::WindowDimension minimum) override
    {
        state_->text = text;
        state_->size = {
            .height = std::max(content_size_.height, minimum.height),
            .width = std::max(content_size_.width, minimum.width),
        };
        return state_->size;
    }

    void resize(ui::WindowDimension size) override
    {
        state_->size = size;
        state_->resizes.push_back(size);
    }

    void set_opacity(double opacity) override { state_->opacity = opacity; }
    void set_topmost(bool topmost) override { state_->topmost = topmost; }
    void show() override
    {
        if (state_->throw_on_show) {
            throw std::runtime_error("map failed");
        }
        state_->shown = true;
    }

    void destroy() override
    {
        ++state_->destroy_calls;
        destroy_log_.push_back(state_->text);
        state_->listener = nullptr;
        if (state_->throw_on_destroy) {
            throw std::runtime_error("destroy failed");
        }
    }

    void subscribe_pointer(PointerListener *listener) override
    {
        state_->listener = listener;
    }

  private:
    std::shared_ptr<FakeSurfaceState> state_;
    ui::WindowDimension content_size_;
    std::vector<std::string> &destroy_log_;
};

class FakeSurfaceProvider : public SurfaceProvider
{
  public:
    std::unique_ptr<SurfaceHandle> acquire_surface() override
    {
        ++acquire_calls;
        if (fail_next_acquire) {
            fail_next_acquire = false;
            throw SurfaceCreationError("no display");
        }
        auto state = std::make_shared<FakeSurfaceState>();
        state->throw_on_show = fail_next_show;
        fail_next_show = false;
        states.push_back(state);
        return std::make_unique<FakeSurface>(state, content_size, destroyed);
    }

    ui::WindowDimension screen_size() const override { return screen; }

    // Simulates a pointer event arriving from the windowing system
    void deliver(size_t index, const ui::PointerEvent &event)
    {
        if (PointerListener *listener = states.at(index)->listener) {
            listener->on_pointer_event(event);
        }
    }

    ui::WindowDimension screen{.height = 1080, .width = 1920};
    // Size every surface reports for its text (before the minimum applies)
    ui::WindowDimension content_size{.height = 60, .width = 240};
    bool fail_next_acquire = false;
    // The next surface is acquired but cannot be shown
    bool fail_next_show = false;
    int acquire_calls = 0;
    // Text of every destroyed surface, in destruction order
    std::vector<std::string> destroyed;
    std::vector<std::shared_ptr<FakeSurfaceState>> states;
};

// Behaves like a real prompt: one callback per show(), then hides itself
class FakePrompt : public InputPrompt
{
  public:
    void show(const std::string &prompt, CaptureListener &listener) override
    {
        if (throw_on_show) {
            throw std::runtime_error("prompt unavailable");
        }
        ++show_calls;
        last_prompt = prompt;
        listener_ = &listener;
        open = true;
    }

    void focus() override { ++focus_calls; }

    void hide() override
    {
        ++hide_calls;
        listener_ = nullptr;
        open = false;
    }

    void type_and_submit(const std::string &text)
    {
        CaptureListener *listener = listener_;
        if (listener) {
            listener->on_submit(text);
        }
        hide();
    }

    void press_escape()
    {
        CaptureListener *listener = listener_;
        if (listener) {
            listener->on_cancel();
        }
        hide();
    }

    // nullptr while closed
    CaptureListener *listener() const { return listener_; }

    bool open = false;
    bool throw_on_show = false;
    int show_calls = 0;
    int focus_calls = 0;
    int hide_calls = 0;
    std::string last_prompt;

  private:
    CaptureListener *listener_ = nullptr;
};

// Keeps the question open until the test answers it
class FakeConfirmDialog : public ConfirmDialog
{
  public:
    void ask(const std::string &question, ui::ScreenCoord near,
             AnswerFn answer) override
    {
        if (throw_on_ask) {
            throw std::runtime_error("dialog unavailable");
        }
        ++ask_calls;
        last_question = question;
        last_near = near;
        // The open question loses
        AnswerFn previous = std::move(pending_);
        pending_ = std::move(answer);
        if (previous) {
            previous(false);
        }
    }

    void dismiss() override
    {
        ++dismiss_calls;
        pending_ = nullptr;
    }

    void answer(bool confirmed)
    {
        AnswerFn pending = std::move(pending_);
        pending_ = nullptr;
        if (pending) {
            pending(confirmed);
        }
    }

    bool open() const { return static_cast<bool>(pending_); }

    bool throw_on_ask = false;
    int ask_calls = 0;
    int dismiss_calls = 0;
    std::string last_question;
    ui::ScreenCoord last_near{0, 0};

  private:
    AnswerFn pending_;
};

class FakeNotifier : public Notifier
{
  public:
    void notify(const std::string &title, const std::string &body) override
    {
        messages.emplace_back(title, body);
    }

    std::vector<std::pair<std::string, std::string>> messages;
};

class RecordingListener : public CaptureListener
{
  public:
    void on_submit(const std::string &text) override
    {
        submitted.push_back(text);
    }
    void on_cancel() override { ++cancels; }

    std::vector<std::string> submitted;
    int cancels = 0;
};
