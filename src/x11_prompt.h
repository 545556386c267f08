#pragma once

#include "capture_session.h"
#include "x11_platform.h"
#include "x11_window.h"

#include <optional>
#include <string>

// Single-line text prompt centered on the primary monitor. The window exists
// only while the prompt is shown.
class X11InputPrompt : public InputPrompt, public X11EventSink
{
  public:
    explicit X11InputPrompt(X11Platform &platform);
    ~X11InputPrompt() override;

    void show(const std::string &prompt, CaptureListener &listener) override;
    void focus() override;
    void hide() override;

    void handle_event(const XEvent &event) override;

    [[nodiscard]] bool is_open() const { return window_.has_value(); }

  private:
    void handle_key(XKeyEvent key_event);
    void submit();
    void cancel();
    void redraw();

    X11Platform &platform_;
    std::optional<X11Window> window_;
    CaptureListener *listener_ = nullptr;
    std::string title_;
    std::string buffer_;
};
