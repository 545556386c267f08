#pragma once

#include "config.h"
#include "surface.h"
#include "types.h"

#include <X11/Xlib.h>

#include <functional>
#include <memory>
#include <unordered_map>

// Receives the X events addressed to one window
class X11EventSink
{
  public:
    virtual ~X11EventSink() = default;
    // May unregister (and destroy) the sink
    virtual void handle_event(const XEvent &event) = 0;
};

// Connection to the X server shared by every window of the process.
// Coordinates handed to the rest of the program are relative to the primary
// monitor's top-left corner.
class X11Platform : public SurfaceProvider
{
  public:
    explicit X11Platform(const Config &config);
    ~X11Platform() override;

    // Non-copyable
    X11Platform(const X11Platform &) = delete;
    X11Platform &operator=(const X11Platform &) = delete;

    // SurfaceProvider
    std::unique_ptr<SurfaceHandle> acquire_surface() override;
    ui::WindowDimension screen_size() const override { return screen_size_; }

    bool register_global_hotkey(const ui::KeyboardEvent &hotkey);
    void unregister_global_hotkey();

    [[nodiscard]] int connection_fd() const;

    // Processes every queued X event. Hotkey presses call on_hotkey, all
    // other events go to the sink registered for their window, looked up
    // per event.
    void dispatch_pending(const std::function<void()> &on_hotkey);

    // Creates an unmapped ARGB override-redirect window
    ::Window create_window(ui::ScreenCoord top_left,
                           ui::WindowDimension dimension, long event_mask);
    void register_sink(::Window window, X11EventSink *sink);
    void unregister_sink(::Window window);

    [[nodiscard]] Display *display() const { return display_; }
    [[nodiscard]] Visual *visual() const { return visual_; }
    [[nodiscard]] ui::ScreenCoord screen_origin() const { return origin_; }
    [[nodiscard]] const FontConfig &font() const { return font_; }
    Atom atom(const char *name) const;

  private:
    Display *display_ = nullptr;
    Visual *visual_ = nullptr;
    int depth_ = 0;
    Colormap colormap_ = 0;

    ui::ScreenCoord origin_{0, 0};
    ui::WindowDimension screen_size_{.height = 0, .width = 0};
    FontConfig font_;

    std::unordered_map<::Window, X11EventSink *> sinks_;

    bool hotkey_registered_ = false;
    unsigned int hotkey_keycode_ = 0;
    unsigned int hotkey_modifiers_ = 0;
};
