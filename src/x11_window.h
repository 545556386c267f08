#pragma once

#include "types.h"

#include <X11/Xlib.h>
#include <cairo.h>

class X11Platform;
class X11EventSink;

// An override-redirect ARGB window with a cached cairo surface, registered
// with the platform for event dispatch while it exists.
class X11Window
{
  public:
    X11Window(X11Platform &platform, X11EventSink &sink,
              ui::ScreenCoord top_left, ui::WindowDimension dimension,
              long event_mask);
    ~X11Window();

    // Non-copyable
    X11Window(const X11Window &) = delete;
    X11Window &operator=(const X11Window &) = delete;

    void move(ui::ScreenCoord top_left);
    void resize(ui::WindowDimension dimension);
    void show(bool take_focus);
    void raise_and_focus();
    void set_above(bool above);
    void set_opacity(double opacity);
    void set_title(const char *title);

    cairo_t *get_cairo_context();
    void commit_surface();

    // Unregisters and releases the window, safe to call twice
    void destroy();

    [[nodiscard]] bool alive() const { return window_ != 0; }
    [[nodiscard]] ::Window handle() const { return window_; }
    [[nodiscard]] ui::WindowDimension dimension() const
    {
        return {.height = height_, .width = width_};
    }

  private:
    cairo_surface_t *get_cairo_surface();
    bool surface_cache_valid() const;
    void release_cairo();

    X11Platform &platform_;
    Display *display_;
    ::Window window_ = 0;
    unsigned int width_;
    unsigned int height_;

    cairo_surface_t *cached_surface_ = nullptr;
    cairo_t *cached_context_ = nullptr;
    unsigned int cached_surface_width_ = 0;
    unsigned int cached_surface_height_ = 0;
};
