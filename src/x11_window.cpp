#include "x11_window.h"
#include "logger.h"
#include "surface.h"
#include "x11_platform.h"

#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <cairo-xlib.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

X11Window::X11Window(X11Platform &platform, X11EventSink &sink,
                     ui::ScreenCoord top_left, ui::WindowDimension dimension,
                     long event_mask)
    : platform_(platform), display_(platform.display()),
      width_(dimension.width), height_(dimension.height)
{
    window_ = platform_.create_window(top_left, dimension, event_mask);
    if (window_ == 0) {
        throw SurfaceCreationError("XCreateWindow failed");
    }
    platform_.register_sink(window_, &sink);
}

X11Window::~X11Window() { destroy(); }

void X11Window::destroy()
{
    if (window_ == 0) {
        return;
    }
    platform_.unregister_sink(window_);
    release_cairo();
    XDestroyWindow(display_, window_);
    XFlush(display_);
    window_ = 0;
}

void X11Window::move(ui::ScreenCoord top_left)
{
    const ui::ScreenCoord absolute = platform_.screen_origin() + top_left;
    XMoveWindow(display_, window_, absolute.x, absolute.y);
    XFlush(display_);
}

void X11Window::resize(ui::WindowDimension dimension)
{
    XResizeWindow(display_, window_, dimension.width, dimension.height);
    height_ = dimension.height;
    width_ = dimension.width;
}

void X11Window::show(bool take_focus)
{
    XMapRaised(display_, window_);
    if (take_focus) {
        XSetInputFocus(display_, window_, RevertToParent, CurrentTime);
    }
    XFlush(display_);
}

void X11Window::raise_and_focus()
{
    XRaiseWindow(display_, window_);
    XSetInputFocus(display_, window_, RevertToParent, CurrentTime);
    XFlush(display_);
}

void X11Window::set_above(bool above)
{
    const Atom state_atom = platform_.atom("_NET_WM_STATE");
    if (!above) {
        XDeleteProperty(display_, window_, state_atom);
        return;
    }
    Atom state_above = platform_.atom("_NET_WM_STATE_ABOVE");
    XChangeProperty(display_, window_, state_atom, XA_ATOM, 32,
                    PropModeReplace,
                    reinterpret_cast<unsigned char *>(&state_above), 1);
}

void X11Window::set_opacity(double opacity)
{
    // Compositors read the cardinal as a fraction of 0xffffffff
    unsigned long value = static_cast<unsigned long>(
        std::clamp(opacity, 0.0, 1.0) * static_cast<double>(UINT32_MAX));
    XChangeProperty(display_, window_,
                    platform_.atom("_NET_WM_WINDOW_OPACITY"), XA_CARDINAL, 32,
                    PropModeReplace, reinterpret_cast<unsigned char *>(&value),
                    1);
}

void X11Window::set_title(const char *title)
{
    XStoreName(display_, window_, title);
}

cairo_surface_t *X11Window::get_cairo_surface()
{
    if (surface_cache_valid()) {
        return cached_surface_;
    }

    release_cairo();
    cached_surface_ = cairo_xlib_surface_create(
        display_, window_, platform_.visual(), static_cast<int>(width_),
        static_cast<int>(height_));
    cached_surface_width_ = width_;
    cached_surface_height_ = height_;
    return cached_surface_;
}

cairo_t *X11Window::get_cairo_context()
{
    if (surface_cache_valid() && cached_context_) {
        return cached_context_;
    }

    cairo_surface_t *surface = get_cairo_surface();

    cached_context_ = cairo_create(surface);
    if (cairo_status(cached_context_) != CAIRO_STATUS_SUCCESS) {
        const int status = cairo_status(cached_context_);
        cairo_destroy(cached_context_);
        cached_context_ = nullptr;
        throw std::runtime_error("Failed to create Cairo context, status: " +
                                 std::to_string(status));
    }
    LOG_DEBUG("Created new Cairo context");

    return cached_context_;
}

void X11Window::commit_surface()
{
    cairo_surface_flush(get_cairo_surface());
    XFlush(display_);
}

bool X11Window::surface_cache_valid() const
{
    if (cached_surface_ == nullptr) {
        return false;
    }

    if (cached_surface_width_ != width_ || cached_surface_height_ != height_) {
        LOG_DEBUG("Surface cache miss: dimensions changed (cached: %ux%u "
                  "window: %ux%u)",
                  cached_surface_width_, cached_surface_height_, width_,
                  height_);
        return false;
    }

    return cairo_surface_status(cached_surface_) == CAIRO_STATUS_SUCCESS;
}

void X11Window::release_cairo()
{
    if (cached_context_) {
        cairo_destroy(cached_context_);
        cached_context_ = nullptr;
    }
    if (cached_surface_) {
        cairo_surface_destroy(cached_surface_);
        cached_surface_ = nullptr;
    }
}
