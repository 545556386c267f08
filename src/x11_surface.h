#pragma once

#include "surface.h"
#include "x11_platform.h"
#include "x11_window.h"

#include <string>

// A floating note window: translucent rounded background, text and a close
// glyph. Left- and right-button gestures become pointer events in monitor
// coordinates.
class X11Surface : public SurfaceHandle, public X11EventSink
{
  public:
    // Throws SurfaceCreationError
    explicit X11Surface(X11Platform &platform);

    void move(ui::ScreenCoord top_left) override;
    ui::WindowDimension resize_to_content(const std::string &text,
                                          ui::WindowDimension minimum) override;
    void resize(ui::WindowDimension size) override;
    void set_opacity(double opacity) override;
    void set_topmost(bool topmost) override;
    void show() override;
    void destroy() override;
    void subscribe_pointer(PointerListener *listener) override;

    void handle_event(const XEvent &event) override;

  private:
    void redraw();
    void deliver(const ui::PointerEvent &event);
    ui::ScreenCoord to_screen(int x_root, int y_root) const;

    X11Platform &platform_;
    X11Window window_;
    std::string text_;
    // Size the text was laid out for; resizes scale the font against it
    ui::WindowDimension content_size_{.height = 0, .width = 0};
    FontConfig font_;
    PointerListener *listener_ = nullptr;
};
