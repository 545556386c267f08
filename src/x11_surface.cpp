#include "x11_surface.h"
#include "logger.h"
#include "render.h"

#include <X11/X.h>

#include <algorithm>

namespace
{

constexpr long NOTE_EVENT_MASK = ExposureMask | ButtonPressMask |
                                 ButtonReleaseMask | Button1MotionMask |
                                 Button3MotionMask;

// Placeholder size until the text is known
constexpr ui::WindowDimension INITIAL_SIZE{.height = 50, .width = 200};

} // anonymous namespace

X11Surface::X11Surface(X11Platform &platform)
    : platform_(platform),
      window_(platform, *this, {0, 0}, INITIAL_SIZE, NOTE_EVENT_MASK),
      font_(platform.font())
{
    window_.set_title("floatnote");
}

void X11Surface::move(ui::ScreenCoord top_left)
{
    if (window_.alive()) {
        window_.move(top_left);
    }
}

ui::WindowDimension
X11Surface::resize_to_content(const std::string &text,
                              ui::WindowDimension minimum)
{
    text_ = text;
    font_ = platform_.font();
    const auto measured = render::measure_note(text_, font_);
    const ui::WindowDimension size{
        .height = std::max(measured.height, minimum.height),
        .width = std::max(measured.width, minimum.width),
    };
    content_size_ = size;
    if (window_.alive()) {
        window_.resize(size);
    }
    LOG_DEBUG("Note sized %ux%u (text %ux%u)", size.width, size.height,
              measured.width, measured.height);
    return size;
}

void X11Surface::resize(ui::WindowDimension size)
{
    if (!window_.alive() || size == window_.dimension()) {
        return;
    }
    font_ = scale_font(platform_.font(), content_size_, size);
    window_.resize(size);
    redraw();
}

void X11Surface::set_opacity(double opacity)
{
    if (window_.alive()) {
        window_.set_opacity(opacity);
    }
}

void X11Surface::set_topmost(bool topmost)
{
    if (window_.alive()) {
        window_.set_above(topmost);
    }
}

void X11Surface::show()
{
    if (!window_.alive()) {
        return;
    }
    window_.show(false);
    redraw();
}

void X11Surface::destroy()
{
    listener_ = nullptr;
    window_.destroy();
}

void X11Surface::subscribe_pointer(PointerListener *listener)
{
    listener_ = listener;
}

void X11Surface::redraw()
{
    cairo_t *cr = window_.get_cairo_context();
    render::draw_note(cr, window_.dimension(), text_, font_);
    window_.commit_surface();
}

ui::ScreenCoord X11Surface::to_screen(int x_root, int y_root) const
{
    return ui::ScreenCoord{x_root, y_root} - platform_.screen_origin();
}

void X11Surface::deliver(const ui::PointerEvent &event)
{
    if (listener_) {
        // Last statement: the listener may destroy this surface
        listener_->on_pointer_event(event);
    }
}

void X11Surface::handle_event(const XEvent &event)
{
    switch (event.type) {
    case Expose:
        if (event.xexpose.count == 0) {
            redraw();
        }
        break;
    case ButtonPress: {
        const auto &button = event.xbutton;
        if (button.button == Button3) {
            deliver(ui::PointerDown{to_screen(button.x_root, button.y_root),
                                    ui::PointerButton::Secondary});
        } else if (button.button == Button1) {
            if (render::note_close_button(window_.dimension())
                    .contains(button.x, button.y)) {
                deliver(ui::CloseClicked{});
            } else {
                deliver(ui::PointerDown{to_screen(button.x_root, button.y_root)});
            }
        }
        break;
    }
    case MotionNotify:
        deliver(ui::PointerMove{
            to_screen(event.xmotion.x_root, event.xmotion.y_root)});
        break;
    case ButtonRelease: {
        const auto &button = event.xbutton;
        const ui::ScreenCoord position = to_screen(button.x_root, button.y_root);
        if (button.button == Button1) {
            deliver(ui::PointerUp{position, ui::PointerButton::Primary});
        } else if (button.button == Button3) {
            deliver(ui::PointerUp{position, ui::PointerButton::Secondary});
        }
        break;
    }
    default:
        break;
    }
}
