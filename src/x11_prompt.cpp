#include "x11_prompt.h"
#include "logger.h"
#include "render.h"

#include <X11/X.h>
#include <X11/Xutil.h>
#include <X11/keysym.h>

#include <array>
#include <cstddef>

namespace
{

constexpr long PROMPT_EVENT_MASK =
    ExposureMask | KeyPressMask | ButtonPressMask | FocusChangeMask;

constexpr const char *PROMPT_HINT = "Enter to confirm | Esc to cancel";

} // anonymous namespace

X11InputPrompt::X11InputPrompt(X11Platform &platform) : platform_(platform) {}

X11InputPrompt::~X11InputPrompt() { window_.reset(); }

void X11InputPrompt::show(const std::string &prompt, CaptureListener &listener)
{
    listener_ = &listener;
    title_ = prompt;
    buffer_.clear();

    if (window_) {
        LOG_DEBUG("Prompt already open, reusing it");
        focus();
        redraw();
        return;
    }

    const auto screen = platform_.screen_size();
    const auto size = render::PROMPT_SIZE;
    const ui::ScreenCoord top_left{
        (static_cast<int>(screen.width) - static_cast<int>(size.width)) / 2,
        (static_cast<int>(screen.height) - static_cast<int>(size.height)) / 2,
    };

    window_.emplace(platform_, *this, top_left, size, PROMPT_EVENT_MASK);
    window_->set_title(title_.c_str());
    window_->set_above(true);
    window_->show(true);
    redraw();
    LOG_DEBUG("Prompt shown");
}

void X11InputPrompt::focus()
{
    if (window_) {
        window_->raise_and_focus();
    }
}

void X11InputPrompt::hide()
{
    listener_ = nullptr;
    buffer_.clear();
    if (window_) {
        window_.reset();
        LOG_DEBUG("Prompt hidden");
    }
}

void X11InputPrompt::submit()
{
    CaptureListener *listener = listener_;
    const std::string text = buffer_;
    listener_ = nullptr;
    if (listener) {
        listener->on_submit(text);
    }
    // The listener may have started a new prompt
    if (!listener_) {
        hide();
    }
}

void X11InputPrompt::cancel()
{
    CaptureListener *listener = listener_;
    listener_ = nullptr;
    if (listener) {
        listener->on_cancel();
    }
    if (!listener_) {
        hide();
    }
}

void X11InputPrompt::redraw()
{
    if (!window_) {
        return;
    }
    const render::PromptView view{
        .title = title_,
        .input = buffer_,
        .hint = PROMPT_HINT,
    };
    cairo_t *cr = window_->get_cairo_context();
    render::draw_prompt(cr, window_->dimension(), view, platform_.font());
    window_->commit_surface();
}

void X11InputPrompt::handle_event(const XEvent &event)
{
    switch (event.type) {
    case Expose:
        if (event.xexpose.count == 0) {
            redraw();
        }
        break;
    case ButtonPress:
        if (render::prompt_close_button(window_->dimension())
                .contains(event.xbutton.x, event.xbutton.y)) {
            cancel();
            return;
        }
        // Regain focus when clicked
        focus();
        break;
    case KeyPress:
        handle_key(event.xkey);
        break;
    default:
        break;
    }
}

void X11InputPrompt::handle_key(XKeyEvent key_event)
{
    const KeySym keysym = XLookupKeysym(&key_event, 0);

    switch (keysym) {
    case XK_Escape:
        cancel();
        return;
    case XK_Return:
    case XK_KP_Enter:
        submit();
        return;
    case XK_BackSpace:
        if (!buffer_.empty()) {
            buffer_.pop_back();
            redraw();
        }
        return;
    default:
        break;
    }

    constexpr int BUFFER_SIZE = 32;
    std::array<char, BUFFER_SIZE> char_buffer{};
    const auto len = static_cast<size_t>(
        XLookupString(&key_event, char_buffer.data(), BUFFER_SIZE, nullptr,
                      nullptr));
    bool changed = false;
    for (size_t i = 0; i < len; ++i) {
        // Only printable ASCII
        if (char_buffer[i] >= 32 && char_buffer[i] < 127) {
            buffer_.push_back(char_buffer[i]);
            changed = true;
        }
    }
    if (changed) {
        redraw();
    }
}
