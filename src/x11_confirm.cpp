#include "x11_confirm.h"
#include "logger.h"
#include "render.h"

#include <X11/X.h>
#include <X11/keysym.h>

#include <algorithm>
#include <utility>

namespace
{

constexpr long CONFIRM_EVENT_MASK =
    ExposureMask | KeyPressMask | ButtonPressMask;

} // anonymous namespace

X11ConfirmDialog::X11ConfirmDialog(X11Platform &platform) : platform_(platform)
{
}

X11ConfirmDialog::~X11ConfirmDialog() { window_.reset(); }

void X11ConfirmDialog::ask(const std::string &question, ui::ScreenCoord near,
                           AnswerFn answer)
{
    if (answer_) {
        LOG_DEBUG("New question replaces the open one");
        finish(false);
    }

    const auto screen = platform_.screen_size();
    const auto size = render::CONFIRM_SIZE;
    const int max_x = static_cast<int>(screen.width) -
                      static_cast<int>(size.width);
    const int max_y = static_cast<int>(screen.height) -
                      static_cast<int>(size.height);
    const ui::ScreenCoord top_left{
        std::clamp(near.x - static_cast<int>(size.width) / 2, 0,
                   std::max(0, max_x)),
        std::clamp(near.y - static_cast<int>(size.height) / 2, 0,
                   std::max(0, max_y)),
    };

    window_.emplace(platform_, *this, top_left, size, CONFIRM_EVENT_MASK);
    window_->set_title("floatnote");
    window_->set_above(true);
    window_->show(true);

    question_ = question;
    answer_ = std::move(answer);
    redraw();
}

void X11ConfirmDialog::dismiss()
{
    answer_ = nullptr;
    window_.reset();
}

void X11ConfirmDialog::finish(bool confirmed)
{
    AnswerFn answer = std::move(answer_);
    answer_ = nullptr;
    window_.reset();
    LOG_DEBUG("Question answered %s", confirmed ? "yes" : "no");
    // May ask again
    if (answer) {
        answer(confirmed);
    }
}

void X11ConfirmDialog::redraw()
{
    if (!window_) {
        return;
    }
    cairo_t *cr = window_->get_cairo_context();
    render::draw_confirm(cr, window_->dimension(), question_, platform_.font());
    window_->commit_surface();
}

void X11ConfirmDialog::handle_event(const XEvent &event)
{
    switch (event.type) {
    case Expose:
        if (event.xexpose.count == 0) {
            redraw();
        }
        break;
    case ButtonPress: {
        const auto size = window_->dimension();
        if (render::confirm_yes_button(size).contains(event.xbutton.x,
                                                      event.xbutton.y)) {
            finish(true);
        } else if (render::confirm_no_button(size).contains(event.xbutton.x,
                                                            event.xbutton.y)) {
            finish(false);
        }
        break;
    }
    case KeyPress: {
        XKeyEvent key_event = event.xkey;
        switch (XLookupKeysym(&key_event, 0)) {
        case XK_Return:
        case XK_KP_Enter:
        case XK_y:
            finish(true);
            break;
        case XK_Escape:
        case XK_n:
            finish(false);
            break;
        default:
            break;
        }
        break;
    }
    default:
        break;
    }
}
