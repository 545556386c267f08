#pragma once

#include "surface.h"
#include "x11_platform.h"
#include "x11_window.h"

#include <optional>
#include <string>

// Small topmost yes/no window. Enter or y answers yes, Escape or n answers
// no. The window exists only while a question is open.
class X11ConfirmDialog : public ConfirmDialog, public X11EventSink
{
  public:
    explicit X11ConfirmDialog(X11Platform &platform);
    ~X11ConfirmDialog() override;

    void ask(const std::string &question, ui::ScreenCoord near,
             AnswerFn answer) override;
    void dismiss() override;

    void handle_event(const XEvent &event) override;

  private:
    void finish(bool confirmed);
    void redraw();

    X11Platform &platform_;
    std::optional<X11Window> window_;
    std::string question_;
    AnswerFn answer_;
};
