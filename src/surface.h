#pragma once

#include "types.h"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

// Thrown when a native surface cannot be acquired (no display connection,
// resource exhaustion, ...). Nothing has been registered when this escapes.
class SurfaceCreationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class PointerListener
{
  public:
    virtual ~PointerListener() = default;
    // May destroy the surface that delivered the event; the caller must not
    // touch the surface after this returns.
    virtual void on_pointer_event(const ui::PointerEvent &event) = 0;
};

// One native floating window. Implementations wrap a toolkit window; the
// owner is responsible for calling destroy() before dropping the handle.
class SurfaceHandle
{
  public:
    virtual ~SurfaceHandle() = default;

    virtual void move(ui::ScreenCoord top_left) = 0;
    // Lays out `text` and resizes the window to fit it, never smaller than
    // `minimum`. Returns the resulting size.
    virtual ui::WindowDimension resize_to_content(const std::string &text,
                                                  ui::WindowDimension minimum) = 0;
    // Resizes the window keeping its top-left corner. The text is laid out
    // again with a font scaled to the new area.
    virtual void resize(ui::WindowDimension size) = 0;
    virtual void set_opacity(double opacity) = 0;
    virtual void set_topmost(bool topmost) = 0;
    virtual void show() = 0;
    // Releases the native window. Safe to call more than once.
    virtual void destroy() = 0;

    // A single listener; nullptr unsubscribes
    virtual void subscribe_pointer(PointerListener *listener) = 0;
};

class SurfaceProvider
{
  public:
    virtual ~SurfaceProvider() = default;

    // Throws SurfaceCreationError
    virtual std::unique_ptr<SurfaceHandle> acquire_surface() = 0;
    virtual ui::WindowDimension screen_size() const = 0;
};

// User-visible notifications (SurfaceCreationError and friends)
class Notifier
{
  public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string &title, const std::string &body) = 0;
};

// Yes/no question shown next to a note. Each ask() gets at most one answer;
// asking again while a question is open answers the open one with false.
class ConfirmDialog
{
  public:
    using AnswerFn = std::function<void(bool confirmed)>;

    virtual ~ConfirmDialog() = default;
    // Centers the dialog on `near` (monitor coordinates)
    virtual void ask(const std::string &question, ui::ScreenCoord near,
                     AnswerFn answer) = 0;
    // Closes an open question without answering it
    virtual void dismiss() = 0;
};
