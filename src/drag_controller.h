#pragma once

#include "types.h"

// Something that can be dragged around the screen and resized
class DragTarget
{
  public:
    virtual ~DragTarget() = default;

    virtual ui::ScreenCoord position() const = 0;
    // Moves the native window only; used for every step of a gesture
    virtual void preview_position(ui::ScreenCoord position) = 0;
    // Records the final position of a gesture and moves the window there
    virtual void set_position(ui::ScreenCoord position) = 0;

    virtual ui::WindowDimension size() const = 0;
    // Same split as for positions. The target applies its own minimum.
    virtual void preview_size(ui::WindowDimension size) = 0;
    virtual void set_size(ui::WindowDimension size) = 0;
};

// Per-surface pointer gesture state machine:
//   Idle --down--> Dragging --move--> Dragging --up--> Idle
//   Idle --resize_down--> Resizing --move--> Resizing --up--> Idle
// The pointer offset inside the surface is captured on pointer-down and kept
// for the whole gesture, so the surface never jumps to the pointer. A resize
// grows the size captured on resize_down by the pointer delta and keeps the
// top-left corner in place.
class DragController
{
  public:
    enum class State {
        Idle,
        Dragging,
        Resizing
    };

    // How a gesture ended
    enum class Outcome {
        None,
        Moved,
        Resized,
        // Secondary button released without leaving RESIZE_THRESHOLD
        Clicked
    };

    // Pointer travel (per axis) before a secondary press becomes a resize
    static constexpr int RESIZE_THRESHOLD = 5;

    DragController() = default;

    DragController(const DragController &) = delete;
    DragController &operator=(const DragController &) = delete;

    // The target is only referenced until the gesture ends or is cancelled
    void pointer_down(DragTarget &target, ui::ScreenCoord pointer);
    void resize_down(DragTarget &target, ui::ScreenCoord pointer);
    void pointer_move(ui::ScreenCoord pointer);
    Outcome pointer_up(ui::ScreenCoord pointer);

    // Aborts a gesture in progress; later moves are ignored
    void cancel();

    [[nodiscard]] State state() const { return state_; }

  private:
    ui::WindowDimension size_for(ui::ScreenCoord pointer) const;
    bool within_threshold(ui::ScreenCoord pointer) const;

    State state_ = State::Idle;
    DragTarget *target_ = nullptr;
    ui::ScreenCoord grab_offset_{0, 0};
    ui::ScreenCoord current_{0, 0};

    ui::ScreenCoord resize_start_{0, 0};
    ui::WindowDimension start_size_{.height = 0, .width = 0};
    bool resized_ = false;
};
