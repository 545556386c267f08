#include "drag_controller.h"
#include "logger.h"

#include <algorithm>
#include <cstdlib>

void DragController::pointer_down(DragTarget &target, ui::ScreenCoord pointer)
{
    if (state_ != State::Idle) {
        // A second button went down mid-gesture; keep the original offset
        return;
    }

    state_ = State::Dragging;
    target_ = &target;
    current_ = target.position();
    grab_offset_ = pointer - current_;
}

void DragController::resize_down(DragTarget &target, ui::ScreenCoord pointer)
{
    if (state_ != State::Idle) {
        return;
    }

    state_ = State::Resizing;
    target_ = &target;
    resize_start_ = pointer;
    start_size_ = target.size();
    resized_ = false;
}

ui::WindowDimension DragController::size_for(ui::ScreenCoord pointer) const
{
    const ui::ScreenCoord delta = pointer - resize_start_;
    const int width = static_cast<int>(start_size_.width) + delta.x;
    const int height = static_cast<int>(start_size_.height) + delta.y;
    return ui::WindowDimension{
        .height = static_cast<unsigned int>(std::max(0, height)),
        .width = static_cast<unsigned int>(std::max(0, width)),
    };
}

bool DragController::within_threshold(ui::ScreenCoord pointer) const
{
    const ui::ScreenCoord delta = pointer - resize_start_;
    return std::abs(delta.x) <= RESIZE_THRESHOLD &&
           std::abs(delta.y) <= RESIZE_THRESHOLD;
}

void DragController::pointer_move(ui::ScreenCoord pointer)
{
    switch (state_) {
    case State::Idle:
        return;
    case State::Dragging:
        current_ = pointer - grab_offset_;
        target_->preview_position(current_);
        return;
    case State::Resizing:
        if (!resized_ && within_threshold(pointer)) {
            return;
        }
        resized_ = true;
        target_->preview_size(size_for(pointer));
        return;
    }
}

DragController::Outcome DragController::pointer_up(ui::ScreenCoord pointer)
{
    if (state_ == State::Idle) {
        return Outcome::None;
    }

    DragTarget *target = target_;
    const State finished = state_;
    state_ = State::Idle;
    target_ = nullptr;

    if (finished == State::Dragging) {
        current_ = pointer - grab_offset_;
        target->set_position(current_);
        LOG_DEBUG("Drag finished at (%d,%d)", current_.x, current_.y);
        return Outcome::Moved;
    }

    if (!resized_ && within_threshold(pointer)) {
        return Outcome::Clicked;
    }
    const ui::WindowDimension size = size_for(pointer);
    target->set_size(size);
    LOG_DEBUG("Resize finished at %ux%u", size.width, size.height);
    return Outcome::Resized;
}

void DragController::cancel()
{
    if (state_ != State::Idle) {
        LOG_DEBUG("Pointer gesture cancelled");
    }
    state_ = State::Idle;
    target_ = nullptr;
}
