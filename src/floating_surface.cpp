#include "floating_surface.h"
#include "logger.h"

#include <algorithm>
#include <exception>
#include <utility>
#include <variant>

namespace
{

ui::WindowDimension at_least(ui::WindowDimension size,
                             ui::WindowDimension minimum)
{
    return ui::WindowDimension{
        .height = std::max(size.height, minimum.height),
        .width = std::max(size.width, minimum.width),
    };
}

// True when `button` is the one that started the gesture in `state`
bool ends_gesture(DragController::State state, ui::PointerButton button)
{
    switch (state) {
    case DragController::State::Dragging:
        return button == ui::PointerButton::Primary;
    case DragController::State::Resizing:
        return button == ui::PointerButton::Secondary;
    case DragController::State::Idle:
        break;
    }
    return false;
}

} // anonymous namespace

std::unique_ptr<FloatingSurfaceController>
FloatingSurfaceController::create(SurfaceId id, std::string text,
                                  double opacity, SurfaceProvider &provider,
                                  const PlaceFn &place, SurfaceEvents &events)
{
    auto handle = provider.acquire_surface();
    if (!handle) {
        throw SurfaceCreationError("surface provider returned no surface");
    }

    std::unique_ptr<FloatingSurfaceController> controller(
        new FloatingSurfaceController(id, std::move(text), std::move(handle),
                                      events));
    // On failure the destructor releases the half-built surface
    controller->realize(opacity, place);
    return controller;
}

FloatingSurfaceController::FloatingSurfaceController(
    SurfaceId id, std::string text, std::unique_ptr<SurfaceHandle> handle,
    SurfaceEvents &events)
    : id_(id), text_(std::move(text)), handle_(std::move(handle)),
      events_(events)
{
}

FloatingSurfaceController::~FloatingSurfaceController()
{
    if (closed_) {
        return;
    }
    // Dropped without close(): release the window silently
    handle_->subscribe_pointer(nullptr);
    try {
        handle_->destroy();
    } catch (const std::exception &e) {
        LOG_WARNING("Failed to destroy surface %llu: %s",
                    static_cast<unsigned long long>(id_), e.what());
    }
}

void FloatingSurfaceController::realize(double opacity, const PlaceFn &place)
{
    opacity_ = opacity;
    handle_->set_topmost(true);
    handle_->set_opacity(opacity_);
    size_ = handle_->resize_to_content(text_, MIN_SIZE);

    position_ = place(size_);
    handle_->move(position_);
    handle_->show();
    handle_->subscribe_pointer(this);

    LOG_INFO("Created surface %llu (%ux%u at %d,%d)",
             static_cast<unsigned long long>(id_), size_.width, size_.height,
             position_.x, position_.y);
}

void FloatingSurfaceController::close()
{
    if (closed_) {
        return;
    }
    closed_ = true;
    drag_.cancel();
    handle_->subscribe_pointer(nullptr);

    std::exception_ptr failure;
    try {
        handle_->destroy();
    } catch (const std::exception &) {
        failure = std::current_exception();
    }

    // `this` may be gone once the notification returns
    const SurfaceId id = id_;
    SurfaceEvents &events = events_;
    events.on_surface_closed(id);

    if (failure) {
        std::rethrow_exception(failure);
    }
}

void FloatingSurfaceController::preview_position(ui::ScreenCoord position)
{
    if (closed_) {
        return;
    }
    handle_->move(position);
}

void FloatingSurfaceController::set_position(ui::ScreenCoord position)
{
    if (closed_) {
        return;
    }
    position_ = position;
    handle_->move(position_);
}

void FloatingSurfaceController::preview_size(ui::WindowDimension size)
{
    if (closed_) {
        return;
    }
    handle_->resize(at_least(size, MIN_SIZE));
}

void FloatingSurfaceController::set_size(ui::WindowDimension size)
{
    if (closed_) {
        return;
    }
    size_ = at_least(size, MIN_SIZE);
    handle_->resize(size_);
    LOG_DEBUG("Surface %llu resized to %ux%u",
              static_cast<unsigned long long>(id_), size_.width, size_.height);
}

void FloatingSurfaceController::on_pointer_event(const ui::PointerEvent &event)
{
    if (closed_) {
        return;
    }

    if (const auto *down = std::get_if<ui::PointerDown>(&event)) {
        if (down->button == ui::PointerButton::Secondary) {
            drag_.resize_down(*this, down->position);
        } else {
            drag_.pointer_down(*this, down->position);
        }
    } else if (const auto *move = std::get_if<ui::PointerMove>(&event)) {
        drag_.pointer_move(move->position);
    } else if (const auto *up = std::get_if<ui::PointerUp>(&event)) {
        if (!ends_gesture(drag_.state(), up->button)) {
            return;
        }
        if (drag_.pointer_up(up->position) ==
            DragController::Outcome::Clicked) {
            // May destroy this controller
            events_.on_surface_delete_requested(id_);
        }
    } else if (std::holds_alternative<ui::CloseClicked>(event)) {
        drag_.cancel();
        // May destroy this controller
        events_.on_surface_close_requested(id_);
    }
}
