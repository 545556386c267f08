#include "position_allocator.h"
#include "logger.h"

#include <algorithm>

PositionAllocator::PositionAllocator(PlacementSettings settings)
    : settings_(settings)
{
}

ui::ScreenCoord PositionAllocator::anchor(ui::WindowDimension screen,
                                          ui::WindowDimension surface) const
{
    if (settings_.anchor) {
        return *settings_.anchor;
    }
    const int x = static_cast<int>(screen.width) -
                  static_cast<int>(surface.width) - settings_.margin;
    return {std::max(0, x), settings_.margin};
}

ui::ScreenCoord PositionAllocator::next_position(ui::WindowDimension screen,
                                                 ui::WindowDimension surface)
{
    const ui::ScreenCoord origin = anchor(screen, surface);
    ui::ScreenCoord position = origin;

    if (last_) {
        position = {last_->position.x,
                    last_->position.y +
                        static_cast<int>(last_->size.height) + settings_.gap};

        if (position.y + static_cast<int>(surface.height) >
            static_cast<int>(screen.height)) {
            // Start a new column to the left
            position = {last_->position.x - static_cast<int>(surface.width) -
                            settings_.gap,
                        origin.y};
            if (position.x < 0) {
                LOG_DEBUG("Placement ran out of columns, restarting at anchor");
                position = origin;
            }
        }

        // A note wider than the one above it would cross the right edge
        const int right_limit = static_cast<int>(screen.width) -
                                static_cast<int>(surface.width) -
                                settings_.margin;
        if (position.x > right_limit) {
            position.x = std::max(0, right_limit);
        }
    }

    previous_ = last_;
    can_rollback_ = true;
    last_ = Placement{position, surface};
    LOG_DEBUG("Placing %ux%u surface at (%d,%d)", surface.width,
              surface.height, position.x, position.y);
    return position;
}

void PositionAllocator::rollback()
{
    if (!can_rollback_) {
        return;
    }
    last_ = previous_;
    can_rollback_ = false;
    LOG_DEBUG("Placement rolled back");
}
