#pragma once

#include "types.h"

#include <optional>

struct PlacementSettings {
    // Top-left of the first note. nullopt = top-right corner inset by margin.
    std::optional<ui::ScreenCoord> anchor;
    int margin = 20;
    int gap = 10;
};

// Default placement for new notes: a column growing downwards from the
// anchor, continuing in a new column to the left once the screen bottom is
// reached. Only sequential creation is accounted for; notes the user drags
// elsewhere are not tracked.
class PositionAllocator
{
  public:
    explicit PositionAllocator(PlacementSettings settings);

    ui::ScreenCoord next_position(ui::WindowDimension screen,
                                  ui::WindowDimension surface);
    // Gives back the slot handed out by the last next_position(), for a
    // surface that never appeared. Only one step can be undone.
    void rollback();

  private:
    struct Placement {
        ui::ScreenCoord position;
        ui::WindowDimension size;
    };

    ui::ScreenCoord anchor(ui::WindowDimension screen,
                           ui::WindowDimension surface) const;

    PlacementSettings settings_;
    std::optional<Placement> last_;
    // State before the last next_position()
    std::optional<Placement> previous_;
    bool can_rollback_ = false;
};
