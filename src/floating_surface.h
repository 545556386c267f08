#pragma once

#include "drag_controller.h"
#include "surface.h"
#include "types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

using SurfaceId = uint64_t;

// Implemented by the owner of the floating surfaces
class SurfaceEvents
{
  public:
    virtual ~SurfaceEvents() = default;
    // The user clicked the close control
    virtual void on_surface_close_requested(SurfaceId id) = 0;
    // The user right-clicked the note; closing needs confirmation
    virtual void on_surface_delete_requested(SurfaceId id) = 0;
    // The surface's native window is gone. The receiver may destroy the
    // controller from inside this call.
    virtual void on_surface_closed(SurfaceId id) = 0;
};

// One floating note: owns its native surface exclusively and forwards
// pointer input to its gesture controller. Primary button gestures move the
// note, secondary ones resize it or, as a plain click, ask to delete it.
class FloatingSurfaceController : public DragTarget, public PointerListener
{
  public:
    static constexpr ui::WindowDimension MIN_SIZE{.height = 50, .width = 200};

    // Returns the placement for a surface of the given size
    using PlaceFn = std::function<ui::ScreenCoord(ui::WindowDimension)>;

    // Acquires a surface from `provider`, makes it topmost and translucent,
    // sizes it to `text`, places it via `place` and shows it.
    // Throws SurfaceCreationError (or the platform's std::runtime_error);
    // a partially created surface is destroyed before the exception leaves.
    static std::unique_ptr<FloatingSurfaceController>
    create(SurfaceId id, std::string text, double opacity,
           SurfaceProvider &provider, const PlaceFn &place,
           SurfaceEvents &events);

    ~FloatingSurfaceController() override;

    FloatingSurfaceController(const FloatingSurfaceController &) = delete;
    FloatingSurfaceController &
    operator=(const FloatingSurfaceController &) = delete;

    // Unsubscribes pointer input, destroys the native surface and notifies
    // SurfaceEvents::on_surface_closed exactly once. Repeated calls do
    // nothing. If destroying the surface fails the notification still
    // happens and the error is rethrown afterwards.
    void close();

    // DragTarget
    ui::ScreenCoord position() const override { return position_; }
    void preview_position(ui::ScreenCoord position) override;
    void set_position(ui::ScreenCoord position) override;
    ui::WindowDimension size() const override { return size_; }
    void preview_size(ui::WindowDimension size) override;
    void set_size(ui::WindowDimension size) override;

    // PointerListener
    void on_pointer_event(const ui::PointerEvent &event) override;

    [[nodiscard]] SurfaceId id() const { return id_; }
    [[nodiscard]] const std::string &text() const { return text_; }
    [[nodiscard]] double opacity() const { return opacity_; }
    [[nodiscard]] bool is_open() const { return !closed_; }
    [[nodiscard]] DragController::State drag_state() const
    {
        return drag_.state();
    }

  private:
    FloatingSurfaceController(SurfaceId id, std::string text,
                              std::unique_ptr<SurfaceHandle> handle,
                              SurfaceEvents &events);

    void realize(double opacity, const PlaceFn &place);

    const SurfaceId id_;
    const std::string text_;
    std::unique_ptr<SurfaceHandle> handle_;
    SurfaceEvents &events_;
    DragController drag_;

    ui::ScreenCoord position_{0, 0};
    ui::WindowDimension size_ = MIN_SIZE;
    double opacity_ = 1.0;
    bool closed_ = false;
};
