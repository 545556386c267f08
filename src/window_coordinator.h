#pragma once

#include "capture_session.h"
#include "config.h"
#include "floating_surface.h"
#include "position_allocator.h"
#include "surface.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Entry point for hotkey triggers. Runs the capture interaction, turns
// submitted text into floating notes and keeps the registry of open notes.
// Every method must be called on the UI thread.
class WindowCoordinator : public CaptureListener, public SurfaceEvents
{
  public:
    WindowCoordinator(const Config &config, SurfaceProvider &surfaces,
                      InputPrompt &prompt, ConfirmDialog &confirm,
                      Notifier &notifier);
    ~WindowCoordinator() override;

    WindowCoordinator(const WindowCoordinator &) = delete;
    WindowCoordinator &operator=(const WindowCoordinator &) = delete;

    // Opens the input prompt. While a capture is already open the prompt is
    // refocused instead and no second session is started.
    void on_trigger();

    // Blank text (after trimming) is handled like a cancel
    void on_capture_submit(const std::string &text);
    void on_capture_cancel();

    // Closing an id that is not registered is a no-op
    void on_surface_close_requested(SurfaceId id) override;
    // Asks the user first; closes the note only on a positive answer
    void on_surface_delete_requested(SurfaceId id) override;
    void on_surface_closed(SurfaceId id) override;

    // Dismisses an open delete question, then destroys every note in
    // creation order and clears the registry.
    // Failures are logged and do not stop the remaining teardown.
    void shutdown();

    // CaptureListener
    void on_submit(const std::string &text) override { on_capture_submit(text); }
    void on_cancel() override { on_capture_cancel(); }

    [[nodiscard]] bool has_active_session() const;
    [[nodiscard]] size_t surface_count() const { return registry_.size(); }
    [[nodiscard]] const std::vector<std::unique_ptr<FloatingSurfaceController>> &
    surfaces() const
    {
        return registry_;
    }
    [[nodiscard]] FloatingSurfaceController *find(SurfaceId id) const;

  private:
    // Marks the current session finished; hides the prompt if it was still
    // waiting for input
    void end_session();

    SurfaceProvider &surfaces_;
    InputPrompt &prompt_;
    ConfirmDialog &confirm_;
    Notifier &notifier_;
    PositionAllocator allocator_;
    const double opacity_;

    std::unique_ptr<CaptureSession> session_;
    // Creation order
    std::vector<std::unique_ptr<FloatingSurfaceController>> registry_;
    SurfaceId next_id_ = 1;
};
