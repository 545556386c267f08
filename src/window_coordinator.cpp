#include "window_coordinator.h"
#include "logger.h"
#include "utility.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace
{

constexpr const char *PROMPT_TEXT = "Add a note";
constexpr const char *DELETE_QUESTION = "Delete this note?";

PlacementSettings placement_from(const Config &config)
{
    return PlacementSettings{
        .anchor = config.default_position,
        .margin = config.placement_margin,
        .gap = config.placement_gap,
    };
}

unsigned long long as_ull(SurfaceId id)
{
    return static_cast<unsigned long long>(id);
}

} // anonymous namespace

WindowCoordinator::WindowCoordinator(const Config &config,
                                     SurfaceProvider &surfaces,
                                     InputPrompt &prompt,
                                     ConfirmDialog &confirm,
                                     Notifier &notifier)
    : surfaces_(surfaces), prompt_(prompt), confirm_(confirm),
      notifier_(notifier),
      allocator_(placement_from(config)), opacity_(config.window_opacity)
{
}

WindowCoordinator::~WindowCoordinator() { shutdown(); }

bool WindowCoordinator::has_active_session() const
{
    return session_ && session_->active();
}

FloatingSurfaceController *WindowCoordinator::find(SurfaceId id) const
{
    const auto it =
        std::find_if(registry_.begin(), registry_.end(),
                     [id](const auto &surface) { return surface->id() == id; });
    return it != registry_.end() ? it->get() : nullptr;
}

void WindowCoordinator::on_trigger()
{
    if (has_active_session()) {
        LOG_DEBUG("Trigger while capture is open, refocusing prompt");
        prompt_.focus();
        return;
    }

    session_ = std::make_unique<CaptureSession>(*this);
    try {
        prompt_.show(PROMPT_TEXT, *session_);
    } catch (const std::exception &e) {
        session_->abandon();
        session_.reset();
        LOG_ERROR("Failed to open input prompt: %s", e.what());
        notifier_.notify("floatnote", std::string("Cannot open input: ") +
                                          e.what());
    }
}

void WindowCoordinator::end_session()
{
    if (!has_active_session()) {
        return;
    }
    // Reached when submit/cancel did not come through the prompt
    session_->abandon();
    prompt_.hide();
}

void WindowCoordinator::on_capture_submit(const std::string &text)
{
    end_session();

    std::string note = trim(text);
    if (note.empty()) {
        LOG_DEBUG("Empty capture input, treating as cancel");
        return;
    }

    const SurfaceId id = next_id_++;
    bool placed = false;
    try {
        auto surface = FloatingSurfaceController::create(
            id, std::move(note), opacity_, surfaces_,
            [this, &placed](ui::WindowDimension size) {
                placed = true;
                return allocator_.next_position(surfaces_.screen_size(), size);
            },
            *this);
        registry_.push_back(std::move(surface));
        LOG_INFO("Registered surface %llu, %zu open", as_ull(id),
                 registry_.size());
    } catch (const std::exception &e) {
        // The slot goes to the next note instead of staying empty
        if (placed) {
            allocator_.rollback();
        }
        LOG_ERROR("Failed to create surface %llu: %s", as_ull(id), e.what());
        notifier_.notify("floatnote",
                         std::string("Could not show note: ") + e.what());
    }
}

void WindowCoordinator::on_capture_cancel()
{
    end_session();
    LOG_DEBUG("Capture cancelled");
}

void WindowCoordinator::on_surface_close_requested(SurfaceId id)
{
    FloatingSurfaceController *surface = find(id);
    if (!surface) {
        LOG_DEBUG("Close requested for unknown surface %llu", as_ull(id));
        return;
    }

    // Unregisters (and destroys) the controller via on_surface_closed
    try {
        surface->close();
    } catch (const std::exception &e) {
        LOG_WARNING("Error while closing surface %llu: %s", as_ull(id),
                    e.what());
    }
}

void WindowCoordinator::on_surface_delete_requested(SurfaceId id)
{
    const FloatingSurfaceController *surface = find(id);
    if (!surface) {
        LOG_DEBUG("Delete requested for unknown surface %llu", as_ull(id));
        return;
    }

    const ui::ScreenCoord center{
        surface->position().x + static_cast<int>(surface->size().width) / 2,
        surface->position().y + static_cast<int>(surface->size().height) / 2,
    };
    // The note may be gone by the time the answer arrives; the id lookup in
    // on_surface_close_requested covers that
    try {
        confirm_.ask(DELETE_QUESTION, center, [this, id](bool confirmed) {
            if (confirmed) {
                on_surface_close_requested(id);
            } else {
                LOG_DEBUG("Delete of surface %llu declined", as_ull(id));
            }
        });
    } catch (const std::exception &e) {
        LOG_ERROR("Failed to ask before deleting surface %llu: %s", as_ull(id),
                  e.what());
        notifier_.notify("floatnote",
                         std::string("Cannot confirm delete: ") + e.what());
    }
}

void WindowCoordinator::on_surface_closed(SurfaceId id)
{
    const auto it =
        std::find_if(registry_.begin(), registry_.end(),
                     [id](const auto &surface) { return surface->id() == id; });
    if (it == registry_.end()) {
        return;
    }

    // Erase before the controller dies so no lookup sees a dead entry
    std::unique_ptr<FloatingSurfaceController> closed = std::move(*it);
    registry_.erase(it);
    LOG_INFO("Closed surface %llu, %zu open", as_ull(id), registry_.size());
}

void WindowCoordinator::shutdown()
{
    try {
        confirm_.dismiss();
    } catch (const std::exception &e) {
        LOG_WARNING("Failed to dismiss delete question: %s", e.what());
    }

    if (session_) {
        const bool was_active = session_->active();
        session_->abandon();
        session_.reset();
        if (was_active) {
            try {
                prompt_.hide();
            } catch (const std::exception &e) {
                LOG_WARNING("Failed to hide input prompt: %s", e.what());
            }
        }
    }

    if (registry_.empty()) {
        return;
    }

    auto surfaces = std::move(registry_);
    registry_.clear();

    std::vector<std::string> failures;
    for (auto &surface : surfaces) {
        try {
            surface->close();
        } catch (const std::exception &e) {
            failures.push_back("surface " + std::to_string(surface->id()) +
                               ": " + e.what());
        }
    }

    for (const auto &failure : failures) {
        LOG_WARNING("Teardown failure: %s", failure.c_str());
    }
    LOG_INFO("Shutdown released %zu surfaces (%zu failures)", surfaces.size(),
             failures.size());
}
