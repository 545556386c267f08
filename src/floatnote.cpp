#include "config.h"
#include "desktop_notifier.h"
#include "event_loop.h"
#include "hotkey.h"
#include "logger.h"
#include "posted_events.h"
#include "window_coordinator.h"
#include "x11_confirm.h"
#include "x11_platform.h"
#include "x11_prompt.h"

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>

#ifndef FLOATNOTE_VERSION
#define FLOATNOTE_VERSION "dev"
#endif

namespace
{

constexpr auto SLOW_STARTUP = std::chrono::seconds(3);

// Grabs the configured hotkey, or the default one when the configured
// combination is invalid or taken. Returns the hotkey that is active.
std::optional<ui::KeyboardEvent> register_hotkey(X11Platform &platform,
                                                 const std::string &configured)
{
    if (const auto parsed = hotkey::parse(configured)) {
        if (platform.register_global_hotkey(*parsed)) {
            return parsed;
        }
        LOG_WARNING("Cannot grab hotkey '%s', falling back to %s",
                    configured.c_str(), DEFAULT_HOTKEY);
    } else {
        LOG_WARNING("Invalid hotkey '%s', falling back to %s",
                    configured.c_str(), DEFAULT_HOTKEY);
    }

    const auto fallback = hotkey::parse(DEFAULT_HOTKEY);
    if (fallback && platform.register_global_hotkey(*fallback)) {
        return fallback;
    }
    return std::nullopt;
}

int run()
{
    const auto start = std::chrono::steady_clock::now();

    const fs::path config_path = Config::default_path();
    if (config_path.empty()) {
        LOG_ERROR("No home directory, cannot locate the configuration");
        return 1;
    }
    const Config config = Config::load(config_path);
    Logger::getInstance().set_level(config.log_level);
    Logger::getInstance().init(config_path.parent_path() / "logs");

    LOG_INFO("floatnote %s", FLOATNOTE_VERSION);
    LOG_INFO("Config: %s", config.config_path.c_str());

    EventLoop loop;
    PostedEvents posted;
    X11Platform platform(config);
    X11InputPrompt prompt(platform);
    X11ConfirmDialog confirm(platform);
    DesktopNotifier notifier;
    WindowCoordinator coordinator(config, platform, prompt, confirm, notifier);

    const auto active_hotkey = register_hotkey(platform, config.hotkey);
    if (!active_hotkey) {
        LOG_ERROR("No global hotkey could be registered");
        return 1;
    }
    const std::string hotkey_name = hotkey::to_string(*active_hotkey);

    const auto on_hotkey = [&posted]() {
        if (!posted.post(LoopEvent::Trigger)) {
            LOG_WARNING("Event queue full, dropping hotkey press");
        }
    };
    loop.add_fd(platform.connection_fd(), EPOLLIN,
                [&](uint32_t) { platform.dispatch_pending(on_hotkey); });
    // Xlib may have queued events while other requests were in flight
    loop.add_post_step([&]() { platform.dispatch_pending(on_hotkey); });
    loop.add_fd(posted.fd(), EPOLLIN, [&](uint32_t) {
        posted.drain([&](LoopEvent event) {
            switch (event) {
            case LoopEvent::Trigger:
                coordinator.on_trigger();
                break;
            case LoopEvent::Quit:
                loop.stop();
                break;
            }
        });
    });
    // Quit goes through the queue so pending triggers are handled first
    loop.watch_termination_signals([&posted, &loop]() {
        if (!posted.post(LoopEvent::Quit)) {
            LOG_WARNING("Event queue full, stopping directly");
            loop.stop();
        }
    });

    LOG_INFO("Hotkey: %s", hotkey_name.c_str());
    printf("Press %s to add a note.\n", hotkey_name.c_str());
    printf("Drag a note to move it, right-drag to resize it.\n");
    printf("Click its x to close it, right-click to delete it.\n");
    printf("Press Ctrl+C to quit.\n");

    const auto elapsed = std::chrono::steady_clock::now() - start;
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (elapsed > SLOW_STARTUP) {
        LOG_WARNING("Startup took %lldms", static_cast<long long>(elapsed_ms));
    } else {
        LOG_INFO("Started in %lldms", static_cast<long long>(elapsed_ms));
    }

    loop.run();

    coordinator.shutdown();
    platform.unregister_global_hotkey();
    config.save(config.config_path);
    return 0;
}

} // anonymous namespace

int main()
{
    try {
        return run();
    } catch (const std::exception &e) {
        LOG_ERROR("Fatal: %s", e.what());
        return 1;
    }
}
