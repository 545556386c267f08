#include "x11_platform.h"
#include "logger.h"
#include "x11_surface.h"

#include <X11/X.h>
#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>
#include <X11/extensions/randr.h>
#include <X11/keysym.h>

#include <array>
#include <optional>
#include <stdexcept>
#include <string>

namespace
{

struct MonitorInfo {
    unsigned int width;
    unsigned int height;
    int x;
    int y;
};

std::optional<MonitorInfo> get_primary_monitor_xrandr(Display *display,
                                                      int screen)
{
    int xrandr_event_base, xrandr_error_base;
    if (!XRRQueryExtension(display, &xrandr_event_base, &xrandr_error_base)) {
        LOG_WARNING("XRandR extension not available");
        return std::nullopt;
    }

    int major_version, minor_version;
    if (!XRRQueryVersion(display, &major_version, &minor_version)) {
        LOG_WARNING("XRandR version query failed");
        return std::nullopt;
    }

    // Monitor info needs XRandR 1.2
    if (major_version < 1 || (major_version == 1 && minor_version < 2)) {
        LOG_WARNING("XRandR version too old (need 1.2+)");
        return std::nullopt;
    }

    const ::Window root = RootWindow(display, screen);
    XRRScreenResources *screen_resources = XRRGetScreenResources(display, root);
    if (!screen_resources) {
        LOG_ERROR("Failed to get XRandR screen resources");
        return std::nullopt;
    }

    std::optional<MonitorInfo> result;
    RROutput primary = XRRGetOutputPrimary(display, root);

    // If no primary is set, use the first connected output
    if (primary == None) {
        LOG_INFO("No primary output set, looking for first connected output");
        for (int i = 0; i < screen_resources->noutput; i++) {
            XRROutputInfo *output_info = XRRGetOutputInfo(
                display, screen_resources, screen_resources->outputs[i]);
            const bool usable = output_info &&
                                output_info->connection == RR_Connected &&
                                output_info->crtc;
            if (output_info)
                XRRFreeOutputInfo(output_info);
            if (usable) {
                primary = screen_resources->outputs[i];
                break;
            }
        }
    }

    if (primary != None) {
        XRROutputInfo *output_info =
            XRRGetOutputInfo(display, screen_resources, primary);
        if (output_info && output_info->crtc) {
            XRRCrtcInfo *crtc_info =
                XRRGetCrtcInfo(display, screen_resources, output_info->crtc);
            if (crtc_info) {
                result = MonitorInfo{crtc_info->width, crtc_info->height,
                                     crtc_info->x, crtc_info->y};
                XRRFreeCrtcInfo(crtc_info);
            }
        }
        if (output_info)
            XRRFreeOutputInfo(output_info);
    }

    XRRFreeScreenResources(screen_resources);
    return result;
}

KeySym keycode_to_keysym(ui::KeyCode key)
{
    const auto offset = [key](ui::KeyCode first) {
        return static_cast<KeySym>(static_cast<int>(key) -
                                   static_cast<int>(first));
    };

    if (key >= ui::KeyCode::A && key <= ui::KeyCode::Z)
        return XK_a + offset(ui::KeyCode::A);
    if (key >= ui::KeyCode::Num0 && key <= ui::KeyCode::Num9)
        return XK_0 + offset(ui::KeyCode::Num0);
    if (key >= ui::KeyCode::F1 && key <= ui::KeyCode::F12)
        return XK_F1 + offset(ui::KeyCode::F1);

    switch (key) {
    case ui::KeyCode::Escape:
        return XK_Escape;
    case ui::KeyCode::Return:
        return XK_Return;
    case ui::KeyCode::BackSpace:
        return XK_BackSpace;
    case ui::KeyCode::Delete:
        return XK_Delete;
    case ui::KeyCode::Tab:
        return XK_Tab;
    case ui::KeyCode::Space:
        return XK_space;
    case ui::KeyCode::Up:
        return XK_Up;
    case ui::KeyCode::Down:
        return XK_Down;
    case ui::KeyCode::Left:
        return XK_Left;
    case ui::KeyCode::Right:
        return XK_Right;
    case ui::KeyCode::Home:
        return XK_Home;
    case ui::KeyCode::End:
        return XK_End;
    default:
        return NoSymbol;
    }
}

unsigned int modifiers_to_x11(ui::KeyModifier mods)
{
    unsigned int x11_mods = 0;
    if (ui::has_modifier(mods, ui::KeyModifier::Ctrl))
        x11_mods |= ControlMask;
    if (ui::has_modifier(mods, ui::KeyModifier::Alt))
        x11_mods |= Mod1Mask;
    if (ui::has_modifier(mods, ui::KeyModifier::Shift))
        x11_mods |= ShiftMask;
    if (ui::has_modifier(mods, ui::KeyModifier::Super))
        x11_mods |= Mod4Mask;
    return x11_mods;
}

// NumLock and CapsLock must not change whether the hotkey matches
constexpr std::array<unsigned int, 4> LOCK_VARIANTS = {
    0, Mod2Mask, LockMask, Mod2Mask | LockMask};

// The default Xlib handler exits the process; a stale window id is routine
// here (a note closed while its events were queued)
int log_error_handler(Display *display, XErrorEvent *event)
{
    std::array<char, 256> text{};
    XGetErrorText(display, event->error_code, text.data(),
                  static_cast<int>(text.size()));
    LOG_WARNING("X error: %s (request %d, resource 0x%lx)", text.data(),
                event->request_code, event->resourceid);
    return 0;
}

bool g_grab_error_occurred = false;
int grab_error_handler(Display * /*display*/, XErrorEvent *event)
{
    if (event->error_code == BadAccess) {
        g_grab_error_occurred = true;
    }
    return 0;
}

} // anonymous namespace

X11Platform::X11Platform(const Config &config) : font_(config.font)
{
    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        throw std::runtime_error("Cannot open display");
    }
    XSetErrorHandler(log_error_handler);

    const int screen = DefaultScreen(display_);

    if (const auto primary_monitor =
            get_primary_monitor_xrandr(display_, screen)) {
        origin_ = {primary_monitor->x, primary_monitor->y};
        screen_size_ = {.height = primary_monitor->height,
                        .width = primary_monitor->width};
    } else {
        LOG_INFO("Falling back to the whole X screen");
        screen_size_ = {
            .height = static_cast<unsigned int>(DisplayHeight(display_, screen)),
            .width = static_cast<unsigned int>(DisplayWidth(display_, screen)),
        };
    }
    LOG_DEBUG("Primary monitor: %ux%u at (%d,%d)", screen_size_.width,
              screen_size_.height, origin_.x, origin_.y);

    // Translucent notes need a 32 bit visual
    XVisualInfo vinfo;
    if (!XMatchVisualInfo(display_, screen, 32, TrueColor, &vinfo)) {
        XCloseDisplay(display_);
        throw std::runtime_error("No 32 bit TrueColor visual available");
    }
    visual_ = vinfo.visual;
    depth_ = vinfo.depth;
    colormap_ = XCreateColormap(display_, RootWindow(display_, screen),
                                visual_, AllocNone);
}

X11Platform::~X11Platform()
{
    unregister_global_hotkey();
    if (!sinks_.empty()) {
        LOG_WARNING("%zu windows still registered at disconnect",
                    sinks_.size());
    }
    if (colormap_)
        XFreeColormap(display_, colormap_);
    XCloseDisplay(display_);
}

std::unique_ptr<SurfaceHandle> X11Platform::acquire_surface()
{
    return std::make_unique<X11Surface>(*this);
}

int X11Platform::connection_fd() const { return ConnectionNumber(display_); }

Atom X11Platform::atom(const char *name) const
{
    return XInternAtom(display_, name, False);
}

::Window X11Platform::create_window(ui::ScreenCoord top_left,
                                    ui::WindowDimension dimension,
                                    long event_mask)
{
    XSetWindowAttributes attrs;
    attrs.override_redirect = True;
    attrs.colormap = colormap_;
    attrs.background_pixel = 0;
    attrs.border_pixel = 0;
    attrs.event_mask = event_mask;

    const ui::ScreenCoord absolute = origin_ + top_left;
    return XCreateWindow(display_, DefaultRootWindow(display_), absolute.x,
                         absolute.y, dimension.width, dimension.height, 0,
                         depth_, InputOutput, visual_,
                         CWOverrideRedirect | CWColormap | CWBackPixel |
                             CWBorderPixel | CWEventMask,
                         &attrs);
}

void X11Platform::register_sink(::Window window, X11EventSink *sink)
{
    sinks_[window] = sink;
}

void X11Platform::unregister_sink(::Window window) { sinks_.erase(window); }

void X11Platform::dispatch_pending(const std::function<void()> &on_hotkey)
{
    XEvent event;
    while (XPending(display_) > 0) {
        XNextEvent(display_, &event);

        if (event.type == KeyPress && hotkey_registered_) {
            const auto clean_state =
                event.xkey.state &
                ~static_cast<unsigned int>(Mod2Mask | LockMask);
            if (event.xkey.keycode == hotkey_keycode_ &&
                clean_state == hotkey_modifiers_) {
                on_hotkey();
                continue;
            }
        }

        const auto it = sinks_.find(event.xany.window);
        if (it == sinks_.end()) {
            continue;
        }
        it->second->handle_event(event);
    }
}

bool X11Platform::register_global_hotkey(const ui::KeyboardEvent &hotkey)
{
    if (hotkey_registered_) {
        unregister_global_hotkey();
    }

    const KeySym keysym = keycode_to_keysym(hotkey.key);
    if (keysym == NoSymbol) {
        LOG_ERROR("Cannot convert key to X11 KeySym");
        return false;
    }

    const ::KeyCode keycode = XKeysymToKeycode(display_, keysym);
    if (keycode == 0) {
        LOG_ERROR("Cannot convert KeySym to X11 KeyCode");
        return false;
    }

    const unsigned int x11_mods = modifiers_to_x11(hotkey.modifiers);
    const ::Window root = DefaultRootWindow(display_);

    g_grab_error_occurred = false;
    auto old_handler = XSetErrorHandler(grab_error_handler);

    XGrabKey(display_, keycode, x11_mods, root, True, GrabModeAsync,
             GrabModeAsync);
    XSync(display_, False);

    if (g_grab_error_occurred) {
        XSetErrorHandler(old_handler);
        LOG_ERROR("XGrabKey failed - hotkey may already be in use by another "
                  "application");
        return false;
    }

    // Lock variants are best-effort
    for (const unsigned int lock : LOCK_VARIANTS) {
        if (lock != 0) {
            XGrabKey(display_, keycode, x11_mods | lock, root, True,
                     GrabModeAsync, GrabModeAsync);
        }
    }
    XSync(display_, False);
    XSetErrorHandler(old_handler);

    hotkey_registered_ = true;
    hotkey_keycode_ = keycode;
    hotkey_modifiers_ = x11_mods;

    LOG_INFO("Registered global hotkey (keycode=%d, mods=0x%x)", keycode,
             x11_mods);
    return true;
}

void X11Platform::unregister_global_hotkey()
{
    if (!hotkey_registered_) {
        return;
    }

    const ::Window root = DefaultRootWindow(display_);
    for (const unsigned int lock : LOCK_VARIANTS) {
        XUngrabKey(display_, static_cast<int>(hotkey_keycode_),
                   hotkey_modifiers_ | lock, root);
    }
    XFlush(display_);

    hotkey_registered_ = false;
    hotkey_keycode_ = 0;
    hotkey_modifiers_ = 0;

    LOG_INFO("Unregistered global hotkey");
}
