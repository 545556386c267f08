#pragma once

#include <cstdint>
#include <optional>
#include <variant>

namespace ui {

// Absolute position on the root window / virtual screen
struct ScreenCoord {
    int x;
    int y;

    bool operator==(const ScreenCoord &other) const = default;
};

inline ScreenCoord operator+(ScreenCoord a, ScreenCoord b)
{
    return {a.x + b.x, a.y + b.y};
}

inline ScreenCoord operator-(ScreenCoord a, ScreenCoord b)
{
    return {a.x - b.x, a.y - b.y};
}

struct WindowDimension {
    unsigned int height;
    unsigned int width;

    bool operator==(const WindowDimension &other) const = default;
};

enum class KeyCode {
    NoKey,
    Escape,
    Return,
    BackSpace,
    Delete,
    Tab,
    Space,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    // Letter keys A-Z
    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
    // Number keys 0-9
    Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,
    // Function keys
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    // For printable characters not covered above
    Character,
};

// Modifier flags - can be combined with |
enum class KeyModifier : uint8_t {
    NoModifier = 0,
    Ctrl  = 1 << 0,
    Alt   = 1 << 1,
    Shift = 1 << 2,
    Super = 1 << 3,  // Win key on Windows, Meta on Linux
};

inline KeyModifier operator|(KeyModifier a, KeyModifier b) {
    return static_cast<KeyModifier>(
        static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline KeyModifier operator&(KeyModifier a, KeyModifier b) {
    return static_cast<KeyModifier>(
        static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline KeyModifier& operator|=(KeyModifier& a, KeyModifier b) {
    return a = a | b;
}

inline bool has_modifier(KeyModifier flags, KeyModifier test) {
    return static_cast<uint8_t>(flags & test) != 0;
}

struct KeyboardEvent {
    KeyCode key = KeyCode::NoKey;
    KeyModifier modifiers = KeyModifier::NoModifier;
    std::optional<char> character; // For KeyCode::Character events
};

enum class PointerButton {
    Primary,   // moves the surface
    Secondary, // resizes it, or asks to delete it when clicked
};

// Pointer events delivered to a floating surface. Positions are absolute
// (root window) coordinates so that a gesture survives the surface moving
// underneath the pointer.
struct PointerDown {
    ScreenCoord position;
    PointerButton button = PointerButton::Primary;
};

struct PointerMove {
    ScreenCoord position;
};

struct PointerUp {
    ScreenCoord position;
    PointerButton button = PointerButton::Primary;
};

// Click on the surface's close control
struct CloseClicked {};

using PointerEvent =
    std::variant<PointerDown, PointerMove, PointerUp, CloseClicked>;

// Global hotkey was pressed
struct HotkeyEvent {};

} // namespace ui
