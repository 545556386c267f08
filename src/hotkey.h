#pragma once

#include "types.h"

#include <optional>
#include <string>
#include <string_view>

namespace hotkey {

// Parses combinations like "ctrl+shift+t" or "Super + F5". Exactly one
// non-modifier key is required. Returns nullopt for anything else.
std::optional<ui::KeyboardEvent> parse(std::string_view text);

// Inverse of parse(), e.g. "ctrl+shift+t"
std::string to_string(const ui::KeyboardEvent &hotkey);

} // namespace hotkey
