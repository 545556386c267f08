#include "hotkey.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace
{

struct NamedKey {
    std::string_view name;
    ui::KeyCode key;
};

constexpr std::array NAMED_KEYS{
    NamedKey{"space", ui::KeyCode::Space},
    NamedKey{"return", ui::KeyCode::Return},
    NamedKey{"enter", ui::KeyCode::Return},
    NamedKey{"escape", ui::KeyCode::Escape},
    NamedKey{"esc", ui::KeyCode::Escape},
    NamedKey{"tab", ui::KeyCode::Tab},
    NamedKey{"backspace", ui::KeyCode::BackSpace},
    NamedKey{"delete", ui::KeyCode::Delete},
    NamedKey{"up", ui::KeyCode::Up},
    NamedKey{"down", ui::KeyCode::Down},
    NamedKey{"left", ui::KeyCode::Left},
    NamedKey{"right", ui::KeyCode::Right},
    NamedKey{"home", ui::KeyCode::Home},
    NamedKey{"end", ui::KeyCode::End},
};

std::optional<ui::KeyModifier> parse_modifier(std::string_view token)
{
    if (token == "ctrl" || token == "control")
        return ui::KeyModifier::Ctrl;
    if (token == "shift")
        return ui::KeyModifier::Shift;
    if (token == "alt")
        return ui::KeyModifier::Alt;
    if (token == "super" || token == "win" || token == "cmd" || token == "meta")
        return ui::KeyModifier::Super;
    return std::nullopt;
}

std::optional<ui::KeyCode> parse_key(std::string_view token)
{
    if (token.size() == 1) {
        const char c = token[0];
        if (c >= 'a' && c <= 'z') {
            return static_cast<ui::KeyCode>(static_cast<int>(ui::KeyCode::A) +
                                            (c - 'a'));
        }
        if (c >= '0' && c <= '9') {
            return static_cast<ui::KeyCode>(
                static_cast<int>(ui::KeyCode::Num0) + (c - '0'));
        }
        return std::nullopt;
    }

    if (token[0] == 'f' && token.size() <= 3) {
        int number = 0;
        for (char c : token.substr(1)) {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return std::nullopt;
            number = number * 10 + (c - '0');
        }
        if (number >= 1 && number <= 12) {
            return static_cast<ui::KeyCode>(static_cast<int>(ui::KeyCode::F1) +
                                            (number - 1));
        }
        return std::nullopt;
    }

    const auto it = std::find_if(
        NAMED_KEYS.begin(), NAMED_KEYS.end(),
        [token](const NamedKey &named) { return named.name == token; });
    if (it != NAMED_KEYS.end())
        return it->key;
    return std::nullopt;
}

std::string key_name(ui::KeyCode key)
{
    const int value = static_cast<int>(key);
    if (value >= static_cast<int>(ui::KeyCode::A) &&
        value <= static_cast<int>(ui::KeyCode::Z)) {
        return std::string(1, static_cast<char>(
                                  'a' + value - static_cast<int>(ui::KeyCode::A)));
    }
    if (value >= static_cast<int>(ui::KeyCode::Num0) &&
        value <= static_cast<int>(ui::KeyCode::Num9)) {
        return std::string(
            1, static_cast<char>('0' + value - static_cast<int>(ui::KeyCode::Num0)));
    }
    if (value >= static_cast<int>(ui::KeyCode::F1) &&
        value <= static_cast<int>(ui::KeyCode::F12)) {
        return "f" + std::to_string(value - static_cast<int>(ui::KeyCode::F1) + 1);
    }
    for (const auto &named : NAMED_KEYS) {
        if (named.key == key)
            return std::string(named.name);
    }
    return "?";
}

} // anonymous namespace

namespace hotkey {

std::optional<ui::KeyboardEvent> parse(std::string_view text)
{
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            lowered += static_cast<char>(
                std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (lowered.empty())
        return std::nullopt;

    ui::KeyboardEvent result;
    bool have_key = false;

    size_t start = 0;
    while (start <= lowered.size()) {
        const size_t end = std::min(lowered.find('+', start), lowered.size());
        const std::string_view token(lowered.data() + start, end - start);
        if (token.empty())
            return std::nullopt;

        if (const auto modifier = parse_modifier(token)) {
            result.modifiers |= *modifier;
        } else if (const auto key = parse_key(token)) {
            if (have_key)
                return std::nullopt;
            result.key = *key;
            have_key = true;
        } else {
            return std::nullopt;
        }
        start = end + 1;
    }

    if (!have_key)
        return std::nullopt;
    return result;
}

std::string to_string(const ui::KeyboardEvent &hotkey)
{
    std::string out;
    const std::pair<ui::KeyModifier, const char *> order[] = {
        {ui::KeyModifier::Ctrl, "ctrl"},
        {ui::KeyModifier::Alt, "alt"},
        {ui::KeyModifier::Shift, "shift"},
        {ui::KeyModifier::Super, "super"},
    };
    for (const auto &[modifier, name] : order) {
        if (ui::has_modifier(hotkey.modifiers, modifier)) {
            out += name;
            out += '+';
        }
    }
    return out + key_name(hotkey.key);
}

} // namespace hotkey
