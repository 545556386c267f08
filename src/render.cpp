#include "render.h"
#include "utility.h"

#include <glib-object.h>
#include <glib.h>
#include <pango/pango-font.h>
#include <pango/pango-layout.h>
#include <pango/pangocairo.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace
{

struct Color {
    double r;
    double g;
    double b;
    double a = 1.0;
};

// Palette shared by the notes and the input prompt
constexpr Color NOTE_BACKGROUND{0.17, 0.24, 0.31, 0.75};
constexpr Color NOTE_TEXT{1.0, 1.0, 1.0};
constexpr Color PROMPT_BACKGROUND{0.17, 0.24, 0.31};
constexpr Color PROMPT_TITLE_BAR{0.20, 0.29, 0.37};
constexpr Color PROMPT_TEXT{0.93, 0.94, 0.95};
constexpr Color PROMPT_HINT{0.50, 0.55, 0.55};
constexpr Color PROMPT_CURSOR{0.20, 0.60, 0.86};
constexpr Color CLOSE_GLYPH{0.58, 0.65, 0.65};
constexpr Color CONFIRM_YES{0.91, 0.30, 0.24};
constexpr Color CONFIRM_NO{0.58, 0.65, 0.65};

// Corner flags for rounded rectangles
enum class Corner : uint8_t {
    NoCorners = 0,
    TopLeft = 1 << 0,
    TopRight = 1 << 1,
    BottomRight = 1 << 2,
    BottomLeft = 1 << 3,
    All = TopLeft | TopRight | BottomRight | BottomLeft
};

constexpr Corner operator|(Corner a, Corner b)
{
    return static_cast<Corner>(static_cast<uint8_t>(a) |
                               static_cast<uint8_t>(b));
}

constexpr bool operator&(Corner a, Corner b)
{
    return static_cast<uint8_t>(a) & static_cast<uint8_t>(b);
}

void set_color(cairo_t *cr, const Color &color)
{
    cairo_set_source_rgba(cr, color.r, color.g, color.b, color.a);
}

void draw_rounded_rect(cairo_t *cr, double x, double y, double width,
                       double height, double radius, Corner corners)
{
    const double degrees = G_PI / 180.0;

    cairo_new_sub_path(cr);

    if (corners & Corner::TopRight) {
        cairo_arc(cr, x + width - radius, y + radius, radius, -90 * degrees,
                  0 * degrees);
    } else {
        cairo_move_to(cr, x + width, y);
    }

    if (corners & Corner::BottomRight) {
        cairo_arc(cr, x + width - radius, y + height - radius, radius,
                  0 * degrees, 90 * degrees);
    } else {
        cairo_line_to(cr, x + width, y + height);
    }

    if (corners & Corner::BottomLeft) {
        cairo_arc(cr, x + radius, y + height - radius, radius, 90 * degrees,
                  180 * degrees);
    } else {
        cairo_line_to(cr, x, y + height);
    }

    if (corners & Corner::TopLeft) {
        cairo_arc(cr, x + radius, y + radius, radius, 180 * degrees,
                  270 * degrees);
    } else {
        cairo_line_to(cr, x, y);
    }

    cairo_close_path(cr);
}

void clear(cairo_t *cr)
{
    cairo_set_source_rgba(cr, 0.0, 0.0, 0.0, 0.0);
    cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);
    cairo_paint(cr);
    cairo_set_operator(cr, CAIRO_OPERATOR_OVER);
}

std::string font_string(const FontConfig &font, const char *style, int size)
{
    std::string desc = font.family;
    if (style && *style) {
        desc += " ";
        desc += style;
    }
    return desc + " " + std::to_string(size);
}

// Lays out note text with the note font, wrapping at wrap_width pixels
void setup_note_layout(PangoLayout *layout, const std::string &text,
                       const FontConfig &font, int wrap_width)
{
    PangoFontDescription *font_desc = pango_font_description_from_string(
        font_string(font, "Bold", font.size).c_str());
    const defer cleanup_font(
        [font_desc]() noexcept { pango_font_description_free(font_desc); });

    pango_layout_set_font_description(layout, font_desc);
    pango_layout_set_width(layout, std::max(1, wrap_width) * PANGO_SCALE);
    pango_layout_set_wrap(layout, PANGO_WRAP_WORD_CHAR);
    pango_layout_set_text(layout, text.c_str(), -1);
}

void draw_close_glyph(cairo_t *cr, const render::Rect &button)
{
    const double inset = button.width * 0.3;
    set_color(cr, CLOSE_GLYPH);
    cairo_set_line_width(cr, 2.0);
    cairo_move_to(cr, button.x + inset, button.y + inset);
    cairo_line_to(cr, button.x + button.width - inset,
                  button.y + button.height - inset);
    cairo_move_to(cr, button.x + button.width - inset, button.y + inset);
    cairo_line_to(cr, button.x + inset, button.y + button.height - inset);
    cairo_stroke(cr);
}

} // anonymous namespace

namespace render
{

ui::WindowDimension measure_note(const std::string &text,
                                 const FontConfig &font)
{
    cairo_surface_t *surface =
        cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 1, 1);
    const defer cleanup_surface(
        [surface]() noexcept { cairo_surface_destroy(surface); });
    cairo_t *cr = cairo_create(surface);
    const defer cleanup_cr([cr]() noexcept { cairo_destroy(cr); });
    if (cairo_status(cr) != CAIRO_STATUS_SUCCESS) {
        throw std::runtime_error("Failed to create Cairo context for text "
                                 "measurement");
    }

    PangoLayout *layout = pango_cairo_create_layout(cr);
    const defer cleanup_layout([layout]() noexcept { g_object_unref(layout); });
    setup_note_layout(layout, text, font, MAX_NOTE_TEXT_WIDTH);

    int text_width = 0;
    int text_height = 0;
    pango_layout_get_pixel_size(layout, &text_width, &text_height);

    return ui::WindowDimension{
        .height = static_cast<unsigned int>(text_height + 2 * NOTE_PADDING_Y),
        .width = static_cast<unsigned int>(text_width + 2 * NOTE_PADDING_X +
                                           CLOSE_BUTTON_SIZE),
    };
}

Rect note_close_button(ui::WindowDimension size)
{
    return Rect{static_cast<double>(size.width) - CLOSE_BUTTON_SIZE - 4.0,
                4.0, static_cast<double>(CLOSE_BUTTON_SIZE),
                static_cast<double>(CLOSE_BUTTON_SIZE)};
}

void draw_note(cairo_t *cr, ui::WindowDimension size, const std::string &text,
               const FontConfig &font)
{
    clear(cr);

    set_color(cr, NOTE_BACKGROUND);
    draw_rounded_rect(cr, 0, 0, size.width, size.height, CORNER_RADIUS,
                      Corner::All);
    cairo_fill(cr);

    PangoLayout *layout = pango_cairo_create_layout(cr);
    const defer cleanup_layout([layout]() noexcept { g_object_unref(layout); });
    setup_note_layout(layout, text, font,
                      static_cast<int>(size.width) - 2 * NOTE_PADDING_X -
                          CLOSE_BUTTON_SIZE);

    int text_width = 0;
    int text_height = 0;
    pango_layout_get_pixel_size(layout, &text_width, &text_height);

    // Vertically centered when the note is taller than its text
    const double text_y =
        std::max(static_cast<double>(NOTE_PADDING_Y),
                 (static_cast<double>(size.height) - text_height) / 2.0);
    set_color(cr, NOTE_TEXT);
    cairo_move_to(cr, NOTE_PADDING_X, text_y);
    pango_cairo_show_layout(cr, layout);

    draw_close_glyph(cr, note_close_button(size));
}

Rect prompt_close_button(ui::WindowDimension size)
{
    return Rect{static_cast<double>(size.width) - PROMPT_TITLE_HEIGHT, 0.0,
                static_cast<double>(PROMPT_TITLE_HEIGHT),
                static_cast<double>(PROMPT_TITLE_HEIGHT)};
}

void draw_prompt(cairo_t *cr, ui::WindowDimension size, const PromptView &view,
                 const FontConfig &font)
{
    const double width = size.width;
    const double height = size.height;
    constexpr double content_x = 20.0;

    clear(cr);

    set_color(cr, PROMPT_BACKGROUND);
    draw_rounded_rect(cr, 0, 0, width, height, CORNER_RADIUS, Corner::All);
    cairo_fill(cr);

    // Title bar
    set_color(cr, PROMPT_TITLE_BAR);
    draw_rounded_rect(cr, 0, 0, width, PROMPT_TITLE_HEIGHT, CORNER_RADIUS,
                      Corner::TopLeft | Corner::TopRight);
    cairo_fill(cr);

    PangoLayout *layout = pango_cairo_create_layout(cr);
    const defer cleanup_layout([layout]() noexcept { g_object_unref(layout); });

    auto show_text = [&](const std::string &text, const char *style,
                         int font_size, const Color &color, double x,
                         double y) {
        PangoFontDescription *font_desc = pango_font_description_from_string(
            font_string(font, style, font_size).c_str());
        const defer cleanup_font(
            [font_desc]() noexcept { pango_font_description_free(font_desc); });
        pango_layout_set_font_description(layout, font_desc);
        pango_layout_set_text(layout, text.c_str(), -1);

        set_color(cr, color);
        cairo_move_to(cr, x, y);
        pango_cairo_show_layout(cr, layout);

        int text_width = 0;
        int text_height = 0;
        pango_layout_get_pixel_size(layout, &text_width, &text_height);
        return text_width;
    };

    const int base_size = std::max(8, font.size - 4);
    show_text(view.title, "Bold", base_size + 1, PROMPT_TEXT, content_x - 5,
              8.0);
    draw_close_glyph(cr, prompt_close_button(size));

    // Input field
    const double field_y = PROMPT_TITLE_HEIGHT + 25.0;
    const double field_height = 40.0;
    set_color(cr, PROMPT_TITLE_BAR);
    draw_rounded_rect(cr, content_x, field_y, width - 2 * content_x,
                      field_height, 4.0, Corner::All);
    cairo_fill(cr);

    pango_layout_set_ellipsize(layout, PANGO_ELLIPSIZE_START);
    pango_layout_set_width(layout,
                           static_cast<int>(width - 2 * content_x - 20) *
                               PANGO_SCALE);
    const int input_width = show_text(view.input, "", base_size + 2,
                                      PROMPT_TEXT, content_x + 8,
                                      field_y + 10.0);
    pango_layout_set_width(layout, -1);
    pango_layout_set_ellipsize(layout, PANGO_ELLIPSIZE_NONE);

    // Cursor after the text
    const double cursor_x = content_x + 8 + input_width + 1;
    set_color(cr, PROMPT_CURSOR);
    cairo_set_line_width(cr, 2.0);
    cairo_move_to(cr, cursor_x, field_y + 8.0);
    cairo_line_to(cr, cursor_x, field_y + field_height - 8.0);
    cairo_stroke(cr);

    show_text(view.hint, "", base_size - 1, PROMPT_HINT, content_x,
              field_y + field_height + 15.0);
}

Rect confirm_yes_button(ui::WindowDimension size)
{
    const double width = size.width;
    return Rect{width / 2.0 - 90.0, static_cast<double>(size.height) - 42.0,
                80.0, 30.0};
}

Rect confirm_no_button(ui::WindowDimension size)
{
    const double width = size.width;
    return Rect{width / 2.0 + 10.0, static_cast<double>(size.height) - 42.0,
                80.0, 30.0};
}

void draw_confirm(cairo_t *cr, ui::WindowDimension size,
                  const std::string &question, const FontConfig &font)
{
    clear(cr);

    set_color(cr, PROMPT_BACKGROUND);
    draw_rounded_rect(cr, 0, 0, size.width, size.height, CORNER_RADIUS,
                      Corner::All);
    cairo_fill(cr);

    PangoLayout *layout = pango_cairo_create_layout(cr);
    const defer cleanup_layout([layout]() noexcept { g_object_unref(layout); });

    const int base_size = std::max(8, font.size - 5);
    auto show_centered = [&](const std::string &text, const char *style,
                             const Color &color, double center_x, double y) {
        PangoFontDescription *font_desc = pango_font_description_from_string(
            font_string(font, style, base_size).c_str());
        const defer cleanup_font(
            [font_desc]() noexcept { pango_font_description_free(font_desc); });
        pango_layout_set_font_description(layout, font_desc);
        pango_layout_set_text(layout, text.c_str(), -1);

        int text_width = 0;
        int text_height = 0;
        pango_layout_get_pixel_size(layout, &text_width, &text_height);
        set_color(cr, color);
        cairo_move_to(cr, center_x - text_width / 2.0, y - text_height / 2.0);
        pango_cairo_show_layout(cr, layout);
    };

    show_centered(question, "", PROMPT_TEXT, size.width / 2.0, 30.0);

    struct Button {
        Rect rect;
        const char *label;
        Color color;
    };
    const std::array<Button, 2> buttons{{
        {confirm_yes_button(size), "Delete", CONFIRM_YES},
        {confirm_no_button(size), "Keep", CONFIRM_NO},
    }};
    for (const auto &button : buttons) {
        const Rect &rect = button.rect;
        set_color(cr, button.color);
        draw_rounded_rect(cr, rect.x, rect.y, rect.width, rect.height, 4.0,
                          Corner::All);
        cairo_fill(cr);
        show_centered(button.label, "Bold", NOTE_TEXT,
                      rect.x + rect.width / 2.0, rect.y + rect.height / 2.0);
    }
}

} // namespace render
