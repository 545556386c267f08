#pragma once

#include "config.h"
#include "types.h"

#include <cairo.h>

#include <string>

namespace render
{

constexpr double CORNER_RADIUS = 8.0;
constexpr int NOTE_PADDING_X = 15;
constexpr int NOTE_PADDING_Y = 10;
constexpr int CLOSE_BUTTON_SIZE = 20;
// Longer notes wrap
constexpr int MAX_NOTE_TEXT_WIDTH = 480;

constexpr ui::WindowDimension PROMPT_SIZE{.height = 180, .width = 450};
constexpr int PROMPT_TITLE_HEIGHT = 35;

constexpr ui::WindowDimension CONFIRM_SIZE{.height = 100, .width = 250};

struct Rect {
    double x;
    double y;
    double width;
    double height;

    bool contains(double px, double py) const
    {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
};

// Size needed to show `text` on a note, close control included
ui::WindowDimension measure_note(const std::string &text,
                                 const FontConfig &font);
Rect note_close_button(ui::WindowDimension size);
// Text wraps at the note's inner width, so a resized note reflows
void draw_note(cairo_t *cr, ui::WindowDimension size, const std::string &text,
               const FontConfig &font);

struct PromptView {
    std::string title;
    std::string input;
    std::string hint;
};

Rect prompt_close_button(ui::WindowDimension size);
void draw_prompt(cairo_t *cr, ui::WindowDimension size, const PromptView &view,
                 const FontConfig &font);

// Yes/no dialog: the question above a "Delete" and a "Keep" button
Rect confirm_yes_button(ui::WindowDimension size);
Rect confirm_no_button(ui::WindowDimension size);
void draw_confirm(cairo_t *cr, ui::WindowDimension size,
                  const std::string &question, const FontConfig &font);

} // namespace render
