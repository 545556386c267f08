#include "utility.h"

#include <cctype>

std::string trim(std::string_view text)
{
    const auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };

    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}
