#include "partial_accept.hpp"

#include <cz/char_type.hpp>

namespace ghost {

static bool is_word_boundary(char ch) {
    switch (ch) {
    case '.':
    case ',':
    case ';':
    case ':':
    case '!':
    case '?':
    case ']':
    case '}':
    case ')':
        return true;
    default:
        return cz::is_space(ch);
    }
}

size_t next_word_boundary(cz::Str text) {
    for (size_t i = 0; i < text.len; ++i) {
        if (is_word_boundary(text[i])) {
            return i + 1;
        }
    }
    return text.len;
}

size_t next_line_boundary(cz::Str text) {
    const char* newline = text.find('\n');
    if (newline) {
        return newline - text.buffer + 1;
    }
    return text.len;
}

}
