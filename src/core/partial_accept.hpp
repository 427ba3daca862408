#pragma once

#include <stddef.h>
#include <cz/str.hpp>

namespace ghost {

/// Find the end of the first word of `text`, including the character that ends
/// it (whitespace, `.,;:!?`, or a closing bracket).  If there is no such
/// character the entire `text` is one word.  Returns `0` if `text` is empty.
size_t next_word_boundary(cz::Str text);

/// Find the end of the first line of `text`, including the `\n`.
/// Returns `text.len` if there is no `\n` and `0` if `text` is empty.
size_t next_line_boundary(cz::Str text);

}
