#include "coordinates.hpp"

#include <cz/assert.hpp>
#include <cz/util.hpp>
#include <tracy/Tracy.hpp>

namespace ghost {

static void assert_text_present(cz::Str text) {
    CZ_ASSERT(text.buffer || text.len == 0);
}

/// Find the end of the line starting at `start`.
static uint64_t end_of_line(cz::Str text, uint64_t start) {
    cz::Str rest = text.slice_start(start);
    const char* newline = rest.find('\n');
    if (newline) {
        return newline - text.buffer;
    }
    return text.len;
}

uint64_t offset_from_position(cz::Str text, int64_t line, int64_t column) {
    ZoneScoped;
    assert_text_present(text);

    if (line < 0 || column < 0) {
        return 0;
    }

    uint64_t start = 0;
    for (int64_t i = 0; i < line; ++i) {
        uint64_t end = end_of_line(text, start);
        if (end == text.len) {
            return text.len;
        }
        start = end + 1;
    }

    uint64_t end = end_of_line(text, start);
    return start + cz::min(end - start, (uint64_t)column);
}

Position position_from_offset(cz::Str text, int64_t offset) {
    ZoneScoped;
    assert_text_present(text);

    Position position = {};
    if (offset <= 0) {
        return position;
    }

    uint64_t target = cz::min((uint64_t)offset, (uint64_t)text.len);
    uint64_t start = 0;
    while (1) {
        uint64_t end = end_of_line(text, start);
        if (target <= end) {
            position.column = target - start;
            return position;
        }
        start = end + 1;
        ++position.line;
    }
}

Range completion_range(Position anchor, cz::Str completion) {
    Range range;
    range.start = anchor;

    const char* last_newline = completion.rfind('\n');
    if (last_newline) {
        range.end.line = anchor.line + completion.count('\n');
        range.end.column = completion.buffer + completion.len - (last_newline + 1);
    } else {
        range.end.line = anchor.line;
        range.end.column = anchor.column + completion.len;
    }
    return range;
}

bool ranges_overlap(Range a, Range b) {
    return !(a.end < b.start || b.end < a.start);
}

static uint64_t shift_column(uint64_t column, int64_t delta) {
    if (delta < 0 && (uint64_t)-delta > column) {
        return 0;
    }
    return column + delta;
}

Range shift_range(Range range, int64_t delta) {
    range.start.column = shift_column(range.start.column, delta);
    range.end.column = shift_column(range.end.column, delta);
    return range;
}

size_t common_prefix_length(cz::Str a, cz::Str b) {
    size_t len = cz::min(a.len, b.len);
    size_t i = 0;
    while (i < len && a[i] == b[i]) {
        ++i;
    }
    return i;
}

cz::Str remaining_completion(cz::Str typed, cz::Str completion) {
    if (completion.starts_with(typed)) {
        return completion.slice_start(typed.len);
    }
    return completion;
}

}
