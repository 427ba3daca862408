#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/str.hpp>

namespace ghost {

/// A zero-based line and column.  Line separators (`\n`) are not
/// counted in either adjacent line's columns but do occupy one offset.
struct Position {
    uint64_t line;
    uint64_t column;

    bool operator==(const Position& other) const {
        return line == other.line && column == other.column;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }

    bool operator<(const Position& other) const {
        if (line != other.line) {
            return line < other.line;
        }
        return column < other.column;
    }
    bool operator<=(const Position& other) const { return !(other < *this); }
};

struct Range {
    Position start;
    Position end;

    bool is_empty() const { return start == end; }

    /// Both `start` and `end` are inside the `Range`.
    bool contains(Position position) const { return start <= position && position <= end; }
};

/// Convert a `line` and `column` into an offset in `text`.
///
/// Lines past the end clamp to the end of the text.  Columns past
/// the end of the line clamp to the end of the line.  Negative
/// values clamp to offset `0`.
uint64_t offset_from_position(cz::Str text, int64_t line, int64_t column);

/// Convert an offset in `text` into a `Position`.
///
/// An offset that lands on a `\n` is attributed to the end of the
/// line before it.  Offsets past the end clamp to the final position.
Position position_from_offset(cz::Str text, int64_t offset);

/// The `Range` `completion` would occupy if it were inserted at `anchor`.
Range completion_range(Position anchor, cz::Str completion);

/// Do the ranges intersect or touch?
bool ranges_overlap(Range a, Range b);

/// Shift both ends of `range` horizontally by `delta` columns.  Columns clamp at `0`.
Range shift_range(Range range, int64_t delta);

size_t common_prefix_length(cz::Str a, cz::Str b);

/// If `typed` is a prefix of `completion` then get the rest of
/// `completion`.  Otherwise `completion` is returned unchanged.
cz::Str remaining_completion(cz::Str typed, cz::Str completion);

}
