#pragma once

#include <stdint.h>
#include <chrono>
#include <cz/allocator.hpp>
#include <cz/string.hpp>
#include "core/coordinates.hpp"

namespace ghost {

// clang-format off
#define GHOST_WITHDRAW_REASONS(GHOST_WITHDRAW_REASON)                         \
    GHOST_WITHDRAW_REASON(NONE)                                               \
    /* There is no active suggestion. */                                      \
    GHOST_WITHDRAW_REASON(EMPTY)                                              \
    GHOST_WITHDRAW_REASON(OTHER_DOCUMENT)                                     \
    GHOST_WITHDRAW_REASON(STALE)                                              \
    GHOST_WITHDRAW_REASON(CURSOR_LEFT_RANGE)                                  \
    /* The text typed since the anchor isn't a prefix of the suggestion. */  \
    GHOST_WITHDRAW_REASON(TEXT_DIVERGED)                                      \
    GHOST_WITHDRAW_REASON(DISMISSED)                                          \
    GHOST_WITHDRAW_REASON(ACCEPTED)                                           \
    GHOST_WITHDRAW_REASON(REPLACED)
// clang-format on

namespace Withdraw_Reason_ {
enum Withdraw_Reason {
#define X(name) name,
    GHOST_WITHDRAW_REASONS(X)
#undef X

    // Special value representing the number of values in the enum.
    length,
};

extern const char* const names[/*Withdraw_Reason::length*/];
}
using Withdraw_Reason_::Withdraw_Reason;

/// The state of a document as the host sees it right now.
/// Nothing is owned; the core copies what it keeps.
struct Document_Snapshot {
    cz::Str text;
    Position cursor;
    cz::Str identity;
};

/// Either every field is set (`active`) or none are.
struct Completion_State {
    bool active;

    cz::String completion;
    cz::String base_document_text;
    cz::String document_identity;
    Position anchor;
    Range active_range;
    std::chrono::steady_clock::time_point created_at;
};

/// Tracks the single suggestion being shown and keeps it in sync with edits.
///
/// As the user types over the start of the suggestion, `interpolate` strips
/// the typed text off the front so the rest can keep being displayed
/// without asking the backend again.  Once the document diverges from the
/// suggestion it is withdrawn.
struct Completion_Tracker {
    using Clock = std::chrono::steady_clock;

    Completion_State state;

    /// Suggestions older than this are withdrawn.
    Clock::duration staleness_bound;
    Clock::time_point (*now)();

    /// Why the last suggestion was withdrawn.
    Withdraw_Reason last_withdraw_reason;

    void init(Clock::duration staleness_bound);
    void drop();

    /// Start tracking `completion` to be inserted at `position`.
    /// Any previous suggestion is discarded.
    void set_completion(cz::Str completion, const Document_Snapshot& snapshot, Position position);

    /// Discard the suggestion.  Does nothing if there isn't one.
    void clear_completion();

    bool has_active_completion() const { return state.active; }

    /// Is there a suggestion for this document that hasn't gone stale?
    bool is_valid_for_document(const Document_Snapshot& snapshot) const;

    /// Does the document conflict with the suggestion?  Always true if there is none.
    bool has_conflict(const Document_Snapshot& snapshot) const;

    /// Get the text that should be displayed at the cursor given the edits
    /// made since the suggestion was installed.  If the suggestion is no longer
    /// valid it is cleared and `false` is returned.
    ///
    /// `out` points into the tracker and is valid until the suggestion is cleared.
    bool interpolate(const Document_Snapshot& snapshot, cz::Str* out);

    /// Interpolate then take the rest of the suggestion, clearing it.
    bool accept_completion(const Document_Snapshot& snapshot,
                           cz::Allocator allocator,
                           cz::String* out);

    /// Take the next word or line of the suggestion.  The suggestion stays
    /// active; once the host inserts `out` the next `interpolate` strips it.
    /// If `out` is the entire rest of the suggestion then it is cleared.
    bool accept_next_word(const Document_Snapshot& snapshot,
                          cz::Allocator allocator,
                          cz::String* out);
    bool accept_next_line(const Document_Snapshot& snapshot,
                          cz::Allocator allocator,
                          cz::String* out);

    Withdraw_Reason find_conflict(const Document_Snapshot& snapshot) const;
    Withdraw_Reason validate(const Document_Snapshot& snapshot) const;
    void withdraw(Withdraw_Reason reason);
};

}
