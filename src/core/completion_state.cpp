#include "completion_state.hpp"

#include <string.h>
#include <cz/assert.hpp>
#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <cz/heap.hpp>
#include <cz/util.hpp>
#include <tracy/Tracy.hpp>
#include "core/partial_accept.hpp"

namespace ghost {

namespace Withdraw_Reason_ {
extern const char* const names[/*Withdraw_Reason::length*/] = {
#define X(name) #name,
    GHOST_WITHDRAW_REASONS(X)
#undef X
};
}

void Completion_Tracker::init(Clock::duration staleness_bound) {
    this->staleness_bound = staleness_bound;
    now = &Clock::now;
}

void Completion_Tracker::drop() {
    clear_completion();
}

void Completion_Tracker::set_completion(cz::Str completion,
                                        const Document_Snapshot& snapshot,
                                        Position position) {
    ZoneScoped;
    CZ_ASSERT(completion.buffer || completion.len == 0);
    CZ_ASSERT(snapshot.text.buffer || snapshot.text.len == 0);

    // The arguments may point into the suggestion being replaced
    // (ie `interpolate`'s output) so copy them before withdrawing it.
    cz::String completion_copy = completion.clone(cz::heap_allocator());
    cz::String text_copy = snapshot.text.clone(cz::heap_allocator());
    cz::String identity_copy = snapshot.identity.clone(cz::heap_allocator());

    if (state.active) {
        withdraw(Withdraw_Reason::REPLACED);
    }

    state.completion = completion_copy;
    state.base_document_text = text_copy;
    state.document_identity = identity_copy;
    state.anchor = position;
    state.active_range = completion_range(position, state.completion.as_str());
    state.created_at = now();
    state.active = true;

#ifdef TRACY_ENABLE
    {
        cz::String message = cz::format("set_completion: ", state.completion.len, " chars at ",
                                        position.line, ":", position.column);
        CZ_DEFER(message.drop(cz::heap_allocator()));
        TracyMessage(message.buffer, message.len);
    }
#endif
}

void Completion_Tracker::clear_completion() {
    if (!state.active) {
        return;
    }

    state.completion.drop(cz::heap_allocator());
    state.base_document_text.drop(cz::heap_allocator());
    state.document_identity.drop(cz::heap_allocator());
    state = {};
}

void Completion_Tracker::withdraw(Withdraw_Reason reason) {
    last_withdraw_reason = reason;
    TracyMessage(Withdraw_Reason_::names[reason], strlen(Withdraw_Reason_::names[reason]));
    clear_completion();
}

Withdraw_Reason Completion_Tracker::find_conflict(const Document_Snapshot& snapshot) const {
    CZ_ASSERT(snapshot.text.buffer || snapshot.text.len == 0);

    if (!state.active) {
        return Withdraw_Reason::EMPTY;
    }

    if (!state.active_range.contains(snapshot.cursor)) {
        return Withdraw_Reason::CURSOR_LEFT_RANGE;
    }

    uint64_t start = offset_from_position(snapshot.text, state.anchor.line, state.anchor.column);
    uint64_t cursor =
        offset_from_position(snapshot.text, snapshot.cursor.line, snapshot.cursor.column);
    if (cursor < start) {
        return Withdraw_Reason::CURSOR_LEFT_RANGE;
    }

    cz::Str typed = snapshot.text.slice(start, cursor);
    if (!state.completion.as_str().starts_with(typed)) {
        return Withdraw_Reason::TEXT_DIVERGED;
    }

    return Withdraw_Reason::NONE;
}

Withdraw_Reason Completion_Tracker::validate(const Document_Snapshot& snapshot) const {
    if (!state.active) {
        return Withdraw_Reason::EMPTY;
    }

    if (state.document_identity.as_str() != snapshot.identity) {
        return Withdraw_Reason::OTHER_DOCUMENT;
    }

    if (now() - state.created_at > staleness_bound) {
        return Withdraw_Reason::STALE;
    }

    return find_conflict(snapshot);
}

bool Completion_Tracker::is_valid_for_document(const Document_Snapshot& snapshot) const {
    if (!state.active) {
        return false;
    }
    if (state.document_identity.as_str() != snapshot.identity) {
        return false;
    }
    return now() - state.created_at <= staleness_bound;
}

bool Completion_Tracker::has_conflict(const Document_Snapshot& snapshot) const {
    return find_conflict(snapshot) != Withdraw_Reason::NONE;
}

bool Completion_Tracker::interpolate(const Document_Snapshot& snapshot, cz::Str* out) {
    ZoneScoped;

    if (!state.active) {
        return false;
    }

    Withdraw_Reason reason = validate(snapshot);
    if (reason != Withdraw_Reason::NONE) {
        withdraw(reason);
        return false;
    }

    cz::Str completion = state.completion.as_str();

    // Positive if text was inserted before the cursor since the snapshot.
    uint64_t anchor_offset = offset_from_position(state.base_document_text.as_str(),
                                                  state.anchor.line, state.anchor.column);
    uint64_t cursor_offset =
        offset_from_position(snapshot.text, snapshot.cursor.line, snapshot.cursor.column);
    int64_t delta = (int64_t)cursor_offset - (int64_t)anchor_offset;

    cz::Str result = completion;
    if (delta != 0) {
        cz::Str typed;
        if (delta > 0) {
            typed = snapshot.text.slice(cursor_offset - delta, cursor_offset);
        } else {
            uint64_t end = cz::min(cursor_offset + (uint64_t)-delta, (uint64_t)snapshot.text.len);
            typed = snapshot.text.slice(cursor_offset, end);
        }

        result = remaining_completion(typed, completion);
    }

    // The text typed since the anchor followed by the result must spell out the
    // suggestion.  Otherwise the result would be displayed in the wrong place.
    uint64_t start = offset_from_position(snapshot.text, state.anchor.line, state.anchor.column);
    if (cursor_offset - start + result.len != completion.len) {
        withdraw(Withdraw_Reason::TEXT_DIVERGED);
        return false;
    }

    *out = result;
    return true;
}

bool Completion_Tracker::accept_completion(const Document_Snapshot& snapshot,
                                           cz::Allocator allocator,
                                           cz::String* out) {
    ZoneScoped;

    cz::Str rest;
    if (!interpolate(snapshot, &rest)) {
        return false;
    }

    out->reserve(allocator, rest.len);
    out->append(rest);
    withdraw(Withdraw_Reason::ACCEPTED);
    return true;
}

static bool accept_partial(Completion_Tracker* tracker,
                           const Document_Snapshot& snapshot,
                           size_t (*boundary)(cz::Str),
                           cz::Allocator allocator,
                           cz::String* out) {
    cz::Str rest;
    if (!tracker->interpolate(snapshot, &rest)) {
        return false;
    }

    size_t end = boundary(rest);
    out->reserve(allocator, end);
    out->append(rest.slice_end(end));

    if (end == rest.len) {
        tracker->withdraw(Withdraw_Reason::ACCEPTED);
    }
    return true;
}

bool Completion_Tracker::accept_next_word(const Document_Snapshot& snapshot,
                                          cz::Allocator allocator,
                                          cz::String* out) {
    ZoneScoped;
    return accept_partial(this, snapshot, next_word_boundary, allocator, out);
}

bool Completion_Tracker::accept_next_line(const Document_Snapshot& snapshot,
                                          cz::Allocator allocator,
                                          cz::String* out) {
    ZoneScoped;
    return accept_partial(this, snapshot, next_line_boundary, allocator, out);
}

}
