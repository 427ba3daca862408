#pragma once

#include <stdint.h>
#include <chrono>
#include <cz/string.hpp>
#include "core/bounded_cache.hpp"
#include "core/completion_state.hpp"

namespace ghost {

/// Glue between whoever fetches completions and the core.  Remembers
/// recent completions by fingerprint and tracks the one being displayed.
struct Completion_Session {
    using Clock = std::chrono::steady_clock;

    /// Values are owned by the cache.
    Bounded_Cache<uint64_t, cz::String> cache;
    Completion_Tracker tracker;

    Clock::duration prune_interval;
    Clock::time_point last_prune;

    void init(Clock::duration staleness_bound,
              size_t cache_capacity,
              Clock::duration cache_ttl,
              Clock::duration prune_interval);
    void drop();

    /// Use a different clock for the cache, the tracker, and pruning.
    void set_clock(Clock::time_point (*now)());

    /// If a completion was recently offered for `fingerprint` then start displaying it.
    bool lookup(uint64_t fingerprint, const Document_Snapshot& snapshot);

    /// Remember `completion` for `fingerprint` and start displaying it at the cursor.
    void offer(uint64_t fingerprint, cz::Str completion, const Document_Snapshot& snapshot);

    /// Called after every edit or cursor movement.  Gets the text to display at the cursor.
    bool on_edit(const Document_Snapshot& snapshot, cz::Str* out);

    void dismiss();

    bool accept(const Document_Snapshot& snapshot, cz::Allocator allocator, cz::String* out);
    bool accept_word(const Document_Snapshot& snapshot, cz::Allocator allocator, cz::String* out);
    bool accept_line(const Document_Snapshot& snapshot, cz::Allocator allocator, cz::String* out);

    /// Prune the cache if `prune_interval` has passed since it was last pruned.
    size_t maybe_prune();
};

}
