#pragma once

#include <stddef.h>
#include <chrono>

namespace ghost {

struct Completion_Session;

namespace custom {

/// Called when a session is created.  The main purpose of this function is
/// to initialize the session with the limits below however you may want to
/// do more complicated tasks (such as swapping in a different clock).
void session_created_callback(Completion_Session* session);

/// Suggestions older than this are withdrawn instead of being interpolated.
extern std::chrono::milliseconds staleness_bound;

/// Maximum number of completions remembered by fingerprint.
extern size_t completion_cache_capacity;
/// How long a remembered completion can be reused.
extern std::chrono::milliseconds completion_cache_ttl;
/// Minimum time between sweeps for expired completions.
extern std::chrono::milliseconds completion_cache_prune_interval;

}
}
