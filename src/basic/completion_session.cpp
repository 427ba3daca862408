#include "completion_session.hpp"

#include <cz/defer.hpp>
#include <cz/format.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>

namespace ghost {

static void drop_cached_completion(cz::String* completion) {
    completion->drop(cz::heap_allocator());
}

void Completion_Session::init(Clock::duration staleness_bound,
                              size_t cache_capacity,
                              Clock::duration cache_ttl,
                              Clock::duration prune_interval) {
    cache.init(cache_capacity, cache_ttl);
    cache.cleanup = drop_cached_completion;
    tracker.init(staleness_bound);

    this->prune_interval = prune_interval;
    last_prune = cache.now();
}

void Completion_Session::drop() {
    tracker.drop();
    cache.drop();
}

void Completion_Session::set_clock(Clock::time_point (*now)()) {
    cache.now = now;
    tracker.now = now;
    last_prune = now();
}

bool Completion_Session::lookup(uint64_t fingerprint, const Document_Snapshot& snapshot) {
    ZoneScoped;

    cz::String completion = {};
    if (!cache.get(fingerprint, &completion)) {
        return false;
    }

    TracyMessageL("Completion_Session: cache hit");
    tracker.set_completion(completion.as_str(), snapshot, snapshot.cursor);
    return true;
}

void Completion_Session::offer(uint64_t fingerprint,
                               cz::Str completion,
                               const Document_Snapshot& snapshot) {
    ZoneScoped;

    cache.set(fingerprint, completion.clone(cz::heap_allocator()));
    tracker.set_completion(completion, snapshot, snapshot.cursor);
}

bool Completion_Session::on_edit(const Document_Snapshot& snapshot, cz::Str* out) {
    ZoneScoped;
    return tracker.interpolate(snapshot, out);
}

void Completion_Session::dismiss() {
    if (tracker.has_active_completion()) {
        tracker.withdraw(Withdraw_Reason::DISMISSED);
    }
}

bool Completion_Session::accept(const Document_Snapshot& snapshot,
                                cz::Allocator allocator,
                                cz::String* out) {
    return tracker.accept_completion(snapshot, allocator, out);
}

bool Completion_Session::accept_word(const Document_Snapshot& snapshot,
                                     cz::Allocator allocator,
                                     cz::String* out) {
    return tracker.accept_next_word(snapshot, allocator, out);
}

bool Completion_Session::accept_line(const Document_Snapshot& snapshot,
                                     cz::Allocator allocator,
                                     cz::String* out) {
    return tracker.accept_next_line(snapshot, allocator, out);
}

size_t Completion_Session::maybe_prune() {
    Clock::time_point now = cache.now();
    if (now - last_prune < prune_interval) {
        return 0;
    }

    last_prune = now;
    size_t removed = cache.prune();

#ifdef TRACY_ENABLE
    if (removed > 0) {
        cz::String message = cz::format("Completion_Session: pruned ", removed, " completions");
        CZ_DEFER(message.drop(cz::heap_allocator()));
        TracyMessage(message.buffer, message.len);
    }
#endif

    return removed;
}

}
