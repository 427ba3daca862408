#pragma once

#include <stddef.h>
#include <stdint.h>
#include <chrono>
#include <functional>
#include <cz/assert.hpp>
#include <cz/heap_vector.hpp>
#include <tracy/Tracy.hpp>

namespace ghost {

struct Cache_Stats {
    size_t size;
    size_t capacity;
    /// `size / capacity`.
    double utilization;

    uint64_t hits;
    uint64_t misses;
    /// Entries removed to stay under `capacity`.
    uint64_t evictions;
    /// Entries removed because their time to live ran out.
    uint64_t expirations;
};

/// A key value store with a maximum size and a time to live per entry.
///
/// When an insertion would go over `capacity` the least recently used entry
/// (by `get`, `has`, or `set`) is evicted.  Expiration is checked lazily when
/// an entry is read; call `prune` to remove every expired entry eagerly.
///
/// Lookups use an open addressing table keyed by `Hash` and `K::operator==`.
/// Recency is tracked by a doubly linked list threaded through `slots`.
template <class K, class V, class Hash = std::hash<K>>
struct Bounded_Cache {
    using Clock = std::chrono::steady_clock;

    static constexpr size_t NIL = (size_t)-1;

    struct Entry {
        K key;
        V value;
        Clock::time_point created_at;
        Clock::duration ttl;

        size_t older;
        size_t newer;
    };

    cz::Heap_Vector<Entry> slots;
    cz::Heap_Vector<size_t> free_slots;
    /// Indices into `slots`.  The length is a power of two at least twice `capacity`.
    cz::Heap_Vector<size_t> table;

    size_t oldest;
    size_t newest;
    size_t count;

    size_t capacity;
    Clock::duration default_ttl;

    Clock::time_point (*now)();

    /// Called on every value the cache gives up (replaced,
    /// evicted, expired, removed, or cleared).  Optional.
    void (*cleanup)(V* value);

    uint64_t hits;
    uint64_t misses;
    uint64_t evictions;
    uint64_t expirations;

    /// Can be called again to resize the cache.  Existing entries
    /// are forgotten without calling `cleanup`, so `clear` first.
    void init(size_t capacity, Clock::duration default_ttl) {
        CZ_ASSERT(capacity > 0);

        this->capacity = capacity;
        this->default_ttl = default_ttl;
        now = &Clock::now;

        size_t table_len = 4;
        while (table_len < capacity * 2) {
            table_len *= 2;
        }
        table.len = 0;
        table.reserve(table_len);
        for (size_t i = 0; i < table_len; ++i) {
            table.push(NIL);
        }

        slots.len = 0;
        free_slots.len = 0;
        oldest = NIL;
        newest = NIL;
        count = 0;

        hits = 0;
        misses = 0;
        evictions = 0;
        expirations = 0;
    }

    void drop() {
        clear();
        slots.drop();
        free_slots.drop();
        table.drop();
    }

    /// Look up `key`.  If it is present and hasn't expired then it becomes
    /// the most recently used entry and its value is stored in `value`.
    bool get(const K& key, V* value) {
        ZoneScoped;

        Entry* entry = touch(key);
        if (!entry) {
            return false;
        }

        *value = entry->value;
        return true;
    }

    /// Same as `get` but doesn't copy out the value.
    bool has(const K& key) { return touch(key) != nullptr; }

    void set(const K& key, const V& value) { set(key, value, default_ttl); }

    void set(const K& key, const V& value, Clock::duration ttl) {
        ZoneScoped;

        size_t table_index;
        size_t slot = lookup(key, &table_index);
        if (slot != NIL) {
            Entry& entry = slots[slot];
            if (cleanup) {
                cleanup(&entry.value);
            }
            entry.value = value;
            entry.created_at = now();
            entry.ttl = ttl;
            unlink(slot);
            link_newest(slot);
            return;
        }

        if (count >= capacity) {
            while (count >= capacity) {
                TracyMessageL("Bounded_Cache: evict");
                ++evictions;
                remove_slot(oldest);
            }

            // Removing from the table shifts entries so find the insertion point again.
            lookup(key, &table_index);
        }

        if (free_slots.len > 0) {
            slot = free_slots.pop();
        } else {
            slot = slots.len;
            slots.reserve(1);
            slots.push({});
        }

        Entry& entry = slots[slot];
        entry.key = key;
        entry.value = value;
        entry.created_at = now();
        entry.ttl = ttl;

        table[table_index] = slot;
        link_newest(slot);
        ++count;
    }

    /// Remove `key` if it is present.
    bool remove(const K& key) {
        size_t table_index;
        size_t slot = lookup(key, &table_index);
        if (slot == NIL) {
            return false;
        }
        remove_slot(slot);
        return true;
    }

    /// Remove every expired entry.  The order of the remaining entries is unchanged.
    size_t prune() {
        ZoneScoped;

        Clock::time_point time = now();
        size_t removed = 0;
        for (size_t slot = oldest; slot != NIL;) {
            size_t next = slots[slot].newer;
            if (is_expired(slots[slot], time)) {
                ++expirations;
                remove_slot(slot);
                ++removed;
            }
            slot = next;
        }
        return removed;
    }

    void clear() {
        for (size_t slot = oldest; slot != NIL; slot = slots[slot].newer) {
            if (cleanup) {
                cleanup(&slots[slot].value);
            }
        }

        for (size_t i = 0; i < table.len; ++i) {
            table[i] = NIL;
        }
        slots.len = 0;
        free_slots.len = 0;
        oldest = NIL;
        newest = NIL;
        count = 0;
    }

    size_t size() const { return count; }

    /// Get the keys from least to most recently used.
    cz::Heap_Vector<K> keys() const {
        cz::Heap_Vector<K> result = {};
        result.reserve(count);
        for (size_t slot = oldest; slot != NIL; slot = slots[slot].newer) {
            result.push(slots[slot].key);
        }
        return result;
    }

    Cache_Stats get_stats() const {
        Cache_Stats stats;
        stats.size = count;
        stats.capacity = capacity;
        stats.utilization = (double)count / (double)capacity;
        stats.hits = hits;
        stats.misses = misses;
        stats.evictions = evictions;
        stats.expirations = expirations;
        return stats;
    }

private:
    bool is_expired(const Entry& entry, Clock::time_point time) const {
        return time - entry.created_at > entry.ttl;
    }

    Entry* touch(const K& key) {
        size_t table_index;
        size_t slot = lookup(key, &table_index);
        if (slot == NIL) {
            ++misses;
            return nullptr;
        }

        if (is_expired(slots[slot], now())) {
            TracyMessageL("Bounded_Cache: expired");
            ++expirations;
            ++misses;
            remove_slot(slot);
            return nullptr;
        }

        ++hits;
        unlink(slot);
        link_newest(slot);
        return &slots[slot];
    }

    /// Find the slot holding `key`.  `table_index` is set to the
    /// index in `table` where `key` is or should be inserted.
    size_t lookup(const K& key, size_t* table_index) const {
        size_t mask = table.len - 1;
        for (size_t i = Hash{}(key) & mask;; i = (i + 1) & mask) {
            size_t slot = table[i];
            if (slot == NIL || slots[slot].key == key) {
                *table_index = i;
                return slot;
            }
        }
    }

    /// Is `home` in the cyclic interval `(start, end]`?
    static bool cyclic_between(size_t start, size_t home, size_t end) {
        if (start <= end) {
            return start < home && home <= end;
        } else {
            return start < home || home <= end;
        }
    }

    /// Delete `table[hole]` and shift back entries that probed past it.
    void table_remove(size_t hole) {
        size_t mask = table.len - 1;
        for (size_t i = (hole + 1) & mask; table[i] != NIL; i = (i + 1) & mask) {
            size_t home = Hash{}(slots[table[i]].key) & mask;
            if (!cyclic_between(hole, home, i)) {
                table[hole] = table[i];
                hole = i;
            }
        }
        table[hole] = NIL;
    }

    void remove_slot(size_t slot) {
        CZ_DEBUG_ASSERT(slot != NIL);

        size_t table_index;
        size_t found = lookup(slots[slot].key, &table_index);
        CZ_DEBUG_ASSERT(found == slot);
        (void)found;
        table_remove(table_index);

        unlink(slot);
        if (cleanup) {
            cleanup(&slots[slot].value);
        }

        free_slots.reserve(1);
        free_slots.push(slot);
        --count;
    }

    void unlink(size_t slot) {
        Entry& entry = slots[slot];
        if (entry.older != NIL) {
            slots[entry.older].newer = entry.newer;
        } else {
            oldest = entry.newer;
        }
        if (entry.newer != NIL) {
            slots[entry.newer].older = entry.older;
        } else {
            newest = entry.older;
        }
        entry.older = NIL;
        entry.newer = NIL;
    }

    void link_newest(size_t slot) {
        Entry& entry = slots[slot];
        entry.older = newest;
        entry.newer = NIL;
        if (newest != NIL) {
            slots[newest].newer = slot;
        } else {
            oldest = slot;
        }
        newest = slot;
    }
};

}
