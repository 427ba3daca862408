#pragma once

#include <stddef.h>
#include <stdint.h>
#include <cz/str.hpp>

namespace ghost {

/// 64 bit FNV-1a.  Continue a running hash by passing it as `hash`.
uint64_t hash_str(cz::Str str, uint64_t hash = 0xcbf29ce484222325);

/// Build a cache key identifying a completion request.
uint64_t completion_fingerprint(cz::Str prefix, cz::Str suffix, cz::Str language);

/// Hash functor so `cz::Str` can be used as a `Bounded_Cache` key.
struct Str_Hash {
    size_t operator()(cz::Str str) const { return hash_str(str); }
};

}
