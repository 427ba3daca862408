#include "fingerprint.hpp"

namespace ghost {

uint64_t hash_str(cz::Str str, uint64_t hash) {
    for (size_t i = 0; i < str.len; ++i) {
        hash ^= (uint8_t)str[i];
        hash *= 0x100000001b3;
    }
    return hash;
}

uint64_t completion_fingerprint(cz::Str prefix, cz::Str suffix, cz::Str language) {
    // Mix in the lengths so moving text between the
    // fields can't produce the same fingerprint.
    uint64_t lengths[3] = {prefix.len, suffix.len, language.len};
    uint64_t hash = hash_str({(const char*)lengths, sizeof(lengths)});
    hash = hash_str(language, hash);
    hash = hash_str(prefix, hash);
    hash = hash_str(suffix, hash);
    return hash;
}

}
