#include "config.hpp"

#include "basic/completion_session.hpp"

namespace ghost {
namespace custom {

std::chrono::milliseconds staleness_bound = std::chrono::seconds(5);

size_t completion_cache_capacity = 100;
std::chrono::milliseconds completion_cache_ttl = std::chrono::minutes(1);
std::chrono::milliseconds completion_cache_prune_interval = std::chrono::seconds(30);

void session_created_callback(Completion_Session* session) {
    session->init(staleness_bound, completion_cache_capacity, completion_cache_ttl,
                  completion_cache_prune_interval);
}

}
}
