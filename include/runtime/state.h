#pragma once

#include <atomic>
#include <cstdint>

namespace fakehub {

extern std::atomic<bool> g_running_flag;
extern std::atomic<uint64_t> g_total_requests;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }

inline uint64_t total_request_count() { return g_total_requests.load(); }
inline void count_request() { g_total_requests.fetch_add(1); }

}  // namespace fakehub
