#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace relief::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline bool verbose_enabled() { return current_level >= VerbosityLevel::Verbose; }

namespace detail {

// Rebuild workers log too; one line must not interleave with another.
inline std::mutex stream_mutex;

template <typename... Args>
void write_line(std::ostream& stream, const char* prefix, Args&&... args) {
    std::lock_guard<std::mutex> lock(stream_mutex);
    stream << prefix;
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

} // namespace detail

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    const char* prefix = min_level == VerbosityLevel::Debug ? "[DEBUG] " : "[INFO] ";
    detail::write_line(std::cerr, prefix, std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    detail::write_line(std::cerr, "[WARN] ", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    detail::write_line(std::cerr, "[ERROR] ", std::forward<Args>(args)...);
}

namespace detail {

// Keys already reported by LOGW_ONCE.
inline std::mutex once_mutex;
inline std::unordered_set<uint64_t> once_keys;

inline bool should_log_once(uint64_t key) {
    std::lock_guard<std::mutex> lock(once_mutex);
    return once_keys.insert(key).second;
}

inline std::mutex rate_mutex;
inline std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> rate_timestamps;

inline bool should_log_rate(uint64_t key, uint32_t ms) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(rate_mutex);
    auto it = rate_timestamps.find(key);
    if (it == rate_timestamps.end() ||
        std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second).count() >= ms) {
        rate_timestamps[key] = now;
        return true;
    }
    return false;
}

// FNV-1a
constexpr uint64_t fnv1a_hash(const char* str) {
    uint64_t hash = 14695981039346656037ull;
    for (size_t i = 0; str[i] != '\0'; ++i) {
        hash ^= static_cast<uint64_t>(str[i]);
        hash *= 1099511628211ull;
    }
    return hash;
}

constexpr uint64_t make_location_key(const char* file, int line) {
    uint64_t hash = fnv1a_hash(file);
    hash ^= static_cast<uint64_t>(line);
    hash *= 1099511628211ull;
    return hash;
}

} // namespace detail

} // namespace relief::log

#define LOGI(...) ::relief::log::info(__VA_ARGS__)
#define LOGW(...) ::relief::log::warn(__VA_ARGS__)
#define LOGE(...) ::relief::log::error(__VA_ARGS__)

#define LOGW_ONCE(key, ...) \
    do { \
        if (::relief::log::detail::should_log_once(key)) { \
            ::relief::log::warn(__VA_ARGS__); \
        } \
    } while (false)

#if RELIEF_DEBUG
    #define LOGD(...) ::relief::log::debug(__VA_ARGS__)

    #define LOGD_RATE_LIMIT(ms, ...) \
        do { \
            constexpr uint64_t _loc_key = ::relief::log::detail::make_location_key(__FILE__, __LINE__); \
            if (::relief::log::detail::should_log_rate(_loc_key, ms)) { \
                ::relief::log::debug(__VA_ARGS__); \
            } \
        } while (false)
#else
    #define LOGD(...) do {} while(false)
    #define LOGD_RATE_LIMIT(ms, ...) do {} while(false)
#endif
