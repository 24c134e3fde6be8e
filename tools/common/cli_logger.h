#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace contourfield::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

template <typename... Args>
void write_line(std::ostream& stream, const char* tag, Args&&... args) {
    if (tag) stream << '[' << tag << "] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void info(Args&&... args) {
    if (current_level < VerbosityLevel::Verbose) return;
    write_line(std::cerr, level_name(VerbosityLevel::Verbose), std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    if (current_level < VerbosityLevel::Debug) return;
    write_line(std::cerr, level_name(VerbosityLevel::Debug), std::forward<Args>(args)...);
}

// Warnings and errors ignore the verbosity level.
template <typename... Args>
void warn(Args&&... args) {
    write_line(std::cerr, "WARN", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    write_line(std::cerr, "ERROR", std::forward<Args>(args)...);
}

// Print writes a result line to stdout, untagged.
template <typename... Args>
void print(Args&&... args) {
    write_line(std::cout, nullptr, std::forward<Args>(args)...);
}

namespace detail {

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

} // namespace contourfield::log

#define LOGI(...) ::contourfield::log::info(__VA_ARGS__)
#define LOGW(...) ::contourfield::log::warn(__VA_ARGS__)
#define LOGE(...) ::contourfield::log::error(__VA_ARGS__)

#if CONTOURFIELD_DEBUG
    #define LOGD(...) ::contourfield::log::debug(__VA_ARGS__)

    #define LOGD_RATE_LIMIT(ms, ...) \
        do { \
            constexpr uint64_t _loc_key = ::contourfield::log::detail::make_location_key(__FILE__, __LINE__); \
            if (::contourfield::log::detail::should_log_rate(_loc_key, ms)) { \
                ::contourfield::log::debug(__VA_ARGS__); \
            } \
        } while (false)
#else
    #define LOGD(...) do {} while(false)
    #define LOGD_RATE_LIMIT(ms, ...) do {} while(false)
#endif

namespace contourfield::cli {
    using namespace contourfield::log;
}
