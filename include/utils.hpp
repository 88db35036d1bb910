#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace gateway_failover {
namespace util {

inline std::string tolower(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'A' && c <= 'Z')
            c += 32;
    return s;
}

inline std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
        sv.remove_suffix(1);
    return sv;
}

/**
 * Generate jitter for backoff delays.
 * Returns a uniformly distributed value in [0, max) milliseconds, 0 if max is 0.
 */
inline uint64_t jitter_generator(uint64_t max) {
    if (max == 0) return 0;

    thread_local std::mt19937_64 rg{
        [] {
            std::random_device rd;
            std::seed_seq seq{
                rd(), rd(), rd(), rd(),
                static_cast<unsigned>(
                    std::hash<std::thread::id>{}(std::this_thread::get_id()))
            };
            return std::mt19937_64(seq);
        }()
    };

    std::uniform_int_distribution<uint64_t> dist(0, max - 1);
    return dist(rg);
}

// Seconds since epoch
inline double current_time() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline int64_t unix_timestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * Find a header value in raw "Name: value" lines, matching the name case-insensitively.
 */
inline std::optional<std::string> find_header(const std::vector<std::string>& headers, std::string_view name) {
    const std::string wanted = tolower(name);
    for (const auto& line : headers) {
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        if (tolower(trim(std::string_view(line).substr(0, colon))) == wanted)
            return std::string(trim(std::string_view(line).substr(colon + 1)));
    }
    return std::nullopt;
}

} // namespace util
} // namespace gateway_failover
