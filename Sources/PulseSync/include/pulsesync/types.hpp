#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <optional>
#include <chrono>
#include <random>

namespace pulsesync {

using json = nlohmann::json;

// Compact serialization that never throws: invalid UTF-8 in strings becomes U+FFFD
inline std::string dump_text(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Milliseconds since Unix epoch (like Date.now())
using millis_t = int64_t;

inline millis_t system_now_ms() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Render an unsigned value in base 36 (digits then lowercase letters)
inline std::string to_base36(uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    }
    return out;
}

// Random base-36 suffix used in temporary ids and queue ids
inline std::string random_suffix(size_t length = 9) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<int> dis(0, 35);

    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(digits[dis(gen)]);
    }
    return out;
}

// Conflict resolution strategy; also recorded on entries as the resolution tag
enum class conflict_strategy {
    local,
    server,
    merge
};

const char* to_string(conflict_strategy strategy);
std::optional<conflict_strategy> conflict_strategy_from_string(const std::string& name);

} // namespace pulsesync

#endif // __cplusplus
