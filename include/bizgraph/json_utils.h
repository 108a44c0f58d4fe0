#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/json_utils.h - JSON serialization helpers
// ═══════════════════════════════════════════════════════════════════
//  nlohmann/json + C++20 concepts. Adds the BIZGRAPH_SERIALIZE macros
//  and ISO-8601 conversion for system_clock timestamps.
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <concepts>
#include <cstdio>
#include <ctime>
#include <string>
#include <type_traits>

namespace bizgraph {

using Timestamp = std::chrono::system_clock::time_point;

// ─────────────────────────────────────────────
//  Macro: BIZGRAPH_SERIALIZE
//  Every listed member is required when parsing.
//
//    struct Point { int x; int y; BIZGRAPH_SERIALIZE(Point, x, y) };
// ─────────────────────────────────────────────
#define BIZGRAPH_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Macro: BIZGRAPH_SERIALIZE_DEFAULTS
//  Missing members keep their default-initialized value.
//  Used by the option structs loaded from config files.
// ─────────────────────────────────────────────
#define BIZGRAPH_SERIALIZE_DEFAULTS(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Type, __VA_ARGS__)

template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

template <JsonSerializable T>
inline nlohmann::json toJson(const T& value) {
    return nlohmann::json(value);
}

template <typename T>
inline T fromJson(const nlohmann::json& j) {
    return j.get<T>();
}

// ─────────────────────────────────────────────
//  Timestamps: "YYYY-MM-DDTHH:MM:SSZ" (UTC, second precision)
// ─────────────────────────────────────────────
inline std::string formatTimestamp(Timestamp tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

inline Timestamp parseTimestamp(const std::string& text) {
    std::tm tm{};
    int consumed = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
    if (n != 6) {
        throw invalidArgument("Invalid timestamp: '" + text + "'");
    }
    // Fractional seconds are accepted and dropped.
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
    }
    if (pos != text.size() && !(pos + 1 == text.size() && text[pos] == 'Z')) {
        throw invalidArgument("Timestamp must be UTC ('Z' suffix): '" + text + "'");
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// Milliseconds since the Unix epoch, used for cache time buckets.
inline long long epochMillis(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

} // namespace bizgraph

// Timestamps travel as ISO-8601 strings wherever they are serialized.
namespace nlohmann {
template <>
struct adl_serializer<bizgraph::Timestamp> {
    static void to_json(json& j, const bizgraph::Timestamp& tp) {
        j = bizgraph::formatTimestamp(tp);
    }
    static void from_json(const json& j, bizgraph::Timestamp& tp) {
        tp = bizgraph::parseTimestamp(j.get<std::string>());
    }
};
} // namespace nlohmann
