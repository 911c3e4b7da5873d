// === Core Types ==============================================================
//
// Collects shared type aliases and small value helpers used throughout the
// adapter (durations, comma-separated flag lists, IP literals).

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace metrics_adapter {

/**
 * @brief Alias for configuration durations; millisecond resolution is enough
 *        for every TTL and timeout the adapter exposes.
 */
using Duration = std::chrono::milliseconds;

/**
 * @brief Alias for wall-clock timestamps recorded in audit events.
 */
using SystemTimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Address family of a parsed IP literal.
 */
enum class IpFamily {
    V4, /**< Dotted-quad IPv4 literal. */
    V6  /**< IPv6 literal without brackets. */
};

/**
 * @brief Normalized IP literal plus its family.
 */
struct IpAddress final {
    std::string text{};          /**< Canonical textual form. */
    IpFamily family{IpFamily::V4}; /**< Address family. */
    bool unspecified{};          /**< True for 0.0.0.0 and ::. */
};

/**
 * @brief Parse a Go-style duration such as "10s", "1m30s", "250ms" or "2h".
 *
 * A bare "0" is accepted. Throws std::invalid_argument on malformed input.
 */
Duration parse_duration(std::string_view raw);

/** @brief Render a duration in the same notation parse_duration accepts. */
std::string format_duration(Duration duration);

/** @brief Split a comma-separated flag value, dropping empty items. */
std::vector<std::string> split_list(std::string_view raw);

/** @brief Join list items with commas. */
std::string join_list(const std::vector<std::string>& items);

/**
 * @brief Escape a value for embedding inside a JSON string literal.
 *
 * Quotes, backslashes and control characters are escaped; other bytes pass
 * through unchanged.
 */
std::string escape_json(std::string_view raw);

/** @brief Parse an IPv4/IPv6 literal; std::nullopt when it is not one. */
std::optional<IpAddress> parse_ip(std::string_view raw);

}  // namespace metrics_adapter
