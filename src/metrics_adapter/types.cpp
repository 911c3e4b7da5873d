#include "metrics_adapter/types.hpp"

#include <arpa/inet.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace metrics_adapter {

namespace {
struct DurationUnit final {
    std::string_view suffix;
    std::int64_t milliseconds;
};

// Longest suffixes first so "ms" wins over "m".
constexpr std::array<DurationUnit, 4> k_duration_units{{
    {"ms", 1},
    {"s", 1'000},
    {"m", 60'000},
    {"h", 3'600'000},
}};

constexpr std::int64_t k_max_duration_ms{std::numeric_limits<std::int64_t>::max()};
}  // namespace

Duration parse_duration(std::string_view raw) {
    if (raw == "0") {
        return Duration{0};
    }
    if (raw.empty()) {
        throw std::invalid_argument("empty duration");
    }

    bool negative = false;
    std::string_view rest = raw;
    if (rest.front() == '-' || rest.front() == '+') {
        negative = rest.front() == '-';
        rest.remove_prefix(1);
    }
    if (rest.empty()) {
        throw std::invalid_argument("invalid duration \"" + std::string{raw} + "\"");
    }

    std::int64_t total_ms = 0;
    while (!rest.empty()) {
        std::size_t digits = 0;
        while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits])) != 0) {
            ++digits;
        }
        if (digits == 0) {
            throw std::invalid_argument("invalid duration \"" + std::string{raw} + "\"");
        }
        std::int64_t amount = 0;
        try {
            amount = std::stoll(std::string{rest.substr(0, digits)});
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("invalid duration \"" + std::string{raw} + "\"");
        }
        rest.remove_prefix(digits);

        const DurationUnit* matched_unit = nullptr;
        for (const DurationUnit& unit : k_duration_units) {
            if (rest.substr(0, unit.suffix.size()) == unit.suffix) {
                matched_unit = &unit;
                break;
            }
        }
        if (matched_unit == nullptr) {
            throw std::invalid_argument("missing unit in duration \"" + std::string{raw} + "\"");
        }
        rest.remove_prefix(matched_unit->suffix.size());
        if (amount > k_max_duration_ms / matched_unit->milliseconds
            || total_ms > k_max_duration_ms - amount * matched_unit->milliseconds) {
            throw std::invalid_argument("invalid duration \"" + std::string{raw} + "\"");
        }
        total_ms += amount * matched_unit->milliseconds;
    }

    return Duration{negative ? -total_ms : total_ms};
}

std::string format_duration(Duration duration) {
    std::int64_t remaining = duration.count();
    if (remaining == 0) {
        return "0s";
    }
    std::string text;
    if (remaining < 0) {
        text.push_back('-');
        remaining = -remaining;
    }
    if (remaining % 1'000 != 0) {
        return text + std::to_string(remaining) + "ms";
    }
    remaining /= 1'000;
    const std::int64_t hours = remaining / 3'600;
    const std::int64_t minutes = (remaining % 3'600) / 60;
    const std::int64_t seconds = remaining % 60;
    if (hours > 0) {
        text += std::to_string(hours) + "h";
    }
    if (minutes > 0) {
        text += std::to_string(minutes) + "m";
    }
    if (seconds > 0) {
        text += std::to_string(seconds) + "s";
    }
    return text;
}

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= raw.size()) {
        const std::size_t comma = raw.find(',', start);
        const std::size_t end = comma == std::string_view::npos ? raw.size() : comma;
        if (end > start) {
            items.emplace_back(raw.substr(start, end - start));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

std::string join_list(const std::vector<std::string>& items) {
    std::string joined;
    for (const std::string& item : items) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined += item;
    }
    return joined;
}

std::string escape_json(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());
    for (const char character : raw) {
        switch (character) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(character) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned char>(character));
                } else {
                    escaped.push_back(character);
                }
        }
    }
    return escaped;
}

std::optional<IpAddress> parse_ip(std::string_view raw) {
    const std::string text{raw};
    std::array<char, INET6_ADDRSTRLEN> buffer{};

    in_addr address_v4{};
    if (inet_pton(AF_INET, text.c_str(), &address_v4) == 1) {
        inet_ntop(AF_INET, &address_v4, buffer.data(), buffer.size());
        return IpAddress{buffer.data(), IpFamily::V4, address_v4.s_addr == INADDR_ANY};
    }

    in6_addr address_v6{};
    if (inet_pton(AF_INET6, text.c_str(), &address_v6) == 1) {
        inet_ntop(AF_INET6, &address_v6, buffer.data(), buffer.size());
        const bool unspecified = IN6_IS_ADDR_UNSPECIFIED(&address_v6);
        return IpAddress{buffer.data(), IpFamily::V6, unspecified};
    }

    return std::nullopt;
}

}  // namespace metrics_adapter
