#include "httpconf/util/units.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <utility>

namespace httpconf::units {

namespace {

struct UnitEntry {
    std::string_view name;
    double factor;
};

constexpr double kNano = 1.0;
constexpr double kMicro = 1e3;
constexpr double kMilli = 1e6;
constexpr double kSecond = 1e9;
constexpr double kMinute = 60 * kSecond;
constexpr double kHour = 60 * kMinute;
constexpr double kDay = 24 * kHour;

constexpr std::array<UnitEntry, 35> duration_units = {{
    {"ns", kNano}, {"nano", kNano}, {"nanos", kNano}, {"nanosecond", kNano}, {"nanoseconds", kNano},
    {"us", kMicro}, {"micro", kMicro}, {"micros", kMicro}, {"microsecond", kMicro}, {"microseconds", kMicro},
    {"ms", kMilli}, {"milli", kMilli}, {"millis", kMilli}, {"millisecond", kMilli}, {"milliseconds", kMilli},
    {"", kMilli},
    {"s", kSecond}, {"second", kSecond}, {"seconds", kSecond},
    {"m", kMinute}, {"minute", kMinute}, {"minutes", kMinute},
    {"h", kHour}, {"hour", kHour}, {"hours", kHour},
    {"d", kDay}, {"day", kDay}, {"days", kDay},
    {"w", 7 * kDay}, {"week", 7 * kDay}, {"weeks", 7 * kDay},
    {"sec", kSecond}, {"secs", kSecond}, {"min", kMinute}, {"mins", kMinute},
}};

constexpr double kKi = 1024.0;
constexpr double kMi = kKi * 1024.0;
constexpr double kGi = kMi * 1024.0;
constexpr double kTi = kGi * 1024.0;

constexpr std::array<UnitEntry, 41> memory_units = {{
    {"", 1}, {"B", 1}, {"b", 1}, {"byte", 1}, {"bytes", 1},
    {"kB", 1e3}, {"kilobyte", 1e3}, {"kilobytes", 1e3},
    {"K", kKi}, {"k", kKi}, {"Ki", kKi}, {"KiB", kKi}, {"kibibyte", kKi}, {"kibibytes", kKi},
    {"MB", 1e6}, {"megabyte", 1e6}, {"megabytes", 1e6},
    {"M", kMi}, {"m", kMi}, {"Mi", kMi}, {"MiB", kMi}, {"mebibyte", kMi}, {"mebibytes", kMi},
    {"GB", 1e9}, {"gigabyte", 1e9}, {"gigabytes", 1e9},
    {"G", kGi}, {"g", kGi}, {"Gi", kGi}, {"GiB", kGi}, {"gibibyte", kGi}, {"gibibytes", kGi},
    {"TB", 1e12}, {"terabyte", 1e12}, {"terabytes", 1e12},
    {"T", kTi}, {"t", kTi}, {"Ti", kTi}, {"TiB", kTi}, {"tebibyte", kTi}, {"tebibytes", kTi},
}};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Splits "30 seconds" into 30.0 and "seconds".
expected<std::pair<double, std::string_view>, std::string> split_quantity(std::string_view text) {
    auto s = trim(text);
    if (s.empty()) {
        return unexpected(std::string("empty value"));
    }

    size_t i = 0;
    if (s[i] == '-' || s[i] == '+') ++i;
    while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) {
        ++i;
    }

    std::string number(s.substr(0, i));
    if (number.empty() || number == "-" || number == "+") {
        return unexpected("no number in '" + std::string(s) + "'");
    }
    if (number.front() == '+') number.erase(0, 1);

    double value = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc{} || ptr != number.data() + number.size()) {
        return unexpected("invalid number '" + number + "'");
    }

    return std::pair<double, std::string_view>{value, trim(s.substr(i))};
}

template<size_t N>
const UnitEntry* find_unit(const std::array<UnitEntry, N>& table, std::string_view name) {
    for (const auto& entry : table) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

} // anonymous namespace

expected<std::chrono::nanoseconds, std::string> parse_duration(std::string_view text) {
    auto quantity = split_quantity(text);
    if (!quantity) {
        return unexpected(quantity.error());
    }

    auto [value, unit_name] = *quantity;
    const UnitEntry* unit = find_unit(duration_units, unit_name);
    if (!unit) {
        return unexpected("unknown time unit '" + std::string(unit_name) + "'");
    }

    double nanos = std::round(value * unit->factor);
    if (std::abs(nanos) >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return unexpected("duration out of range '" + std::string(trim(text)) + "'");
    }
    return std::chrono::nanoseconds(static_cast<int64_t>(nanos));
}

expected<MemorySize, std::string> parse_memory_size(std::string_view text) {
    auto quantity = split_quantity(text);
    if (!quantity) {
        return unexpected(quantity.error());
    }

    auto [value, unit_name] = *quantity;
    if (value < 0) {
        return unexpected("memory size must not be negative '" + std::string(trim(text)) + "'");
    }

    const UnitEntry* unit = find_unit(memory_units, unit_name);
    if (!unit) {
        return unexpected("unknown size unit '" + std::string(unit_name) + "'");
    }

    double bytes = std::floor(value * unit->factor);
    if (bytes >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return unexpected("memory size out of range '" + std::string(trim(text)) + "'");
    }
    return MemorySize{static_cast<int64_t>(bytes)};
}

std::string format_duration(std::chrono::nanoseconds d) {
    struct Step {
        int64_t nanos;
        const char* singular;
        const char* plural;
    };
    static constexpr Step steps[] = {
        {86400000000000, "day", "days"},
        {3600000000000, "hour", "hours"},
        {60000000000, "minute", "minutes"},
        {1000000000, "second", "seconds"},
        {1000000, "millisecond", "milliseconds"},
        {1000, "microsecond", "microseconds"},
        {1, "nanosecond", "nanoseconds"},
    };

    int64_t count = d.count();
    if (count == 0) {
        return "0 seconds";
    }

    for (const auto& step : steps) {
        if (count % step.nanos == 0) {
            int64_t n = count / step.nanos;
            return std::to_string(n) + " " + (n == 1 || n == -1 ? step.singular : step.plural);
        }
    }
    return std::to_string(count) + " nanoseconds";
}

} // namespace httpconf::units
