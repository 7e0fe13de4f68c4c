#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "httpconf/util/expected.hpp"

namespace httpconf {

// Byte count read from a memory-size setting ("100k", "10MB", 1024).
struct MemorySize {
    int64_t bytes = 0;

    constexpr int64_t to_bytes() const noexcept { return bytes; }
    bool operator==(const MemorySize&) const = default;
};

namespace units {

// Parse "30 seconds", "5m", "100ms", "1.5h". A bare number is milliseconds.
// Errors are a human-readable reason; callers attach the key.
expected<std::chrono::nanoseconds, std::string> parse_duration(std::string_view text);

// Parse "100k", "10 MiB", "1GB", "512". A bare number is bytes.
// Binary units (k, K, Ki, KiB, kibibytes) are powers of 1024;
// SI units (kB, kilobytes) are powers of 1000.
expected<MemorySize, std::string> parse_memory_size(std::string_view text);

// "30 seconds" style rendering used when printing a resolved configuration.
std::string format_duration(std::chrono::nanoseconds d);

} // namespace units

} // namespace httpconf
