#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace httpconf::codecs {

// Raw MD5 digest of the UTF-8 bytes of `data`.
std::array<uint8_t, 16> md5(std::string_view data);

// Lowercase hexadecimal MD5 digest (32 characters).
std::string md5_hex(std::string_view data);

// Lowercase hexadecimal encoding.
std::string to_hex(const uint8_t* data, size_t len);

template<size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

} // namespace httpconf::codecs
