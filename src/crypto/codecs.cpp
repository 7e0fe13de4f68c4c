#include "httpconf/crypto/codecs.hpp"

#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/err.h>

namespace httpconf::codecs {

std::array<uint8_t, 16> md5(std::string_view data) {
    std::array<uint8_t, 16> hash{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), hash.data(), &len, EVP_md5(), nullptr) != 1
        || len != hash.size()) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        throw std::runtime_error(std::string("MD5 digest failed: ") + buf);
    }
    return hash;
}

std::string md5_hex(std::string_view data) {
    return to_hex(md5(data));
}

std::string to_hex(const uint8_t* data, size_t len) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace httpconf::codecs
