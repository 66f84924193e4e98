#include "Base64.hpp"
#include <mbedtls/base64.h>
#include <stdexcept>
#include <vector>

namespace GeoProfile {

std::string encodeBase64(const std::string& bytes) {
    // Four output characters per started triple, plus the terminating NUL
    std::vector<unsigned char> buf(4 * ((bytes.size() + 2) / 3) + 1);
    size_t written = 0;

    int ret = mbedtls_base64_encode(buf.data(), buf.size(), &written,
                                    reinterpret_cast<const unsigned char*>(bytes.data()),
                                    bytes.size());
    if (ret != 0) {
        throw std::runtime_error("Base64 encoding failed (mbedtls error " +
                                 std::to_string(ret) + ")");
    }
    return std::string(reinterpret_cast<const char*>(buf.data()), written);
}

std::string decodeBase64(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("Base64 length must be a multiple of 4");
    }

    std::vector<unsigned char> buf(3 * text.size() / 4 + 1);
    size_t written = 0;

    int ret = mbedtls_base64_decode(buf.data(), buf.size(), &written,
                                    reinterpret_cast<const unsigned char*>(text.data()),
                                    text.size());
    if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
        throw std::invalid_argument("Invalid base64 character or padding");
    }
    if (ret != 0) {
        throw std::invalid_argument("Base64 decoding failed (mbedtls error " +
                                    std::to_string(ret) + ")");
    }
    return std::string(reinterpret_cast<const char*>(buf.data()), written);
}

} // namespace GeoProfile
