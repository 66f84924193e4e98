#ifndef BASE64_HPP
#define BASE64_HPP

#include <string>

namespace GeoProfile {

/// Standard base64 alphabet with '=' padding (RFC 4648), via mbedtls
std::string encodeBase64(const std::string& bytes);

/// Inverse of encodeBase64; throws std::invalid_argument on malformed input
std::string decodeBase64(const std::string& text);

} // namespace GeoProfile

#endif // BASE64_HPP
