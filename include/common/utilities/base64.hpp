// File: common/utilities/base64.hpp

#ifndef COMMON_UTILITIES_BASE64_HPP
#define COMMON_UTILITIES_BASE64_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace common::utilities {

    // Standard alphabet (RFC 4648), padded.
    [[nodiscard]] std::string base64Encode(const std::vector<std::uint8_t> &data);

    // "data:<mime>;base64,<payload>"
    [[nodiscard]] std::string toDataUri(const std::vector<std::uint8_t> &data, std::string_view mime_type);

} // namespace common::utilities

#endif // COMMON_UTILITIES_BASE64_HPP
