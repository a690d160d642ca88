// File: common/utilities/base64.cpp

#include "common/utilities/base64.hpp"

namespace common::utilities {

    std::string base64Encode(const std::vector<std::uint8_t> &data) {
        static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::string encoded;
        encoded.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 2 < data.size(); i += 3) {
            const std::uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
            encoded.push_back(alphabet[(triple >> 18) & 0x3F]);
            encoded.push_back(alphabet[(triple >> 12) & 0x3F]);
            encoded.push_back(alphabet[(triple >> 6) & 0x3F]);
            encoded.push_back(alphabet[triple & 0x3F]);
        }

        if (const std::size_t remaining = data.size() - i; remaining > 0) {
            std::uint32_t triple = data[i] << 16;
            if (remaining == 2) {
                triple |= data[i + 1] << 8;
            }
            encoded.push_back(alphabet[(triple >> 18) & 0x3F]);
            encoded.push_back(alphabet[(triple >> 12) & 0x3F]);
            encoded.push_back(remaining == 2 ? alphabet[(triple >> 6) & 0x3F] : '=');
            encoded.push_back('=');
        }

        return encoded;
    }

    std::string toDataUri(const std::vector<std::uint8_t> &data, const std::string_view mime_type) {
        std::string uri = "data:";
        uri.append(mime_type);
        uri.append(";base64,");
        uri.append(base64Encode(data));
        return uri;
    }

} // namespace common::utilities
