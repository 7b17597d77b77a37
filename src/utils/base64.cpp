/**
 * @file base64.cpp
 * @brief Base64 codec implementation.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/utils/base64.hpp"

namespace gatelink {
namespace utils {

namespace {

constexpr char kStdAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kUrlAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string encodeWith(const char* alphabet, const uint8_t* data, size_t length, bool pad) {
    std::string out;
    out.reserve(((length + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= length) {
        const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8) |
                           static_cast<uint32_t>(data[i + 2]);
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        out.push_back(alphabet[v & 0x3F]);
        i += 3;
    }

    const size_t rem = length - i;
    if (rem == 1) {
        const uint32_t v = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        if (pad) {
            out.append("==");
        }
    } else if (rem == 2) {
        const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        if (pad) {
            out.push_back('=');
        }
    }
    return out;
}

int decodeChar(char c, bool url) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (!url && c == '+') return 62;
    if (!url && c == '/') return 63;
    if (url && c == '-') return 62;
    if (url && c == '_') return 63;
    return -1;
}

// Decodes an unpadded body; a trailing group of 2 or 3 chars is allowed.
std::optional<std::vector<uint8_t>> decodeBody(const std::string& body, bool url) {
    if (body.size() % 4 == 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve((body.size() / 4) * 3 + 2);

    uint32_t acc = 0;
    int bits = 0;
    for (char c : body) {
        int v = decodeChar(c, url);
        if (v < 0) {
            return std::nullopt;
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }

    // Non-canonical encodings leave set bits in the discarded tail.
    if (bits > 0 && (acc & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return out;
}

}  // namespace

std::string base64Encode(const uint8_t* data, size_t length) {
    return encodeWith(kStdAlphabet, data, length, true);
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}

std::string base64UrlEncode(const uint8_t* data, size_t length) {
    return encodeWith(kUrlAlphabet, data, length, false);
}

std::string base64UrlEncode(const std::vector<uint8_t>& data) {
    return base64UrlEncode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base64Decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    while (padding < 2 && padding < text.size() &&
           text[text.size() - 1 - padding] == '=') {
        ++padding;
    }
    return decodeBody(text.substr(0, text.size() - padding), false);
}

std::optional<std::vector<uint8_t>> base64UrlDecode(const std::string& text) {
    std::string body = text;
    size_t padding = 0;
    while (!body.empty() && body.back() == '=' && padding < 2) {
        body.pop_back();
        ++padding;
    }
    if (padding > 0 && text.size() % 4 != 0) {
        return std::nullopt;
    }
    return decodeBody(body, true);
}

}  // namespace utils
}  // namespace gatelink
