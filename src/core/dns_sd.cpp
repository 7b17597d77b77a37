/**
 * @file dns_sd.cpp
 * @brief DNS-SD name and TXT record decoding.
 *
 * @copyright Copyright (c) 2024 GateLink Contributors
 * @license MIT License
 */

#include "gatelink/core/dns_sd.hpp"
#include "gatelink/utils/string_utils.hpp"

namespace gatelink {
namespace core {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

void appendUtf8(std::string& out, unsigned int codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

}  // namespace

std::string unescapeLabel(const std::string& escaped) {
    std::string out;
    out.reserve(escaped.size());

    size_t i = 0;
    while (i < escaped.size()) {
        char c = escaped[i];
        if (c != '\\' || i + 1 >= escaped.size()) {
            out.push_back(c);
            ++i;
            continue;
        }

        if (i + 3 < escaped.size() && isDigit(escaped[i + 1]) &&
            isDigit(escaped[i + 2]) && isDigit(escaped[i + 3])) {
            int value = (escaped[i + 1] - '0') * 100 +
                        (escaped[i + 2] - '0') * 10 +
                        (escaped[i + 3] - '0');
            if (value <= 255) {
                out.push_back(static_cast<char>(value));
                i += 4;
                continue;
            }
        }

        if (isDigit(escaped[i + 1])) {
            // Short or out-of-range numeric escape.
            out.push_back(c);
            ++i;
            continue;
        }

        out.push_back(escaped[i + 1]);
        i += 2;
    }
    return out;
}

bool isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra;
        unsigned int codePoint;
        if ((c & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (cc & 0x3F);
        }

        static const unsigned int kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (codePoint < kMinForLength[extra] || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string decodeTxtString(const std::string& raw) {
    if (isValidUtf8(raw)) {
        return raw;
    }

    std::string out;
    out.reserve(raw.size() * 2);
    for (char c : raw) {
        appendUtf8(out, static_cast<unsigned char>(c));
    }
    return out;
}

std::optional<std::string> txtValue(const std::vector<std::string>& segments,
                                    const std::string& key) {
    const std::string prefix = key + "=";
    for (const auto& segment : segments) {
        const std::string decoded = utils::trim(decodeTxtString(segment));
        if (decoded.compare(0, prefix.size(), prefix) == 0) {
            std::string value = utils::trim(decoded.substr(prefix.size()));
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }
    }
    return std::nullopt;
}

std::optional<int> txtInt(const std::vector<std::string>& segments, const std::string& key) {
    auto value = txtValue(segments, key);
    if (!value) {
        return std::nullopt;
    }
    return utils::parseInt(*value);
}

bool txtBool(const std::vector<std::string>& segments, const std::string& key) {
    auto value = txtValue(segments, key);
    if (!value) {
        return false;
    }
    const std::string v = utils::toLower(*value);
    return v == "1" || v == "true" || v == "yes";
}

std::string instanceNameFromFqdn(const std::string& fqdn,
                                 const std::string& serviceType,
                                 const std::string& domain) {
    const std::string lowerFqdn = utils::toLower(fqdn);
    std::string absoluteFqdn = fqdn;
    if (absoluteFqdn.empty() || absoluteFqdn.back() != '.') {
        absoluteFqdn.push_back('.');
    }

    std::string suffix = serviceType;
    if (!domain.empty()) {
        suffix += domain;
        if (suffix.back() != '.') {
            suffix.push_back('.');
        }
    }

    std::string label;
    if (utils::endsWith(utils::toLower(absoluteFqdn), utils::toLower(suffix))) {
        label = absoluteFqdn.substr(0, absoluteFqdn.size() - suffix.size());
    } else {
        size_t pos = lowerFqdn.find(utils::toLower(serviceType));
        label = pos == std::string::npos ? fqdn : fqdn.substr(0, pos);
    }

    if (!label.empty() && label.back() == '.') {
        label.pop_back();
    }
    return utils::collapseWhitespace(unescapeLabel(label));
}

}  // namespace core
}  // namespace gatelink
