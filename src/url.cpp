#include "mergington/url.hpp"

namespace mergington {
namespace url {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string percent_decode(const std::string& text, bool form) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int high = hex_value(text[i + 1]);
            int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out += static_cast<char>((high << 4) | low);
                i += 2;
                continue;
            }
        }
        out += (form && c == '+') ? ' ' : c;
    }
    return out;
}

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t length;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < low || second > high) {
            return false;
        }
        for (size_t k = 2; k < length; ++k) {
            auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

std::pair<std::string, std::string> split_target(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return {target, ""};
    }
    return {target.substr(0, pos), target.substr(pos + 1)};
}

std::vector<std::string> path_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    for (size_t i = 0; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == '/') {
            if (!segment.empty()) {
                segments.push_back(percent_decode(segment));
                segment.clear();
            }
        } else {
            segment += path[i];
        }
    }
    return segments;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();

        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key = pair.substr(0, eq);
            std::string value = eq == std::string::npos ? "" : pair.substr(eq + 1);
            params[percent_decode(key, true)] = percent_decode(value, true);
        }
        start = end + 1;
    }
    return params;
}

std::optional<std::string> safe_join(const std::string& root, const std::vector<std::string>& segments) {
    std::vector<std::string> parts;
    for (const auto& segment : segments) {
        if (segment == "." || segment.empty()) {
            continue;
        }
        if (segment == "..") {
            if (parts.empty()) {
                return std::nullopt;
            }
            parts.pop_back();
            continue;
        }
        if (segment.find('/') != std::string::npos || segment.find('\0') != std::string::npos) {
            return std::nullopt;
        }
        parts.push_back(segment);
    }

    std::string out = root;
    for (const auto& part : parts) {
        if (out.empty() || out.back() != '/') {
            out += '/';
        }
        out += part;
    }
    return out;
}

} // namespace url
} // namespace mergington
