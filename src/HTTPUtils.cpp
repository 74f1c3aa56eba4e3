#include "HTTPUtils.hpp"
#include "HeaderMap.hpp"
#include "StringUtils.hpp"

#include <cctype>
#include <cstring>

#include <fmt/format.h>

using namespace utils;

namespace http_utils {
std::string buildRequestHead(const std::string_view method, const std::string_view target,
                             const HeaderMap& headers) {
    std::string head;
    head.reserve(256);
    head.append(method);
    head += ' ';
    head.append(target);
    head += " HTTP/1.1\r\n";
    head += headers.serialize();
    head += "\r\n";
    return head;
}

bool isToken(const std::string_view value) {
    if (value.empty()) {
        return false;
    }
    static const char* separators = "()<>@,;:\\\"/[]?={} \t";
    for (unsigned char c : value) {
        if (c <= 32 || c >= 127 || std::strchr(separators, c) != nullptr) {
            return false;
        }
    }
    return true;
}

bool isValidHeaderValue(const std::string_view value) {
    for (unsigned char c : value) {
        if ((c < 32 && c != '\t') || c == 127) {
            return false;
        }
    }
    return true;
}

std::string headerParam(const std::string_view header_value, const std::string_view param_name) {
    for (const auto& part : split(header_value, ';')) {
        std::string item = trim(part);
        size_t eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (!iequals(trim(item.substr(0, eq)), param_name)) {
            continue;
        }
        std::string value = trim(item.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }
    return "";
}

std::string encodeChunk(const char* data, size_t length) {
    std::string chunk = fmt::format("{:x}\r\n", length);
    chunk.append(data, length);
    chunk += "\r\n";
    return chunk;
}
} // namespace http_utils
