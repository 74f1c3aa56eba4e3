#include "QueryString.hpp"
#include "StringUtils.hpp"

#include <fmt/format.h>

#include <cctype>
#include <vector>

namespace query_string {

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
           c == '~' || c == '*' || c == '\'' || c == '(' || c == ')';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Scalars serialize as their text form, containers and null as ""
std::string primitiveText(const Json::Value& value) {
    switch (value.type()) {
        case Json::stringValue:
            return value.asString();
        case Json::booleanValue:
            return value.asBool() ? "true" : "false";
        case Json::intValue:
            return std::to_string(value.asLargestInt());
        case Json::uintValue:
            return std::to_string(value.asLargestUInt());
        case Json::realValue:
            return fmt::format("{}", value.asDouble());
        default:
            return "";
    }
}

void appendPair(std::string& out, const std::string& key, const std::string& value) {
    if (!out.empty()) {
        out += '&';
    }
    out += key;
    out += '=';
    out += escape(value);
}

void stringifyInto(std::string& out, const std::string& prefix, const Json::Value& value) {
    if (value.isObject()) {
        for (const auto& name : value.getMemberNames()) {
            stringifyInto(out, prefix + "[" + name + "]", value[name]);
        }
    } else if (value.isArray()) {
        for (Json::ArrayIndex i = 0; i < value.size(); i++) {
            stringifyInto(out, prefix + "[" + std::to_string(i) + "]", value[i]);
        }
    } else {
        appendPair(out, escape(prefix), primitiveText(value));
    }
}

// Turn objects whose keys are exactly "0".."n-1" into arrays
Json::Value normalizeArrays(const Json::Value& value) {
    if (!value.isObject()) {
        return value;
    }

    Json::Value result(Json::objectValue);
    for (const auto& name : value.getMemberNames()) {
        result[name] = normalizeArrays(value[name]);
    }

    auto names = result.getMemberNames();
    if (names.empty()) {
        return result;
    }
    for (size_t i = 0; i < names.size(); i++) {
        if (!result.isMember(std::to_string(i))) {
            return result;
        }
    }

    Json::Value array(Json::arrayValue);
    for (size_t i = 0; i < names.size(); i++) {
        array.append(result[std::to_string(i)]);
    }
    return array;
}

std::vector<std::string> keySegments(const std::string& key) {
    std::vector<std::string> segments;
    size_t open = key.find('[');
    if (open == std::string::npos || open == 0) {
        segments.push_back(key);
        return segments;
    }

    segments.push_back(key.substr(0, open));
    size_t pos = open;
    while (pos < key.size() && key[pos] == '[') {
        size_t close = key.find(']', pos);
        if (close == std::string::npos) {
            // Unbalanced brackets: keep the remainder as a literal segment
            segments.back() += key.substr(pos);
            break;
        }
        segments.push_back(key.substr(pos + 1, close - pos - 1));
        pos = close + 1;
    }
    return segments;
}

} // namespace

// ============================================================================
// Escaping
// ============================================================================

std::string escape(std::string_view text) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0f]);
        }
    }
    return out;
}

std::string unescape(std::string_view text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

// ============================================================================
// Serialization
// ============================================================================

std::string stringify(const Json::Value& object) {
    std::string out;
    if (!object.isObject()) {
        return out;
    }

    for (const auto& name : object.getMemberNames()) {
        const Json::Value& value = object[name];
        std::string key = escape(name);
        if (value.isArray()) {
            for (const auto& item : value) {
                appendPair(out, key, primitiveText(item));
            }
        } else {
            appendPair(out, key, primitiveText(value));
        }
    }
    return out;
}

std::string stringifyNested(const Json::Value& object) {
    std::string out;
    if (!object.isObject()) {
        return out;
    }

    for (const auto& name : object.getMemberNames()) {
        stringifyInto(out, name, object[name]);
    }
    return out;
}

// ============================================================================
// Parsing
// ============================================================================

Json::Value parse(std::string_view text) {
    Json::Value result(Json::objectValue);
    if (text.empty()) {
        return result;
    }

    for (const auto& pair : utils::split(text, '&')) {
        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        std::string key = unescape(pair.substr(0, eq), true);
        std::string value = eq == std::string::npos ? "" : unescape(pair.substr(eq + 1), true);

        if (!result.isMember(key)) {
            result[key] = value;
        } else if (result[key].isArray()) {
            result[key].append(value);
        } else {
            Json::Value array(Json::arrayValue);
            array.append(result[key]);
            array.append(value);
            result[key] = array;
        }
    }
    return result;
}

Json::Value parseNested(std::string_view text) {
    Json::Value result(Json::objectValue);
    if (text.empty()) {
        return result;
    }

    for (const auto& pair : utils::split(text, '&')) {
        if (pair.empty()) {
            continue;
        }
        size_t eq = pair.find('=');
        std::string key = unescape(pair.substr(0, eq), true);
        std::string value = eq == std::string::npos ? "" : unescape(pair.substr(eq + 1), true);

        Json::Value* node = &result;
        auto segments = keySegments(key);
        for (size_t i = 0; i < segments.size(); i++) {
            std::string segment = segments[i];
            if (!node->isObject()) {
                *node = Json::Value(Json::objectValue);
            }
            if (segment.empty()) {
                // "a[]=x" appends at the next free index
                segment = std::to_string(node->size());
            }
            if (i + 1 == segments.size()) {
                (*node)[segment] = value;
            } else {
                node = &(*node)[segment];
            }
        }
    }
    return normalizeArrays(result);
}

std::string appendQuery(const std::string& query, const std::string& addition) {
    if (addition.empty()) {
        return query;
    }
    if (query.empty()) {
        return addition;
    }
    if (query.back() == '&') {
        return query + addition;
    }
    return query + "&" + addition;
}

} // namespace query_string
