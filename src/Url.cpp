#include "Url.hpp"
#include "QueryString.hpp"
#include "StringUtils.hpp"

#include <cctype>
#include <optional>

using namespace utils;

namespace {

// Generic reference components (RFC 3986 Appendix B)
struct ReferenceParts {
    std::optional<std::string> scheme;
    std::optional<std::string> authority;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;
};

ReferenceParts splitReference(const std::string& text) {
    ReferenceParts parts;
    std::string rest = text;

    // Fragment
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }

    // Query
    size_t question = rest.find('?');
    if (question != std::string::npos) {
        parts.query = rest.substr(question + 1);
        rest.erase(question);
    }

    // Scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    size_t colon = rest.find(':');
    size_t slash = rest.find('/');
    if (colon != std::string::npos && colon > 0 && (slash == std::string::npos || colon < slash) &&
        std::isalpha(static_cast<unsigned char>(rest[0]))) {
        bool ok = true;
        for (size_t i = 1; i < colon; i++) {
            char c = rest[i];
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
                ok = false;
                break;
            }
        }
        if (ok) {
            parts.scheme = toLower(rest.substr(0, colon));
            rest.erase(0, colon + 1);
        }
    }

    // Authority
    if (startsWith(rest, "//")) {
        size_t end = rest.find('/', 2);
        if (end == std::string::npos) {
            parts.authority = rest.substr(2);
            rest.clear();
        } else {
            parts.authority = rest.substr(2, end - 2);
            rest.erase(0, end);
        }
    }

    parts.path = rest;
    return parts;
}

std::string removeDotSegments(const std::string& input) {
    std::string in = input;
    std::string out;

    while (!in.empty()) {
        if (startsWith(in, "../")) {
            in.erase(0, 3);
        } else if (startsWith(in, "./")) {
            in.erase(0, 2);
        } else if (startsWith(in, "/./")) {
            in.erase(0, 2);
        } else if (in == "/.") {
            in = "/";
        } else if (startsWith(in, "/../") || in == "/..") {
            in = in.size() == 3 ? "/" : in.substr(3);
            size_t last = out.rfind('/');
            out.erase(last == std::string::npos ? 0 : last);
        } else if (in == "." || in == "..") {
            in.clear();
        } else {
            size_t start = in[0] == '/' ? 1 : 0;
            size_t next = in.find('/', start);
            if (next == std::string::npos) {
                out += in;
                in.clear();
            } else {
                out += in.substr(0, next);
                in.erase(0, next);
            }
        }
    }

    return out;
}

std::string mergePaths(const Url& base, const std::string& reference_path) {
    if (base.path.empty()) {
        return "/" + reference_path;
    }
    size_t last = base.path.rfind('/');
    if (last == std::string::npos) {
        return reference_path;
    }
    return base.path.substr(0, last + 1) + reference_path;
}

std::string authorityOf(const Url& url) {
    std::string authority;
    if (!url.userinfo.empty()) {
        authority += url.userinfo + "@";
    }
    authority += url.hostHeader();
    return authority;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

Url Url::parse(const std::string& text) {
    Url url;
    ReferenceParts parts = splitReference(trim(text));

    if (!parts.scheme || !parts.authority || parts.authority->empty()) {
        return url;
    }

    url.scheme = *parts.scheme;
    std::string authority = *parts.authority;

    // Step 1: userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        url.userinfo = authority.substr(0, at);
        authority.erase(0, at + 1);
    }

    // Step 2: host and port
    std::string port_str;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return url;
        }
        url.host = toLower(authority.substr(1, close - 1));
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                return url;
            }
            port_str = after.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            port_str = authority.substr(colon + 1);
            authority.erase(colon);
        }
        url.host = toLower(authority);
    }

    if (url.host.empty()) {
        return url;
    }

    url.port = defaultPort(url.scheme);
    if (!port_str.empty()) {
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return url;
            }
        }
        if (port_str.size() > 5) {
            return url;
        }
        url.port = std::stoi(port_str);
        if (url.port <= 0 || url.port > 65535) {
            return url;
        }
    }

    // Step 3: path, query, fragment
    url.path = parts.path;
    url.has_query = parts.query.has_value();
    url.query = parts.query.value_or("");
    url.fragment = parts.fragment.value_or("");
    url.valid = url.port > 0;
    return url;
}

Url Url::resolve(const Url& base, const std::string& reference) {
    ReferenceParts r = splitReference(trim(reference));
    ReferenceParts t;

    if (r.scheme) {
        t.scheme = r.scheme;
        t.authority = r.authority;
        t.path = removeDotSegments(r.path);
        t.query = r.query;
    } else {
        if (r.authority) {
            t.authority = r.authority;
            t.path = removeDotSegments(r.path);
            t.query = r.query;
        } else {
            if (r.path.empty()) {
                t.path = base.path;
                t.query = r.query ? r.query : (base.has_query ? std::optional<std::string>(base.query)
                                                              : std::nullopt);
            } else {
                if (r.path[0] == '/') {
                    t.path = removeDotSegments(r.path);
                } else {
                    t.path = removeDotSegments(mergePaths(base, r.path));
                }
                t.query = r.query;
            }
            t.authority = authorityOf(base);
        }
        t.scheme = base.scheme;
    }
    t.fragment = r.fragment;

    std::string composed = *t.scheme + "://" + t.authority.value_or("") + t.path;
    if (t.query) {
        composed += "?" + *t.query;
    }
    if (t.fragment) {
        composed += "#" + *t.fragment;
    }
    return parse(composed);
}

int Url::defaultPort(const std::string& scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    return 0;
}

// ============================================================================
// Serialization
// ============================================================================

std::string Url::requestTarget() const {
    std::string target = path.empty() ? "/" : path;
    if (has_query) {
        target += "?" + query;
    }
    return target;
}

std::string Url::hostHeader() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != defaultPort(scheme)) {
        h += ":" + std::to_string(port);
    }
    return h;
}

std::string Url::origin() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return scheme + "://" + h + ":" + std::to_string(port);
}

std::string Url::toString() const {
    std::string out = scheme + "://" + authorityOf(*this) + (path.empty() ? "/" : path);
    if (has_query) {
        out += "?" + query;
    }
    return out;
}

bool Url::sameOrigin(const Url& other) const {
    return scheme == other.scheme && host == other.host && port == other.port;
}

std::string Url::username() const {
    size_t colon = userinfo.find(':');
    return query_string::unescape(userinfo.substr(0, colon));
}

std::string Url::password() const {
    size_t colon = userinfo.find(':');
    if (colon == std::string::npos) {
        return "";
    }
    return query_string::unescape(userinfo.substr(colon + 1));
}
