#ifndef URL_HPP
#define URL_HPP

#include <string>

/**
 * Url - Parsed absolute http/https URL
 *
 * Handles the subset of RFC 3986 an HTTP client needs: scheme, optional
 * userinfo, host (including bracketed IPv6 literals), port, path, query and
 * fragment. Relative references are resolved against a base with resolve().
 */
struct Url {
    std::string scheme;     // lowercase, without "://"
    std::string userinfo;   // raw (still percent-encoded) "user:pass"
    std::string host;       // lowercase, IPv6 literals without brackets
    int port;
    std::string path;       // raw path, may be empty
    std::string query;      // without leading '?'
    std::string fragment;   // without leading '#'
    bool has_query;
    bool valid;

    Url() : port(0), has_query(false), valid(false) {}

    /**
     * Parse an absolute URL
     *
     * @param text URL string such as "https://user:pw@example.com:8443/a?b=1"
     * @return Url with valid=false when the text is not an absolute URL with a host
     */
    static Url parse(const std::string& text);

    /**
     * Resolve a (possibly relative) reference against a base URL
     *
     * Implements RFC 3986 section 5.2, including dot-segment removal.
     *
     * @param base Absolute base URL
     * @param reference Absolute or relative reference (e.g. a Location header)
     * @return Resolved URL; valid=false when the result is not usable
     */
    static Url resolve(const Url& base, const std::string& reference);

    /**
     * Default port for a scheme (80 for http, 443 for https, 0 otherwise)
     */
    static int defaultPort(const std::string& scheme);

    /**
     * Origin-form request target: path plus query, "/" when the path is empty
     */
    std::string requestTarget() const;

    /**
     * Value for the Host header, port omitted when it is the scheme default
     */
    std::string hostHeader() const;

    /**
     * "scheme://host:port" with the port always present
     */
    std::string origin() const;

    /**
     * Serialize back to a string (fragment excluded, default port omitted)
     */
    std::string toString() const;

    bool isSecure() const { return scheme == "https"; }

    /**
     * Same scheme, host and port
     */
    bool sameOrigin(const Url& other) const;

    std::string username() const;
    std::string password() const;
};

#endif // URL_HPP
