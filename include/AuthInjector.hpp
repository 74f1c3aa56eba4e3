#ifndef AUTH_INJECTOR_HPP
#define AUTH_INJECTOR_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct DigestCredentials;

/**
 * Parameters of a WWW-Authenticate: Digest challenge
 */
struct DigestChallenge {
    std::string realm;
    std::string nonce;
    std::string qop;        // selected qop ("auth") or empty for RFC 2069 style
    std::string opaque;
    std::string algorithm;  // "MD5" when the server did not say
    bool stale = false;
};

/**
 * Digest state of one logical request (across its redirect chain)
 */
struct AuthState {
    std::optional<DigestChallenge> challenge;
    uint32_t nonce_count = 0;
    bool retried = false;
};

/**
 * DigestCache - Digest challenges shared between requests of one client
 *
 * Keyed by host + realm. Each entry carries its own mutex guarding the
 * nonce counter, so concurrent requests to the same realm send strictly
 * increasing nc values.
 */
class DigestCache {
public:
    struct Entry {
        std::mutex mtx;
        DigestChallenge challenge;
        uint32_t nonce_count = 0;
    };

    /**
     * Most recently stored entry for a host, or nullptr
     */
    std::shared_ptr<Entry> find(const std::string& host);

    /**
     * Store (or refresh) a challenge; a new nonce restarts the counter
     */
    std::shared_ptr<Entry> store(const std::string& host, const DigestChallenge& challenge);

private:
    std::mutex mtx;
    std::map<std::string, std::shared_ptr<Entry>> entries;  // host + '\n' + realm
    std::map<std::string, std::string> latest_realm;        // host -> realm
};

/**
 * AuthInjector - Builds Authorization header values
 *
 * Basic: "Basic base64(user:password)".
 * Digest (RFC 2617 / RFC 7616): challenge parsing and response computation
 * for MD5, MD5-sess, SHA-256 and SHA-256-sess with qop=auth or no qop.
 *
 * This is a utility class with static methods only.
 */
class AuthInjector {
public:
    /**
     * @param username User name
     * @param password Password
     * @return Header value "Basic ..."
     */
    static std::string basicHeader(const std::string& username, const std::string& password);

    /**
     * Split a "user:password" credential string at the first ':'
     *
     * @return nullopt when there is no ':' or the user part is empty
     */
    static std::optional<std::pair<std::string, std::string>> splitCredentials(const std::string& credentials);

    /**
     * Parse the Digest challenge from a WWW-Authenticate value
     *
     * @param header WWW-Authenticate header value
     * @return Challenge, or nullopt when the header is not a Digest challenge
     * @throws AuthError when realm or nonce is missing, or only unsupported qop values are offered
     */
    static std::optional<DigestChallenge> parseChallenge(const std::string& header);

    /**
     * Compute the Authorization header value answering a challenge
     *
     * @param credentials User name and password
     * @param challenge Parsed challenge
     * @param method Request method
     * @param uri Request target exactly as sent on the request line
     * @param nonce_count Counter value for this use of the nonce (starts at 1)
     * @param cnonce Client nonce
     * @return Header value "Digest ..."
     * @throws AuthError for unsupported algorithms
     */
    static std::string digestHeader(const DigestCredentials& credentials,
                                    const DigestChallenge& challenge,
                                    const std::string& method,
                                    const std::string& uri,
                                    uint32_t nonce_count,
                                    const std::string& cnonce);

    /**
     * Random 16-hex-digit client nonce
     */
    static std::string makeCnonce();

private:
    static std::string hash(const std::string& algorithm, const std::string& data);

    // Utility class - no instances allowed
    AuthInjector() = delete;
};

#endif // AUTH_INJECTOR_HPP
