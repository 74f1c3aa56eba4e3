#ifndef TLS_CONTEXT_HPP
#define TLS_CONTEXT_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <openssl/ssl.h>

struct TlsSettings;

/**
 * TlsContext - SSL_CTX configured from a request's TLS settings
 *
 * Covers trust roots (ca or system defaults), client identity (pfx or
 * key/cert PEM with optional passphrase), cipher list, protocol version
 * pinning and peer verification.
 */
class TlsContext {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /**
     * Only create() can build a Passkey
     */
    TlsContext(Passkey, SSL_CTX* ctx, bool verify_peer) : ctx(ctx), verify_peer(verify_peer) {}

    /**
     * Build a context
     *
     * @param settings TLS settings of the request
     * @return Shared context
     * @throws ConnectError when a certificate, key or cipher list is unusable
     */
    static std::shared_ptr<TlsContext> create(const TlsSettings& settings);

    /**
     * Whether a secureProtocol name is recognized
     */
    static bool isKnownProtocol(const std::string& name);

    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* get() const { return ctx; }
    bool verifyPeer() const { return verify_peer; }

private:
    SSL_CTX* ctx;
    bool verify_peer;
};

/**
 * TlsContextCache - Thread-safe map from TlsSettings::cacheKey() to context
 */
class TlsContextCache {
public:
    std::shared_ptr<TlsContext> get(const TlsSettings& settings);
    void clear();

private:
    std::mutex mtx;
    std::map<std::string, std::shared_ptr<TlsContext>> contexts;
};

#endif // TLS_CONTEXT_HPP
