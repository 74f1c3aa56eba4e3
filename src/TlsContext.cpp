#include "TlsContext.hpp"
#include "RequestErrors.hpp"
#include "RequestPlan.hpp"
#include "StringUtils.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/x509.h>

namespace {

struct ProtocolRange {
    int min_version;
    int max_version;
};

bool protocolRange(const std::string& name, ProtocolRange& range) {
    // Accept the method names with or without the _client suffix
    std::string base = name;
    const std::string suffix = "_client_method";
    if (base.size() > suffix.size() && base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0) {
        base = base.substr(0, base.size() - suffix.size()) + "_method";
    }

    if (base.empty() || base == "TLS_method" || base == "SSLv23_method") {
        range = {0, 0};
    } else if (base == "TLSv1_method") {
        range = {TLS1_VERSION, TLS1_VERSION};
    } else if (base == "TLSv1_1_method") {
        range = {TLS1_1_VERSION, TLS1_1_VERSION};
    } else if (base == "TLSv1_2_method") {
        range = {TLS1_2_VERSION, TLS1_2_VERSION};
    } else if (base == "TLSv1_3_method") {
        range = {TLS1_3_VERSION, TLS1_3_VERSION};
    } else {
        return false;
    }
    return true;
}

std::string lastOpenSslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

void loadCaBundle(SSL_CTX* ctx, const std::vector<std::string>& pems) {
    X509_STORE* store = SSL_CTX_get_cert_store(ctx);
    size_t loaded = 0;

    for (const auto& pem : pems) {
        BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
        if (bio == nullptr) {
            throw ConnectError("cannot allocate BIO for ca");
        }
        while (X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) {
            X509_STORE_add_cert(store, cert);
            X509_free(cert);
            loaded++;
        }
        // PEM_read_bio_X509 leaves a "no start line" error at end of input
        ERR_clear_error();
        BIO_free(bio);
    }

    if (loaded == 0) {
        throw ConnectError("ca option contains no PEM certificates");
    }
}

void loadPemIdentity(SSL_CTX* ctx, const TlsSettings& settings) {
    BIO* cert_bio = BIO_new_mem_buf(settings.cert.data(), static_cast<int>(settings.cert.size()));
    X509* cert = cert_bio ? PEM_read_bio_X509(cert_bio, nullptr, nullptr, nullptr) : nullptr;
    if (cert == nullptr) {
        BIO_free(cert_bio);
        throw ConnectError("cannot parse client certificate: " + lastOpenSslError());
    }
    if (SSL_CTX_use_certificate(ctx, cert) != 1) {
        X509_free(cert);
        BIO_free(cert_bio);
        throw ConnectError("cannot use client certificate: " + lastOpenSslError());
    }
    X509_free(cert);

    // Remaining certificates in the PEM form the chain
    while (X509* extra = PEM_read_bio_X509(cert_bio, nullptr, nullptr, nullptr)) {
        SSL_CTX_add_extra_chain_cert(ctx, extra);
    }
    ERR_clear_error();
    BIO_free(cert_bio);

    BIO* key_bio = BIO_new_mem_buf(settings.key.data(), static_cast<int>(settings.key.size()));
    void* passphrase = settings.passphrase.empty() ? nullptr : const_cast<char*>(settings.passphrase.c_str());
    EVP_PKEY* pkey = key_bio ? PEM_read_bio_PrivateKey(key_bio, nullptr, nullptr, passphrase) : nullptr;
    BIO_free(key_bio);
    if (pkey == nullptr) {
        throw ConnectError("cannot parse client key: " + lastOpenSslError());
    }
    int used = SSL_CTX_use_PrivateKey(ctx, pkey);
    EVP_PKEY_free(pkey);
    if (used != 1 || SSL_CTX_check_private_key(ctx) != 1) {
        throw ConnectError("client key does not match certificate: " + lastOpenSslError());
    }
}

void loadPfxIdentity(SSL_CTX* ctx, const TlsSettings& settings) {
    BIO* bio = BIO_new_mem_buf(settings.pfx.data(), static_cast<int>(settings.pfx.size()));
    PKCS12* p12 = bio ? d2i_PKCS12_bio(bio, nullptr) : nullptr;
    BIO_free(bio);
    if (p12 == nullptr) {
        throw ConnectError("cannot parse pfx: " + lastOpenSslError());
    }

    EVP_PKEY* pkey = nullptr;
    X509* cert = nullptr;
    STACK_OF(X509)* chain = nullptr;
    int parsed = PKCS12_parse(p12, settings.passphrase.c_str(), &pkey, &cert, &chain);
    PKCS12_free(p12);
    if (parsed != 1) {
        throw ConnectError("cannot decrypt pfx: " + lastOpenSslError());
    }

    bool ok = cert != nullptr && pkey != nullptr &&
              SSL_CTX_use_certificate(ctx, cert) == 1 &&
              SSL_CTX_use_PrivateKey(ctx, pkey) == 1;
    if (ok && chain != nullptr) {
        for (int i = 0; i < sk_X509_num(chain); i++) {
            X509* extra = X509_dup(sk_X509_value(chain, i));
            SSL_CTX_add_extra_chain_cert(ctx, extra);
        }
    }

    X509_free(cert);
    EVP_PKEY_free(pkey);
    sk_X509_pop_free(chain, X509_free);
    if (!ok) {
        throw ConnectError("cannot use pfx identity: " + lastOpenSslError());
    }
}

} // namespace

// ============================================================================
// TlsSettings
// ============================================================================

std::string TlsSettings::cacheKey() const {
    std::string material;
    for (const auto& pem : ca) {
        material += pem;
        material += '\x1f';
    }
    material += '\x1e' + pfx + '\x1e' + key + '\x1e' + cert + '\x1e' + passphrase + '\x1e' +
                ciphers + '\x1e' + secure_protocol + '\x1e' + (reject_unauthorized ? "1" : "0");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_Digest(material.data(), material.size(), digest, &length, EVP_sha256(), nullptr);
    return utils::toHex(digest, length);
}

// ============================================================================
// TlsContext
// ============================================================================

bool TlsContext::isKnownProtocol(const std::string& name) {
    ProtocolRange range {};
    return protocolRange(name, range);
}

std::shared_ptr<TlsContext> TlsContext::create(const TlsSettings& settings) {
    ProtocolRange range {};
    if (!protocolRange(settings.secure_protocol, range)) {
        throw ConnectError("unknown secureProtocol " + settings.secure_protocol);
    }

    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (ctx == nullptr) {
        throw ConnectError("SSL_CTX_new failed: " + lastOpenSslError());
    }
    auto context = std::make_shared<TlsContext>(Passkey(), ctx, settings.reject_unauthorized);

    // Step 1: Protocol versions
    if (range.min_version != 0) {
        SSL_CTX_set_min_proto_version(ctx, range.min_version);
        SSL_CTX_set_max_proto_version(ctx, range.max_version);
    }

    // Step 2: Cipher list
    if (!settings.ciphers.empty() && SSL_CTX_set_cipher_list(ctx, settings.ciphers.c_str()) != 1) {
        throw ConnectError("invalid cipher list: " + settings.ciphers);
    }

    // Step 3: Trust roots
    if (!settings.ca.empty()) {
        loadCaBundle(ctx, settings.ca);
    } else if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
        throw ConnectError("cannot load system CA store: " + lastOpenSslError());
    }

    // Step 4: Client identity
    if (!settings.pfx.empty()) {
        loadPfxIdentity(ctx, settings);
    } else if (!settings.cert.empty() && !settings.key.empty()) {
        loadPemIdentity(ctx, settings);
    }

    // Step 5: Peer verification
    SSL_CTX_set_verify(ctx, settings.reject_unauthorized ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    return context;
}

TlsContext::~TlsContext() {
    SSL_CTX_free(ctx);
}

// ============================================================================
// TlsContextCache
// ============================================================================

std::shared_ptr<TlsContext> TlsContextCache::get(const TlsSettings& settings) {
    std::string key = settings.cacheKey();
    std::lock_guard<std::mutex> lock(mtx);
    auto it = contexts.find(key);
    if (it != contexts.end()) {
        return it->second;
    }
    auto context = TlsContext::create(settings);
    contexts.emplace(key, context);
    return context;
}

void TlsContextCache::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    contexts.clear();
}
