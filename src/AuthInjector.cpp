#include "AuthInjector.hpp"
#include "RequestErrors.hpp"
#include "RequestPlan.hpp"
#include "StringUtils.hpp"

#include <fmt/format.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <vector>

using namespace utils;

namespace {

// Parse comma-separated auth-params: key=token or key="quoted \" string"
std::map<std::string, std::string> parseAuthParams(const std::string& text) {
    std::map<std::string, std::string> params;
    size_t pos = 0;

    while (pos < text.size()) {
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == ',')) {
            pos++;
        }
        size_t eq = text.find('=', pos);
        if (eq == std::string::npos) {
            break;
        }
        std::string key = toLower(trim(text.substr(pos, eq - pos)));
        pos = eq + 1;
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
            pos++;
        }

        std::string value;
        if (pos < text.size() && text[pos] == '"') {
            pos++;
            while (pos < text.size() && text[pos] != '"') {
                if (text[pos] == '\\' && pos + 1 < text.size()) {
                    pos++;
                }
                value += text[pos++];
            }
            pos++;  // closing quote
        } else {
            size_t end = text.find(',', pos);
            if (end == std::string::npos) {
                end = text.size();
            }
            value = trim(text.substr(pos, end - pos));
            pos = end;
        }
        params[key] = value;
    }
    return params;
}

const EVP_MD* digestFor(const std::string& algorithm) {
    std::string upper = toUpper(algorithm);
    if (upper == "MD5" || upper == "MD5-SESS") {
        return EVP_md5();
    }
    if (upper == "SHA-256" || upper == "SHA-256-SESS") {
        return EVP_sha256();
    }
    return nullptr;
}

} // namespace

// ============================================================================
// DigestCache
// ============================================================================

std::shared_ptr<DigestCache::Entry> DigestCache::find(const std::string& host) {
    std::lock_guard<std::mutex> lock(mtx);
    auto realm = latest_realm.find(host);
    if (realm == latest_realm.end()) {
        return nullptr;
    }
    auto it = entries.find(host + '\n' + realm->second);
    return it == entries.end() ? nullptr : it->second;
}

std::shared_ptr<DigestCache::Entry> DigestCache::store(const std::string& host, const DigestChallenge& challenge) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::string key = host + '\n' + challenge.realm;
        auto& slot = entries[key];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        entry = slot;
        latest_realm[host] = challenge.realm;
    }

    std::lock_guard<std::mutex> entry_lock(entry->mtx);
    if (entry->challenge.nonce != challenge.nonce) {
        entry->nonce_count = 0;
    }
    entry->challenge = challenge;
    return entry;
}

// ============================================================================
// Basic
// ============================================================================

std::string AuthInjector::basicHeader(const std::string& username, const std::string& password) {
    std::string plain = username + ":" + password;
    std::vector<unsigned char> encoded(4 * ((plain.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(encoded.data(),
                                 reinterpret_cast<const unsigned char*>(plain.data()),
                                 static_cast<int>(plain.size()));
    return "Basic " + std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<size_t>(length));
}

std::optional<std::pair<std::string, std::string>> AuthInjector::splitCredentials(const std::string& credentials) {
    size_t colon = credentials.find(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    return std::make_pair(credentials.substr(0, colon), credentials.substr(colon + 1));
}

// ============================================================================
// Digest
// ============================================================================

std::optional<DigestChallenge> AuthInjector::parseChallenge(const std::string& header) {
    // Step 1: Locate the Digest scheme (a header may list several challenges)
    std::string lower = toLower(header);
    size_t start = lower.find("digest ");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    auto params = parseAuthParams(header.substr(start + 7));

    // Step 2: Required fields
    DigestChallenge challenge;
    challenge.realm = params.count("realm") ? params["realm"] : "";
    challenge.nonce = params.count("nonce") ? params["nonce"] : "";
    if (!params.count("realm") || challenge.nonce.empty()) {
        throw AuthError("digest challenge is missing realm or nonce");
    }

    // Step 3: Optional fields
    challenge.opaque = params.count("opaque") ? params["opaque"] : "";
    challenge.algorithm = params.count("algorithm") ? params["algorithm"] : "MD5";
    challenge.stale = params.count("stale") && iequals(params["stale"], "true");

    if (params.count("qop")) {
        bool has_auth = false;
        for (const auto& option : split(params["qop"], ',')) {
            if (iequals(trim(option), "auth")) {
                has_auth = true;
            }
        }
        if (!has_auth) {
            throw AuthError("digest challenge offers no supported qop: " + params["qop"]);
        }
        challenge.qop = "auth";
    }

    return challenge;
}

std::string AuthInjector::digestHeader(const DigestCredentials& credentials,
                                       const DigestChallenge& challenge,
                                       const std::string& method,
                                       const std::string& uri,
                                       uint32_t nonce_count,
                                       const std::string& cnonce) {
    if (digestFor(challenge.algorithm) == nullptr) {
        throw AuthError("unsupported digest algorithm " + challenge.algorithm);
    }

    const std::string& algorithm = challenge.algorithm;
    bool session = endsWith(toUpper(algorithm), "-SESS");
    std::string nc = fmt::format("{:08x}", nonce_count);

    // HA1 = H(user:realm:password), or H(H(...):nonce:cnonce) for -sess
    std::string ha1 = hash(algorithm, credentials.username + ":" + challenge.realm + ":" + credentials.password);
    if (session) {
        ha1 = hash(algorithm, ha1 + ":" + challenge.nonce + ":" + cnonce);
    }

    // HA2 = H(method:uri)
    std::string ha2 = hash(algorithm, method + ":" + uri);

    std::string response;
    if (!challenge.qop.empty()) {
        response = hash(algorithm, ha1 + ":" + challenge.nonce + ":" + nc + ":" + cnonce + ":" +
                                   challenge.qop + ":" + ha2);
    } else {
        response = hash(algorithm, ha1 + ":" + challenge.nonce + ":" + ha2);
    }

    std::string header = fmt::format("Digest username=\"{}\", realm=\"{}\", nonce=\"{}\", uri=\"{}\", "
                                     "algorithm={}, response=\"{}\"",
                                     credentials.username, challenge.realm, challenge.nonce, uri,
                                     algorithm, response);
    if (!challenge.qop.empty()) {
        header += fmt::format(", qop={}, nc={}, cnonce=\"{}\"", challenge.qop, nc, cnonce);
    }
    if (!challenge.opaque.empty()) {
        header += fmt::format(", opaque=\"{}\"", challenge.opaque);
    }
    return header;
}

std::string AuthInjector::makeCnonce() {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw AuthError("cannot generate digest cnonce");
    }
    return toHex(bytes, sizeof(bytes));
}

std::string AuthInjector::hash(const std::string& algorithm, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, digestFor(algorithm), nullptr) != 1) {
        throw AuthError("digest computation failed");
    }
    return toHex(digest, length);
}
