#ifndef REQUEST_PLAN_HPP
#define REQUEST_PLAN_HPP

#include "HeaderMap.hpp"
#include "RequestOptions.hpp"
#include "Url.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// ============================================================================
// Body source
// ============================================================================

struct BufferBody {
    std::string bytes;
};

/**
 * Single-use caller stream, sent with chunked transfer encoding
 *
 * consumed is shared so every copy of the plan sees that the stream has
 * already been written once.
 */
struct StreamBody {
    std::shared_ptr<std::istream> stream;
    std::shared_ptr<std::atomic<bool>> consumed;
};

using BodySource = std::variant<std::monostate, BufferBody, StreamBody>;

// ============================================================================
// Authentication mode
// ============================================================================

struct BasicCredentials {
    std::string username;
    std::string password;
};

struct DigestCredentials {
    std::string username;
    std::string password;
};

using AuthMode = std::variant<std::monostate, BasicCredentials, DigestCredentials>;

// ============================================================================
// Policies
// ============================================================================

enum class SinkMode {
    Buffer,      // collect the body in memory
    WriteStream, // pipe the body to a caller WritableStream
    Streaming    // hand the live body back after the headers
};

struct ResponseSink {
    SinkMode mode = SinkMode::Buffer;
    std::shared_ptr<WritableStream> write_stream;
    bool consume_write_stream = true;
};

struct RedirectPolicy {
    bool follow = false;
    int max_redirects = 10;
    std::function<std::string(const std::string& from, const std::string& to)> formatter;
};

struct DecodePolicy {
    DataType data_type = DataType::Buffer;
    bool gzip = false;
    bool fix_control_chars = false;
};

struct TlsSettings {
    std::vector<std::string> ca;
    std::string pfx;
    std::string key;
    std::string cert;
    std::string passphrase;
    std::string ciphers;
    std::string secure_protocol;
    bool reject_unauthorized = true;

    /**
     * Stable key identifying an equivalent TLS configuration, used for
     * pool partitioning and context caching
     */
    std::string cacheKey() const;
};

/**
 * Which pool a request draws connections from
 */
struct AgentChoice {
    bool use_default = true;        // client's default agent for the scheme
    std::shared_ptr<Agent> custom;  // explicit agent, nullptr with use_default=false means no pooling
};

// ============================================================================
// RequestPlan
// ============================================================================

/**
 * RequestPlan - Fully resolved description of one logical request
 *
 * Built once by OptionNormalizer (and completed by BodyEncoder); attempts
 * copy the parts they modify (URL, method, headers) and never change the plan.
 */
struct RequestPlan {
    uint64_t request_id = 0;
    std::string method = "GET";
    Url url;
    HeaderMap headers;

    // Raw option inputs consumed by BodyEncoder
    std::optional<Json::Value> data;
    bool data_as_query_string = false;
    bool nested_querystring = false;
    bool json_content = false;

    BodySource body;
    AuthMode auth;
    ResponseSink sink;
    RedirectPolicy redirect;
    DecodePolicy decode;
    TlsSettings tls;

    std::optional<Url> proxy;
    AgentChoice http_agent;
    AgentChoice https_agent;

    long connect_timeout_ms = 5000;
    long response_timeout_ms = 5000;
    bool timing = false;

    bool hasStreamBody() const { return std::holds_alternative<StreamBody>(body); }
    bool hasBufferBody() const { return std::holds_alternative<BufferBody>(body); }
};

// ============================================================================
// Attempt
// ============================================================================

/**
 * What changes between attempts of one logical request
 */
struct AttemptState {
    std::string method;
    Url url;
    HeaderMap headers;      // without Host, which is derived from url
    bool send_body = true;  // false once a redirect dropped the body
    bool digest_allowed = true;
};

#endif // REQUEST_PLAN_HPP
