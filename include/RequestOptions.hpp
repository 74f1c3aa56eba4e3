#ifndef REQUEST_OPTIONS_HPP
#define REQUEST_OPTIONS_HPP

#include "HeaderMap.hpp"

#include <exception>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <json/json.h>

class Agent;

/**
 * How the response body is handed back
 */
enum class DataType {
    Buffer, // raw bytes
    Text,   // charset-decoded UTF-8 string
    Json    // parsed Json::Value
};

/**
 * Connect-phase and response-phase deadlines in milliseconds
 *
 * A single value applies to both phases. 0 disables a phase's deadline.
 */
struct Timeout {
    long connect_ms;
    long response_ms;

    Timeout(long ms) : connect_ms(ms), response_ms(ms) {}
    Timeout(long connect, long response) : connect_ms(connect), response_ms(response) {}
};

/**
 * WritableStream - Caller-supplied sink for the response body
 *
 * write() receives decoded body bytes in order. end() is called once after
 * the last write; the sink must invoke on_finish (with nullptr on success)
 * once everything is flushed.
 */
class WritableStream {
public:
    virtual ~WritableStream() = default;

    /**
     * @return false when the sink failed and the transfer must stop
     */
    virtual bool write(const char* data, size_t length) = 0;

    virtual void end(std::function<void(std::exception_ptr)> on_finish) = 0;
};

/**
 * Adapts any std::ostream to WritableStream
 */
class OStreamWritable : public WritableStream {
public:
    explicit OStreamWritable(std::shared_ptr<std::ostream> out) : out(std::move(out)) {}

    bool write(const char* data, size_t length) override;
    void end(std::function<void(std::exception_ptr)> on_finish) override;

private:
    std::shared_ptr<std::ostream> out;
};

/**
 * RequestOptions - Per-call (or per-client default) request settings
 *
 * Every unset field falls back to the client's defaults, then to the
 * library defaults. See OptionNormalizer for the resolution rules.
 */
struct RequestOptions {
    // Request line and body
    std::optional<std::string> method;
    std::optional<Json::Value> data;
    std::optional<bool> data_as_query_string;
    std::optional<std::string> content;
    std::shared_ptr<std::istream> stream;
    std::optional<std::string> content_type;
    std::optional<bool> nested_querystring;
    HeaderMap headers;

    // Response handling
    std::shared_ptr<WritableStream> write_stream;
    std::optional<bool> consume_write_stream;
    std::optional<DataType> data_type;
    std::optional<bool> fix_json_ctl_chars;
    std::optional<bool> streaming;
    std::optional<bool> gzip;
    std::optional<bool> timing;

    std::optional<Timeout> timeout;

    // Credentials, "user:password"
    std::optional<std::string> auth;
    std::optional<std::string> digest_auth;

    // Pools: unset uses the client's agent, nullptr disables pooling
    std::optional<std::shared_ptr<Agent>> agent;
    std::optional<std::shared_ptr<Agent>> https_agent;

    // TLS
    std::optional<std::vector<std::string>> ca;
    std::optional<std::string> pfx;
    std::optional<std::string> key;
    std::optional<std::string> cert;
    std::optional<std::string> passphrase;
    std::optional<std::string> ciphers;
    std::optional<std::string> secure_protocol;
    std::optional<bool> reject_unauthorized;

    // Redirects
    std::optional<bool> follow_redirect;
    std::optional<int> max_redirects;
    std::function<std::string(const std::string& from, const std::string& to)> format_redirect_url;

    // Proxy
    std::optional<bool> enable_proxy;
    std::optional<std::string> proxy;

    // Called with the merged options before they are resolved
    std::function<void(RequestOptions&)> before_request;

    /**
     * Overlay options field by field
     *
     * @param base Lower-precedence options
     * @param overlay Higher-precedence options; set fields win
     * @return Merged options, headers merged case-insensitively
     */
    static RequestOptions merge(const RequestOptions& base, const RequestOptions& overlay);
};

#endif // REQUEST_OPTIONS_HPP
