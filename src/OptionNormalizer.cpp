#include "OptionNormalizer.hpp"
#include "AuthInjector.hpp"
#include "HTTPUtils.hpp"
#include "QueryString.hpp"
#include "RequestErrors.hpp"
#include "StringUtils.hpp"
#include "TlsContext.hpp"

#include <cstdlib>

#ifndef HTTPREQ_VERSION
#define HTTPREQ_VERSION "1.0.0"
#endif

using namespace utils;

// ============================================================================
// Public Methods
// ============================================================================

std::string OptionNormalizer::userAgent() {
    return std::string("httpreq/") + HTTPREQ_VERSION + " (Linux)";
}

RequestPlan OptionNormalizer::normalize(const std::string& url,
                                        const RequestOptions& instance_defaults,
                                        const RequestOptions& call_options,
                                        uint64_t request_id) {
    // Step 1: Merge call options over client defaults, then let the hook adjust them
    RequestOptions options = RequestOptions::merge(instance_defaults, call_options);
    if (options.before_request) {
        options.before_request(options);
    }

    RequestPlan plan;
    plan.request_id = request_id;
    plan.url = parseTarget(url);

    // Step 2: Method
    plan.method = toUpper(options.method.value_or("GET"));
    if (!http_utils::isToken(plan.method)) {
        throw InvalidOptionError("invalid method '" + plan.method + "'");
    }

    // Step 3: Timeouts and redirects
    Timeout timeout = options.timeout.value_or(Timeout(kDefaultTimeoutMs));
    if (timeout.connect_ms < 0 || timeout.response_ms < 0) {
        throw InvalidOptionError("timeout must not be negative");
    }
    plan.connect_timeout_ms = timeout.connect_ms;
    plan.response_timeout_ms = timeout.response_ms;

    plan.redirect.follow = options.follow_redirect.value_or(false);
    plan.redirect.max_redirects = options.max_redirects.value_or(kDefaultMaxRedirects);
    if (plan.redirect.max_redirects < 0) {
        throw InvalidOptionError("maxRedirects must not be negative");
    }
    plan.redirect.formatter = options.format_redirect_url;

    // Step 4: Authentication mode
    if (options.auth && options.digest_auth) {
        throw InvalidOptionError("auth and digestAuth are mutually exclusive");
    }
    if (options.digest_auth) {
        auto credentials = AuthInjector::splitCredentials(*options.digest_auth);
        if (!credentials) {
            throw AuthError("digestAuth must be \"user:password\"");
        }
        plan.auth = DigestCredentials{credentials->first, credentials->second};
    } else if (options.auth) {
        size_t colon = options.auth->find(':');
        plan.auth = BasicCredentials{options.auth->substr(0, colon),
                                     colon == std::string::npos ? "" : options.auth->substr(colon + 1)};
    } else if (!plan.url.userinfo.empty()) {
        plan.auth = BasicCredentials{plan.url.username(), plan.url.password()};
    }
    plan.url.userinfo.clear();

    // Step 5: Response sink
    if (options.streaming.value_or(false) && options.write_stream) {
        throw InvalidOptionError("streaming and writeStream are mutually exclusive");
    }
    if (options.write_stream) {
        plan.sink.mode = SinkMode::WriteStream;
        plan.sink.write_stream = options.write_stream;
    } else if (options.streaming.value_or(false)) {
        plan.sink.mode = SinkMode::Streaming;
    }
    plan.sink.consume_write_stream = options.consume_write_stream.value_or(true);

    // Step 6: Decoding
    plan.decode.data_type = options.data_type.value_or(DataType::Buffer);
    plan.decode.gzip = options.gzip.value_or(false);
    plan.decode.fix_control_chars = options.fix_json_ctl_chars.value_or(false);
    plan.timing = options.timing.value_or(false);

    // Step 7: TLS
    plan.tls.ca = options.ca.value_or(std::vector<std::string>{});
    plan.tls.pfx = options.pfx.value_or("");
    plan.tls.key = options.key.value_or("");
    plan.tls.cert = options.cert.value_or("");
    plan.tls.passphrase = options.passphrase.value_or("");
    plan.tls.ciphers = options.ciphers.value_or("");
    plan.tls.secure_protocol = options.secure_protocol.value_or("");
    plan.tls.reject_unauthorized = options.reject_unauthorized.value_or(true);
    if (!TlsContext::isKnownProtocol(plan.tls.secure_protocol)) {
        throw InvalidOptionError("unknown secureProtocol '" + plan.tls.secure_protocol + "'");
    }

    // Step 8: Pools and proxy
    if (options.agent) {
        plan.http_agent.use_default = false;
        plan.http_agent.custom = *options.agent;
    }
    if (options.https_agent) {
        plan.https_agent.use_default = false;
        plan.https_agent.custom = *options.https_agent;
    }
    plan.proxy = resolveProxy(options, plan.url);

    // Step 9: Body source, stream > content > data
    if (options.stream) {
        plan.body = StreamBody{options.stream, std::make_shared<std::atomic<bool>>(false)};
    } else if (options.content) {
        plan.body = BufferBody{*options.content};
    } else if (options.data) {
        plan.data = options.data;
    }
    plan.data_as_query_string = options.data_as_query_string.value_or(false);
    plan.nested_querystring = options.nested_querystring.value_or(false);

    // Step 10: Computed headers, then caller headers over them
    HeaderMap computed;
    computed.set("User-Agent", userAgent());
    if (options.content_type) {
        std::string type = *options.content_type;
        if (iequals(type, "json")) {
            type = "application/json";
        }
        plan.json_content = toLower(type).find("json") != std::string::npos;
        computed.set("Content-Type", type);
    }
    if (plan.decode.data_type == DataType::Json) {
        computed.set("Accept", "application/json");
    }
    if (plan.decode.gzip) {
        computed.set("Accept-Encoding", "gzip");
    }

    validateHeaders(options.headers);
    computed.merge(options.headers);
    computed.remove("Host");
    plan.headers = computed;

    // A caller-supplied JSON Content-Type also selects JSON body encoding
    auto content_type = plan.headers.get("Content-Type");
    if (content_type && toLower(*content_type).find("json") != std::string::npos) {
        plan.json_content = true;
    }

    return plan;
}

// ============================================================================
// Private Helper Methods
// ============================================================================

Url OptionNormalizer::parseTarget(const std::string& url) {
    std::string text = trim(url);
    if (text.find("://") == std::string::npos) {
        text = "http://" + text;
    }

    Url parsed = Url::parse(text);
    if (!parsed.valid) {
        throw InvalidOptionError("invalid url '" + url + "'");
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw InvalidOptionError("unsupported protocol '" + parsed.scheme + "'");
    }
    return parsed;
}

std::optional<Url> OptionNormalizer::resolveProxy(const RequestOptions& options, const Url& target) {
    if (options.enable_proxy.has_value() && !*options.enable_proxy) {
        return std::nullopt;
    }

    std::string proxy = options.proxy.value_or("");
    if (proxy.empty() && options.enable_proxy.value_or(false)) {
        const char* names[] = {"https_proxy", "HTTPS_PROXY", "http_proxy", "HTTP_PROXY"};
        size_t first = target.isSecure() ? 0 : 2;
        for (size_t i = first; i < 4 && proxy.empty(); i++) {
            const char* value = std::getenv(names[i]);
            if (value != nullptr) {
                proxy = value;
            }
        }
    }
    if (proxy.empty()) {
        return std::nullopt;
    }

    if (proxy.find("://") == std::string::npos) {
        proxy = "http://" + proxy;
    }
    Url parsed = Url::parse(proxy);
    if (!parsed.valid || parsed.scheme != "http") {
        throw InvalidOptionError("invalid proxy '" + proxy + "'; only http:// proxies are supported");
    }
    return parsed;
}

void OptionNormalizer::validateHeaders(const HeaderMap& headers) {
    for (const auto& field : headers.fields()) {
        if (!http_utils::isToken(field.first)) {
            throw InvalidOptionError("invalid header name '" + field.first + "'");
        }
        if (!http_utils::isValidHeaderValue(field.second)) {
            throw InvalidOptionError("invalid value for header '" + field.first + "'");
        }
    }
}
