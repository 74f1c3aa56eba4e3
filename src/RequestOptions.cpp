#include "RequestOptions.hpp"

#include <stdexcept>

bool OStreamWritable::write(const char* data, size_t length) {
    out->write(data, static_cast<std::streamsize>(length));
    return static_cast<bool>(*out);
}

void OStreamWritable::end(std::function<void(std::exception_ptr)> on_finish) {
    out->flush();
    if (!*out) {
        on_finish(std::make_exception_ptr(std::runtime_error("output stream failed")));
        return;
    }
    on_finish(nullptr);
}

namespace {

template <typename T>
void overlayField(std::optional<T>& target, const std::optional<T>& source) {
    if (source) {
        target = source;
    }
}

} // namespace

RequestOptions RequestOptions::merge(const RequestOptions& base, const RequestOptions& overlay) {
    RequestOptions merged = base;

    overlayField(merged.method, overlay.method);
    overlayField(merged.data, overlay.data);
    overlayField(merged.data_as_query_string, overlay.data_as_query_string);
    overlayField(merged.content, overlay.content);
    if (overlay.stream) merged.stream = overlay.stream;
    overlayField(merged.content_type, overlay.content_type);
    overlayField(merged.nested_querystring, overlay.nested_querystring);
    merged.headers.merge(overlay.headers);

    if (overlay.write_stream) merged.write_stream = overlay.write_stream;
    overlayField(merged.consume_write_stream, overlay.consume_write_stream);
    overlayField(merged.data_type, overlay.data_type);
    overlayField(merged.fix_json_ctl_chars, overlay.fix_json_ctl_chars);
    overlayField(merged.streaming, overlay.streaming);
    overlayField(merged.gzip, overlay.gzip);
    overlayField(merged.timing, overlay.timing);

    overlayField(merged.timeout, overlay.timeout);
    overlayField(merged.auth, overlay.auth);
    overlayField(merged.digest_auth, overlay.digest_auth);
    overlayField(merged.agent, overlay.agent);
    overlayField(merged.https_agent, overlay.https_agent);

    overlayField(merged.ca, overlay.ca);
    overlayField(merged.pfx, overlay.pfx);
    overlayField(merged.key, overlay.key);
    overlayField(merged.cert, overlay.cert);
    overlayField(merged.passphrase, overlay.passphrase);
    overlayField(merged.ciphers, overlay.ciphers);
    overlayField(merged.secure_protocol, overlay.secure_protocol);
    overlayField(merged.reject_unauthorized, overlay.reject_unauthorized);

    overlayField(merged.follow_redirect, overlay.follow_redirect);
    overlayField(merged.max_redirects, overlay.max_redirects);
    if (overlay.format_redirect_url) merged.format_redirect_url = overlay.format_redirect_url;

    overlayField(merged.enable_proxy, overlay.enable_proxy);
    overlayField(merged.proxy, overlay.proxy);
    if (overlay.before_request) merged.before_request = overlay.before_request;

    return merged;
}
