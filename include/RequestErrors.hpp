#ifndef REQUEST_ERRORS_HPP
#define REQUEST_ERRORS_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

struct Response;

/**
 * Category of a failed request
 */
enum class ErrorKind {
    InvalidOption,
    Connect,
    Timeout,
    Auth,
    TooManyRedirects,
    JSONParse,
    StreamReplay,
    Protocol,
    Transfer,
    Decode
};

/**
 * Timeout phase that expired
 */
enum class TimeoutPhase {
    Connect,    // acquisition until the request is fully written
    Response    // request written until the body is fully consumed
};

const char* toString(TimeoutPhase phase);

/**
 * RequestError - Base of every error a request can fail with
 *
 * Carries the error kind, the id of the request that failed and the
 * partial response when one was received before the failure.
 */
class RequestError : public std::runtime_error {
public:
    RequestError(ErrorKind kind, const std::string& message);
    virtual ~RequestError() = default;

    ErrorKind kind() const { return error_kind; }

    /**
     * Short type name, e.g. "ResponseTimeoutError"
     */
    virtual std::string name() const;

    /**
     * Response received before the failure, or nullptr
     */
    std::shared_ptr<Response> response() const { return partial_response; }
    void setResponse(std::shared_ptr<Response> res) { partial_response = std::move(res); }

    /**
     * Status code of the partial response, 0 when there is none
     */
    int status() const;

    uint64_t requestId() const { return request_id; }
    void setRequestId(uint64_t id) { request_id = id; }

private:
    ErrorKind error_kind;
    std::shared_ptr<Response> partial_response;
    uint64_t request_id = 0;
};

/** Conflicting or out-of-range options, rejected before any I/O */
class InvalidOptionError : public RequestError {
public:
    explicit InvalidOptionError(const std::string& message)
        : RequestError(ErrorKind::InvalidOption, message) {}
    std::string name() const override { return "InvalidOptionError"; }
};

/** DNS, TCP, TLS or proxy tunnel failure */
class ConnectError : public RequestError {
public:
    explicit ConnectError(const std::string& message)
        : RequestError(ErrorKind::Connect, message) {}
    std::string name() const override { return "ConnectError"; }
};

class TimeoutError : public RequestError {
public:
    TimeoutError(TimeoutPhase phase, long timeout_ms, const std::string& message);
    std::string name() const override;

    TimeoutPhase phase() const { return timeout_phase; }
    long timeoutMs() const { return timeout_ms; }

private:
    TimeoutPhase timeout_phase;
    long timeout_ms;
};

/** Malformed credentials or an unusable digest challenge */
class AuthError : public RequestError {
public:
    explicit AuthError(const std::string& message)
        : RequestError(ErrorKind::Auth, message) {}
    std::string name() const override { return "AuthError"; }
};

class TooManyRedirectsError : public RequestError {
public:
    TooManyRedirectsError(int max_redirects, const std::string& message)
        : RequestError(ErrorKind::TooManyRedirects, message), max_redirects(max_redirects) {}
    std::string name() const override { return "TooManyRedirectsError"; }
    int maxRedirects() const { return max_redirects; }

private:
    int max_redirects;
};

/**
 * Body could not be parsed as JSON
 *
 * raw() holds the (decompressed) body text, position() the byte offset
 * where parsing stopped.
 */
class JSONParseError : public RequestError {
public:
    JSONParseError(const std::string& message, std::string raw_body, size_t position)
        : RequestError(ErrorKind::JSONParse, message),
          raw_body(std::move(raw_body)), error_position(position) {}
    std::string name() const override { return "JSONResponseFormatError"; }

    const std::string& raw() const { return raw_body; }
    size_t position() const { return error_position; }

private:
    std::string raw_body;
    size_t error_position;
};

/** A single-use request stream would have to be sent twice */
class StreamReplayError : public RequestError {
public:
    explicit StreamReplayError(const std::string& message)
        : RequestError(ErrorKind::StreamReplay, message) {}
    std::string name() const override { return "StreamReplayError"; }
};

/** Malformed status line, headers or chunk framing */
class ProtocolError : public RequestError {
public:
    explicit ProtocolError(const std::string& message)
        : RequestError(ErrorKind::Protocol, message) {}
    std::string name() const override { return "ProtocolError"; }
};

/** Socket or TLS failure after the connection was established */
class TransferError : public RequestError {
public:
    explicit TransferError(const std::string& message)
        : RequestError(ErrorKind::Transfer, message) {}
    std::string name() const override { return "ResponseError"; }
};

/** Corrupt compressed body */
class DecodeError : public RequestError {
public:
    explicit DecodeError(const std::string& message)
        : RequestError(ErrorKind::Decode, message) {}
    std::string name() const override { return "DecodeError"; }
};

#endif // REQUEST_ERRORS_HPP
