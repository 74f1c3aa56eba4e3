#ifndef RESPONSE_HPP
#define RESPONSE_HPP

#include "HeaderMap.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/json.h>

class ResponseStream;

/**
 * Milestones of one logical request, in milliseconds since it started
 *
 * Values of -1 mark milestones that were never reached (e.g. dns_lookup
 * when a pooled connection was reused).
 */
struct TimingRecord {
    double queuing = -1;          // worker picked the request up
    double dns_lookup = -1;       // host resolved
    double connected = -1;        // TCP (and TLS) established
    double request_sent = -1;     // request fully written
    double waiting = -1;          // first response byte
    double content_download = -1; // body fully consumed
};

/**
 * Metadata of the final response of a request
 */
struct Response {
    int status_code = 0;
    std::string status_message;
    std::string http_version;
    HeaderMap headers;

    std::string url;                        // final URL after redirects
    std::vector<std::string> request_urls;  // every URL attempted, in order

    size_t size = 0;                // raw (still encoded) body bytes received
    double rt = 0;                  // total milliseconds
    bool keep_alive_socket = false; // connection was taken from a pool
    std::string remote_address;
    int remote_port = 0;
    uint64_t request_id = 0;

    std::optional<TimingRecord> timing;

    // Live body when the request was made with streaming=true
    std::shared_ptr<ResponseStream> stream;
};

/**
 * Decoded body: nothing (write stream / streaming), raw bytes, text or JSON
 */
using ResponseData = std::variant<std::monostate, std::vector<char>, std::string, Json::Value>;

/**
 * Successful outcome of a request
 */
struct Result {
    ResponseData data;
    std::shared_ptr<Response> res;

    bool hasBuffer() const { return std::holds_alternative<std::vector<char>>(data); }
    bool hasText() const { return std::holds_alternative<std::string>(data); }
    bool hasJson() const { return std::holds_alternative<Json::Value>(data); }

    const std::vector<char>& buffer() const { return std::get<std::vector<char>>(data); }
    const std::string& text() const { return std::get<std::string>(data); }
    const Json::Value& json() const { return std::get<Json::Value>(data); }

    /**
     * Body as a string regardless of whether it was kept as bytes or text
     */
    std::string bodyString() const;
};

#endif // RESPONSE_HPP
