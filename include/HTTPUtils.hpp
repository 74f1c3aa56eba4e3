#pragma once
#include <string>
#include <string_view>

class HeaderMap;

namespace http_utils {
/**
 * Serialize a request head
 *
 * @param method Request method, e.g. "GET"
 * @param target Request target (origin-form path or absolute-form URL)
 * @param headers Header fields in send order
 * @return "METHOD target HTTP/1.1\r\n" + headers + "\r\n"
 */
std::string buildRequestHead(std::string_view method, std::string_view target,
                             const HeaderMap& headers);

/**
 * Check that a string is a valid HTTP token (method or header name)
 */
bool isToken(std::string_view value);

/**
 * Check that a header value contains no CR, LF or other control bytes
 * (horizontal tab is allowed)
 */
bool isValidHeaderValue(std::string_view value);

/**
 * Extract a parameter from a header value such as
 * "text/html; charset=ISO-8859-1"
 *
 * @param header_value Full header value
 * @param param_name Parameter name (case-insensitive)
 * @return Unquoted parameter value, or empty string if not found
 */
std::string headerParam(std::string_view header_value, std::string_view param_name);

/**
 * Encode a chunk for Transfer-Encoding: chunked
 */
std::string encodeChunk(const char* data, size_t length);
} // namespace http_utils
