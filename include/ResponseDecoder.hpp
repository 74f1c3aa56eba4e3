#ifndef RESPONSE_DECODER_HPP
#define RESPONSE_DECODER_HPP

#include "GzipDecoder.hpp"
#include "HeaderMap.hpp"
#include "RequestPlan.hpp"
#include "Response.hpp"

#include <memory>
#include <string>

/**
 * ResponseDecoder - Turns raw body pieces into the caller's data
 *
 * One instance consumes one response body: feed() takes pieces as they
 * arrive (inflating gzip when the policy and Content-Encoding ask for it)
 * and either buffers them or pipes them to the caller's WritableStream;
 * finish() produces the final ResponseData.
 */
class ResponseDecoder {
public:
    /**
     * @param policy Decode policy of the request
     * @param headers Response headers (Content-Encoding, Content-Type)
     * @param sink Write stream to pipe to, or nullptr to buffer
     */
    ResponseDecoder(const DecodePolicy& policy, const HeaderMap& headers,
                    std::shared_ptr<WritableStream> sink);

    /**
     * Consume one raw body piece
     *
     * @throws DecodeError on corrupt gzip data
     * @throws TransferError when the write stream rejects data
     */
    void feed(const std::string& piece);

    /**
     * Complete decoding
     *
     * @return Decoded data; std::monostate when piping to a write stream
     * @throws DecodeError for a truncated gzip stream
     * @throws JSONParseError when dataType=json and the body is not JSON
     */
    ResponseData finish();

    /**
     * Decode a complete buffered body in one call
     */
    static ResponseData decode(const std::string& body, const DecodePolicy& policy, const HeaderMap& headers);

    /**
     * Content-Encoding is gzip or x-gzip
     */
    static bool isGzipEncoded(const HeaderMap& headers);

    /**
     * Parse a JSON body
     *
     * An empty (or all-whitespace) body yields null.
     *
     * @param text Body text
     * @param fix_control_chars Remove every U+0000..U+001F byte before parsing
     * @throws JSONParseError with the raw body and byte offset on failure
     */
    static Json::Value parseJson(const std::string& text, bool fix_control_chars);

    /**
     * Remove every byte in the range 0x00-0x1F
     */
    static std::string stripControlChars(const std::string& text);

    /**
     * Convert text in a given charset to UTF-8
     *
     * @param body Raw bytes
     * @param charset Charset label from Content-Type; empty means UTF-8
     * @return UTF-8 text (unchanged when the charset is UTF-8 or unknown)
     */
    static std::string decodeText(const std::string& body, const std::string& charset);

private:
    void emit(const char* data, size_t length);

    DecodePolicy policy;
    std::string charset;
    std::shared_ptr<WritableStream> sink;
    std::unique_ptr<GzipDecoder> gzip;
    std::string buffered;
    size_t raw_bytes = 0;
};

#endif // RESPONSE_DECODER_HPP
