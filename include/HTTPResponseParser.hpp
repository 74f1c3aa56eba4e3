#ifndef HTTP_RESPONSE_PARSER_HPP
#define HTTP_RESPONSE_PARSER_HPP

#include "HeaderMap.hpp"

#include <cstddef>
#include <string>

class Connection;

/**
 * HTTPResponseParser - Reads and parses HTTP/1.x response heads from a Connection
 *
 * Responsibilities:
 * - Read the status line and headers (skipping 1xx interim responses)
 * - Parse response status and headers
 * - Decide connection reuse and body presence
 *
 * The body itself is read incrementally with BodyReader.
 */
class HTTPResponseParser {
public:
    /**
     * Represents a parsed response head
     */
    struct ResponseHead {
        std::string http_version;   // e.g. "HTTP/1.1"
        int status_code;            // HTTP status code (200, 404, etc.)
        std::string status_message; // reason phrase, may be empty
        HeaderMap headers;
        bool valid;                 // Whether parsing succeeded

        ResponseHead() : status_code(0), valid(false) {}
    };

    /**
     * Read the next final response head from the connection
     *
     * Bytes after the blank line stay in the connection buffer for BodyReader.
     *
     * @param conn Connection with a request already written
     * @return Parsed head (always valid)
     * @throws ProtocolError on malformed or oversized heads
     * @throws TransferError on I/O failure or EOF before a complete head
     */
    static ResponseHead readHead(Connection& conn);

    /**
     * Parse a response head (status line + header lines, with or without the
     * trailing blank line)
     *
     * @param head Raw head text
     * @return ResponseHead with valid=false on malformed input
     */
    static ResponseHead parseHead(const std::string& head);

    /**
     * Check if response indicates connection should be kept alive
     *
     * @param head Parsed response head
     * @return true if connection should persist, false otherwise
     */
    static bool shouldKeepAlive(const ResponseHead& head);

    /**
     * Check if response should have no body based on status code and method
     * (HEAD requests, 1xx Informational, 204 No Content, 304 Not Modified)
     */
    static bool shouldHaveNoBody(int status_code, const std::string& request_method);

    /**
     * Check if response uses chunked transfer encoding
     */
    static bool isChunked(const HeaderMap& headers);

    static constexpr size_t kMaxHeadSize = 64 * 1024;
};

/**
 * BodyReader - Incremental reader for one response body
 *
 * Handles the three framing methods:
 * 1. Content-Length (fixed size)
 * 2. Transfer-Encoding: chunked
 * 3. Read until connection closes (HTTP/1.0 style)
 */
class BodyReader {
public:
    /**
     * @param conn Connection positioned right after the response head
     * @param head Parsed response head
     * @param request_method Method of the request (HEAD responses carry no body)
     * @throws ProtocolError when Content-Length is malformed
     */
    BodyReader(Connection& conn, const HTTPResponseParser::ResponseHead& head,
               const std::string& request_method);

    /**
     * Read the next piece of the body
     *
     * @return Body bytes, or an empty string once the body is complete
     * @throws ProtocolError on broken chunk framing
     * @throws TransferError on I/O failure or premature EOF
     */
    std::string next();

    /**
     * Read and discard the rest of the body
     */
    void drain();

    bool done() const { return state == State::Done; }

    /**
     * Whether the body had explicit framing, so the connection can carry
     * another request once done() is true
     */
    bool framed() const { return mode != Mode::UntilClose; }

    /**
     * Body bytes delivered so far (after chunk decoding)
     */
    size_t bytesRead() const { return total; }

private:
    enum class Mode {
        None,
        Length,
        Chunked,
        UntilClose
    };

    enum class State {
        ChunkSize,
        ChunkData,
        ChunkDataEnd,
        Trailers,
        Body,
        Done
    };

    bool readLine(std::string& line);
    std::string take(size_t limit);

    Connection& conn;
    Mode mode;
    State state;
    size_t remaining;
    size_t total;
};

#endif // HTTP_RESPONSE_PARSER_HPP
