#ifndef RESPONSE_STREAM_HPP
#define RESPONSE_STREAM_HPP

#include "ConnectionProvider.hpp"
#include "HTTPResponseParser.hpp"

#include <memory>
#include <mutex>
#include <string>

/**
 * ResponseStream - Live response body handed to the caller in streaming mode
 *
 * Owns the connection the body arrives on. Reading to the end returns a
 * reusable connection to its pool; closing early (or destroying the stream
 * before the end) closes the connection. The body is delivered exactly as
 * received, without content decoding.
 */
class ResponseStream {
public:
    ResponseStream(ConnectionHandle handle, const HTTPResponseParser::ResponseHead& head,
                   const std::string& request_method, bool reusable);
    ~ResponseStream();

    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;

    /**
     * Next piece of the body
     *
     * @return Body bytes, empty string once the body is complete
     * @throws TransferError / ProtocolError when the transfer breaks
     */
    std::string read();

    /**
     * Read everything that is left
     */
    std::string readAll();

    /**
     * Abandon the rest of the body and close the connection
     */
    void close();

    bool finished() const;
    size_t bytesRead() const;

private:
    void finish();

    mutable std::mutex mtx;
    ConnectionHandle handle;
    std::unique_ptr<BodyReader> reader;
    bool reusable;
    bool closed = false;
};

#endif // RESPONSE_STREAM_HPP
