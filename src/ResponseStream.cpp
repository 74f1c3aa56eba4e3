#include "ResponseStream.hpp"
#include "CancelToken.hpp"
#include "RequestErrors.hpp"

ResponseStream::ResponseStream(ConnectionHandle conn_handle, const HTTPResponseParser::ResponseHead& head,
                               const std::string& request_method, bool reusable)
    : handle(std::move(conn_handle)), reusable(reusable) {
    // The attempt that opened the connection is over; reads from here on are the caller's
    handle->setCancelToken(std::make_shared<CancelToken>());
    reader = std::make_unique<BodyReader>(*handle, head, request_method);
    if (reader->done()) {
        finish();
    }
}

ResponseStream::~ResponseStream() {
    // reader refers to the connection, so it goes first
    reader.reset();
}

std::string ResponseStream::read() {
    std::lock_guard<std::mutex> lock(mtx);
    if (closed) {
        return "";
    }

    try {
        std::string piece = reader->next();
        if (reader->done()) {
            finish();
        }
        return piece;
    } catch (const RequestError&) {
        closed = true;
        handle.destroy();
        throw;
    }
}

std::string ResponseStream::readAll() {
    std::string body;
    while (true) {
        std::string piece = read();
        if (piece.empty()) {
            return body;
        }
        body += piece;
    }
}

void ResponseStream::close() {
    std::lock_guard<std::mutex> lock(mtx);
    if (closed) {
        return;
    }
    closed = true;
    handle.destroy();
}

bool ResponseStream::finished() const {
    std::lock_guard<std::mutex> lock(mtx);
    return closed;
}

size_t ResponseStream::bytesRead() const {
    std::lock_guard<std::mutex> lock(mtx);
    return reader ? reader->bytesRead() : 0;
}

void ResponseStream::finish() {
    closed = true;
    if (reusable && reader->framed()) {
        handle.release();
    } else {
        handle.destroy();
    }
}
