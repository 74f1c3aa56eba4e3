#include "HTTPResponseParser.hpp"
#include "Connection.hpp"
#include "RequestErrors.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>

using namespace utils;

// ============================================================================
// Public Methods
// ============================================================================

HTTPResponseParser::ResponseHead HTTPResponseParser::readHead(Connection& conn) {
    std::string& buffer = conn.buffer();

    while (true) {
        // Step 1: Accumulate until the blank line that ends the head
        size_t header_end = buffer.find("\r\n\r\n");
        while (header_end == std::string::npos) {
            if (buffer.size() > kMaxHeadSize) {
                throw ProtocolError("response head exceeds " + std::to_string(kMaxHeadSize) + " bytes");
            }
            if (!conn.fill()) {
                if (buffer.empty()) {
                    throw TransferError("socket hang up: connection closed before any response");
                }
                throw TransferError("connection closed in the middle of the response head");
            }
            header_end = buffer.find("\r\n\r\n");
        }

        std::string raw = buffer.substr(0, header_end + 4);
        buffer.erase(0, header_end + 4);

        // Step 2: Parse status line and headers
        ResponseHead head = parseHead(raw);
        if (!head.valid) {
            std::string first_line = raw.substr(0, raw.find("\r\n"));
            throw ProtocolError("malformed response head: " + first_line);
        }

        // Step 3: Skip interim responses (100 Continue, 103 Early Hints)
        if (head.status_code >= 100 && head.status_code < 200 && head.status_code != 101) {
            continue;
        }
        return head;
    }
}

HTTPResponseParser::ResponseHead HTTPResponseParser::parseHead(const std::string& head) {
    ResponseHead response;

    size_t line_end = head.find("\r\n");
    std::string status_line = head.substr(0, line_end);

    // Parse status line: "HTTP/1.1 200 OK"
    if (!startsWith(status_line, "HTTP/")) {
        return response;
    }
    size_t space1 = status_line.find(' ');
    if (space1 == std::string::npos) {
        return response;
    }
    response.http_version = status_line.substr(0, space1);

    size_t space2 = status_line.find(' ', space1 + 1);
    std::string status_str = status_line.substr(space1 + 1,
        space2 == std::string::npos ? std::string::npos : space2 - space1 - 1);
    if (status_str.size() != 3 ||
        !std::all_of(status_str.begin(), status_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return response;
    }
    response.status_code = std::stoi(status_str);
    if (space2 != std::string::npos) {
        response.status_message = status_line.substr(space2 + 1);
    }

    // Parse header lines
    size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    std::string last_name;
    while (pos < head.size()) {
        size_t end = head.find("\r\n", pos);
        if (end == std::string::npos) {
            end = head.size();
        }
        std::string line = head.substr(pos, end - pos);
        pos = end + 2;

        if (line.empty()) {
            break;
        }

        // Obsolete line folding continues the previous value
        if (line[0] == ' ' || line[0] == '\t') {
            if (last_name.empty()) {
                return response;
            }
            auto values = response.headers.getAll(last_name);
            std::string folded = values.back() + " " + trim(line);
            response.headers.remove(last_name);
            for (size_t i = 0; i + 1 < values.size(); i++) {
                response.headers.append(last_name, values[i]);
            }
            response.headers.append(last_name, folded);
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return response;
        }
        last_name = line.substr(0, colon);
        response.headers.append(last_name, trim(line.substr(colon + 1)));
    }

    response.valid = true;
    return response;
}

bool HTTPResponseParser::shouldKeepAlive(const ResponseHead& head) {
    std::string lower_conn = toLower(head.headers.get("Connection").value_or(""));

    if (head.http_version == "HTTP/1.0") {
        return lower_conn.find("keep-alive") != std::string::npos;
    }

    // HTTP/1.1: default is keep-alive unless "close" specified
    return lower_conn.find("close") == std::string::npos;
}

bool HTTPResponseParser::shouldHaveNoBody(int status_code, const std::string& request_method) {
    // Responses that MUST NOT have a body:
    // - responses to HEAD
    // - 1xx (Informational)
    // - 204 (No Content)
    // - 304 (Not Modified)
    return request_method == "HEAD" ||
           (status_code >= 100 && status_code < 200) ||
           status_code == 204 ||
           status_code == 304;
}

bool HTTPResponseParser::isChunked(const HeaderMap& headers) {
    for (const auto& value : headers.getAll("Transfer-Encoding")) {
        if (toLower(value).find("chunked") != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// BodyReader
// ============================================================================

BodyReader::BodyReader(Connection& conn, const HTTPResponseParser::ResponseHead& head,
                       const std::string& request_method)
    : conn(conn), mode(Mode::None), state(State::Done), remaining(0), total(0) {

    if (HTTPResponseParser::shouldHaveNoBody(head.status_code, request_method)) {
        return;
    }

    // Case A: Chunked Transfer-Encoding
    if (HTTPResponseParser::isChunked(head.headers)) {
        mode = Mode::Chunked;
        state = State::ChunkSize;
        return;
    }

    // Case B: Content-Length specified
    auto length = head.headers.get("Content-Length");
    if (length) {
        std::string value = trim(*length);
        if (value.empty() || value.size() > 19 ||
            !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw ProtocolError("invalid Content-Length: " + *length);
        }
        mode = Mode::Length;
        remaining = static_cast<size_t>(std::stoull(value));
        state = remaining == 0 ? State::Done : State::Body;
        return;
    }

    // Case C: Read until connection closes (HTTP/1.0 style)
    mode = Mode::UntilClose;
    state = State::Body;
}

std::string BodyReader::next() {
    while (true) {
        switch (state) {
            case State::Done:
                return "";

            case State::Body: {
                if (conn.buffer().empty() && !conn.fill()) {
                    if (mode == Mode::UntilClose) {
                        state = State::Done;
                        return "";
                    }
                    throw TransferError("premature close: " + std::to_string(remaining) +
                                        " body bytes missing");
                }
                if (mode == Mode::UntilClose) {
                    return take(conn.buffer().size());
                }
                std::string piece = take(remaining);
                remaining -= piece.size();
                if (remaining == 0) {
                    state = State::Done;
                }
                return piece;
            }

            case State::ChunkSize: {
                std::string line;
                if (!readLine(line)) {
                    throw TransferError("premature close while reading chunk size");
                }

                // Strip chunk extensions (e.g., "1A;foo=bar" -> "1A")
                size_t semicolon = line.find(';');
                if (semicolon != std::string::npos) {
                    line = line.substr(0, semicolon);
                }
                line = trim(line);
                if (line.empty() || line.size() > 15 ||
                    !std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isxdigit(c); })) {
                    throw ProtocolError("invalid chunk size: '" + line + "'");
                }

                remaining = static_cast<size_t>(std::stoull(line, nullptr, 16));
                state = remaining == 0 ? State::Trailers : State::ChunkData;
                break;
            }

            case State::ChunkData: {
                if (conn.buffer().empty() && !conn.fill()) {
                    throw TransferError("premature close inside a chunk");
                }
                std::string piece = take(remaining);
                remaining -= piece.size();
                if (remaining == 0) {
                    state = State::ChunkDataEnd;
                }
                return piece;
            }

            case State::ChunkDataEnd: {
                std::string line;
                if (!readLine(line)) {
                    throw TransferError("premature close after chunk data");
                }
                if (!line.empty()) {
                    throw ProtocolError("missing CRLF after chunk data");
                }
                state = State::ChunkSize;
                break;
            }

            case State::Trailers: {
                // Trailer fields are read and ignored up to the blank line
                std::string line;
                if (!readLine(line)) {
                    throw TransferError("premature close in chunked trailer");
                }
                if (line.empty()) {
                    state = State::Done;
                }
                break;
            }
        }
    }
}

void BodyReader::drain() {
    while (!next().empty()) {
    }
}

// ============================================================================
// Buffered Reading Helpers
// ============================================================================

bool BodyReader::readLine(std::string& line) {
    std::string& buffer = conn.buffer();
    line.clear();

    while (true) {
        // Check if we have a complete line in buffer
        size_t pos = buffer.find("\r\n");
        if (pos != std::string::npos) {
            line = buffer.substr(0, pos);
            buffer.erase(0, pos + 2);
            return true;
        }
        if (buffer.size() > HTTPResponseParser::kMaxHeadSize) {
            throw ProtocolError("chunk framing line too long");
        }

        // Need more data
        if (!conn.fill()) {
            return false;
        }
    }
}

std::string BodyReader::take(size_t limit) {
    std::string& buffer = conn.buffer();
    size_t n = std::min(limit, buffer.size());
    std::string piece = buffer.substr(0, n);
    buffer.erase(0, n);
    total += n;
    return piece;
}
