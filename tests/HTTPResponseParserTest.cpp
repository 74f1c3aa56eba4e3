#include "Connection.hpp"
#include "HTTPResponseParser.hpp"
#include "RequestErrors.hpp"

#include <memory>

#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace {

// Connection over one end of a socketpair; the other end is pre-filled and closed
std::unique_ptr<Connection> connectionReading(const std::string& wire) {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        return nullptr;
    }
    size_t sent = 0;
    while (sent < wire.size()) {
        ssize_t n = write(fds[1], wire.data() + sent, wire.size() - sent);
        if (n <= 0) {
            break;
        }
        sent += static_cast<size_t>(n);
    }
    close(fds[1]);
    return std::make_unique<Connection>(fds[0], "localhost", 80, "127.0.0.1", 80);
}

std::string readBody(Connection& conn, const HTTPResponseParser::ResponseHead& head,
                     const std::string& method = "GET") {
    BodyReader reader(conn, head, method);
    std::string body;
    std::string piece;
    while (!(piece = reader.next()).empty()) {
        body += piece;
    }
    EXPECT_TRUE(reader.done());
    return body;
}

}

TEST(HTTPResponseParserTest, ParsesStatusLineAndHeaders) {
    auto head = HTTPResponseParser::parseHead(
        "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\nSet-Cookie: a=1\r\nSet-Cookie: b=2\r\n\r\n");
    ASSERT_TRUE(head.valid);
    EXPECT_EQ(head.http_version, "HTTP/1.1");
    EXPECT_EQ(head.status_code, 404);
    EXPECT_EQ(head.status_message, "Not Found");
    EXPECT_EQ(head.headers.get("content-type").value_or(""), "text/plain");
    EXPECT_EQ(head.headers.getAll("Set-Cookie").size(), 2u);
}

TEST(HTTPResponseParserTest, EmptyReasonPhrase) {
    auto head = HTTPResponseParser::parseHead("HTTP/1.1 204\r\n\r\n");
    ASSERT_TRUE(head.valid);
    EXPECT_EQ(head.status_code, 204);
    EXPECT_EQ(head.status_message, "");
}

TEST(HTTPResponseParserTest, FoldedHeaderContinuesValue) {
    auto head = HTTPResponseParser::parseHead("HTTP/1.1 200 OK\r\nX-Long: first\r\n  second\r\n\r\n");
    ASSERT_TRUE(head.valid);
    EXPECT_EQ(head.headers.get("X-Long").value_or(""), "first second");
}

TEST(HTTPResponseParserTest, RejectsMalformedHeads) {
    EXPECT_FALSE(HTTPResponseParser::parseHead("ICY 200 OK\r\n\r\n").valid);
    EXPECT_FALSE(HTTPResponseParser::parseHead("HTTP/1.1 2x0 OK\r\n\r\n").valid);
    EXPECT_FALSE(HTTPResponseParser::parseHead("HTTP/1.1 200 OK\r\nno colon here\r\n\r\n").valid);
}

TEST(HTTPResponseParserTest, KeepAliveRules) {
    auto http11 = HTTPResponseParser::parseHead("HTTP/1.1 200 OK\r\n\r\n");
    EXPECT_TRUE(HTTPResponseParser::shouldKeepAlive(http11));

    auto closing = HTTPResponseParser::parseHead("HTTP/1.1 200 OK\r\nConnection: close\r\n\r\n");
    EXPECT_FALSE(HTTPResponseParser::shouldKeepAlive(closing));

    auto http10 = HTTPResponseParser::parseHead("HTTP/1.0 200 OK\r\n\r\n");
    EXPECT_FALSE(HTTPResponseParser::shouldKeepAlive(http10));

    auto http10_keep = HTTPResponseParser::parseHead("HTTP/1.0 200 OK\r\nConnection: Keep-Alive\r\n\r\n");
    EXPECT_TRUE(HTTPResponseParser::shouldKeepAlive(http10_keep));
}

TEST(HTTPResponseParserTest, BodylessResponses) {
    EXPECT_TRUE(HTTPResponseParser::shouldHaveNoBody(200, "HEAD"));
    EXPECT_TRUE(HTTPResponseParser::shouldHaveNoBody(204, "GET"));
    EXPECT_TRUE(HTTPResponseParser::shouldHaveNoBody(304, "GET"));
    EXPECT_FALSE(HTTPResponseParser::shouldHaveNoBody(200, "GET"));

    HeaderMap headers;
    headers.set("Transfer-Encoding", "gzip, chunked");
    EXPECT_TRUE(HTTPResponseParser::isChunked(headers));
    EXPECT_FALSE(HTTPResponseParser::isChunked(HeaderMap()));
}

TEST(HTTPResponseParserTest, ReadsHeadAndSkipsInterimResponses) {
    auto conn = connectionReading("HTTP/1.1 100 Continue\r\n\r\n"
                                  "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello");
    ASSERT_NE(conn, nullptr);
    auto head = HTTPResponseParser::readHead(*conn);
    EXPECT_EQ(head.status_code, 200);
    EXPECT_EQ(readBody(*conn, head), "hello");
}

TEST(HTTPResponseParserTest, ClosedBeforeResponse) {
    auto conn = connectionReading("");
    ASSERT_NE(conn, nullptr);
    EXPECT_THROW(HTTPResponseParser::readHead(*conn), TransferError);
}

TEST(HTTPResponseParserTest, ReadsChunkedBodyWithTrailers) {
    auto conn = connectionReading("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                                  "5;ext=1\r\nhello\r\n6\r\n world\r\n0\r\nX-Trailer: t\r\n\r\n");
    ASSERT_NE(conn, nullptr);
    auto head = HTTPResponseParser::readHead(*conn);
    EXPECT_EQ(readBody(*conn, head), "hello world");
}

TEST(HTTPResponseParserTest, ReadsUntilCloseWithoutLength) {
    auto conn = connectionReading("HTTP/1.0 200 OK\r\n\r\nstreamed until close");
    ASSERT_NE(conn, nullptr);
    auto head = HTTPResponseParser::readHead(*conn);
    BodyReader reader(*conn, head, "GET");
    EXPECT_FALSE(reader.framed());
    std::string body;
    std::string piece;
    while (!(piece = reader.next()).empty()) {
        body += piece;
    }
    EXPECT_EQ(body, "streamed until close");
    EXPECT_EQ(reader.bytesRead(), body.size());
}

TEST(HTTPResponseParserTest, PrematureCloseInsideBody) {
    auto conn = connectionReading("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
    ASSERT_NE(conn, nullptr);
    auto head = HTTPResponseParser::readHead(*conn);
    BodyReader reader(*conn, head, "GET");
    EXPECT_THROW(reader.drain(), TransferError);
}

TEST(HTTPResponseParserTest, InvalidFraming) {
    auto bad_length = connectionReading("HTTP/1.1 200 OK\r\nContent-Length: ten\r\n\r\n");
    ASSERT_NE(bad_length, nullptr);
    auto head = HTTPResponseParser::readHead(*bad_length);
    EXPECT_THROW(BodyReader(*bad_length, head, "GET"), ProtocolError);

    auto bad_chunk = connectionReading("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
    ASSERT_NE(bad_chunk, nullptr);
    auto chunked_head = HTTPResponseParser::readHead(*bad_chunk);
    BodyReader reader(*bad_chunk, chunked_head, "GET");
    EXPECT_THROW(reader.next(), ProtocolError);
}

TEST(HTTPResponseParserTest, HeadResponseHasNoBody) {
    auto conn = connectionReading("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n");
    ASSERT_NE(conn, nullptr);
    auto head = HTTPResponseParser::readHead(*conn);
    BodyReader reader(*conn, head, "HEAD");
    EXPECT_TRUE(reader.done());
    EXPECT_EQ(reader.next(), "");
}
