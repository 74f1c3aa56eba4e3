#include "ResponseDecoder.hpp"
#include "RequestErrors.hpp"
#include "support/TestServer.hpp"

#include <gtest/gtest.h>

using test_support::TestServer;

namespace {

class RecordingStream : public WritableStream {
public:
    bool write(const char* data, size_t length) override {
        received.append(data, length);
        return !reject;
    }

    void end(std::function<void(std::exception_ptr)> on_finish) override {
        on_finish(nullptr);
    }

    std::string received;
    bool reject = false;
};

HeaderMap headersWith(const std::string& name, const std::string& value) {
    HeaderMap headers;
    headers.set(name, value);
    return headers;
}

}

TEST(ResponseDecoderTest, BufferIsDefault) {
    DecodePolicy policy;
    ResponseData data = ResponseDecoder::decode("raw\x01""bytes", policy, HeaderMap());
    ASSERT_TRUE(std::holds_alternative<std::vector<char>>(data));
    auto& bytes = std::get<std::vector<char>>(data);
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "raw\x01""bytes");
}

TEST(ResponseDecoderTest, InflatesGzipAcrossPieces) {
    DecodePolicy policy;
    policy.gzip = true;
    policy.data_type = DataType::Text;

    std::string plain(20000, 'z');
    plain += "tail";
    std::string compressed = TestServer::gzip(plain);

    ResponseDecoder decoder(policy, headersWith("Content-Encoding", "gzip"), nullptr);
    for (size_t i = 0; i < compressed.size(); i += 7) {
        decoder.feed(compressed.substr(i, 7));
    }
    ResponseData data = decoder.finish();
    EXPECT_EQ(std::get<std::string>(data), plain);
}

TEST(ResponseDecoderTest, GzipOnlyWhenRequestedAndLabelled) {
    std::string compressed = TestServer::gzip("hello");

    DecodePolicy off;
    off.data_type = DataType::Text;
    EXPECT_EQ(std::get<std::string>(ResponseDecoder::decode(compressed, off,
                                                            headersWith("Content-Encoding", "gzip"))),
              compressed);

    DecodePolicy on = off;
    on.gzip = true;
    EXPECT_EQ(std::get<std::string>(ResponseDecoder::decode("hello", on, HeaderMap())), "hello");
    EXPECT_EQ(std::get<std::string>(ResponseDecoder::decode(compressed, on,
                                                            headersWith("Content-Encoding", "x-gzip"))),
              "hello");
}

TEST(ResponseDecoderTest, CorruptOrTruncatedGzip) {
    DecodePolicy policy;
    policy.gzip = true;
    HeaderMap headers = headersWith("Content-Encoding", "gzip");

    EXPECT_THROW(ResponseDecoder::decode("definitely not gzip", policy, headers), DecodeError);

    std::string compressed = TestServer::gzip(std::string(4096, 'q'));
    EXPECT_THROW(ResponseDecoder::decode(compressed.substr(0, compressed.size() / 2), policy, headers),
                 DecodeError);

    // An empty body labelled gzip decodes to nothing
    ResponseData empty = ResponseDecoder::decode("", policy, headers);
    EXPECT_TRUE(std::get<std::vector<char>>(empty).empty());
}

TEST(ResponseDecoderTest, ParsesJson) {
    DecodePolicy policy;
    policy.data_type = DataType::Json;
    ResponseData data = ResponseDecoder::decode("{\"ok\":true,\"n\":[1,2]}", policy, HeaderMap());
    const Json::Value& json = std::get<Json::Value>(data);
    EXPECT_TRUE(json["ok"].asBool());
    EXPECT_EQ(json["n"].size(), 2u);
}

TEST(ResponseDecoderTest, EmptyJsonBodyIsNull) {
    EXPECT_TRUE(ResponseDecoder::parseJson("", false).isNull());
    EXPECT_TRUE(ResponseDecoder::parseJson("  \r\n", false).isNull());
}

TEST(ResponseDecoderTest, InvalidJsonKeepsRawBody) {
    try {
        ResponseDecoder::parseJson("<html>oops</html>", false);
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.raw(), "<html>oops</html>");
        EXPECT_EQ(e.name(), "JSONResponseFormatError");
        EXPECT_EQ(e.kind(), ErrorKind::JSONParse);
    }
}

TEST(ResponseDecoderTest, TrailingDataAfterJsonValue) {
    try {
        ResponseDecoder::parseJson("{\"a\":1} garbage", false);
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.position(), 8u);
        EXPECT_EQ(e.raw(), "{\"a\":1} garbage");
    }

    try {
        ResponseDecoder::parseJson("{\"a\":1}{\"b\":2}", false);
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.position(), 7u);
    }

    EXPECT_THROW(ResponseDecoder::parseJson("[1,2] 3", false), JSONParseError);
    EXPECT_THROW(ResponseDecoder::parseJson("{\"a\":1} // note", false), JSONParseError);
    EXPECT_EQ(ResponseDecoder::parseJson("{\"a\":1}\r\n", false)["a"].asInt(), 1);
}

TEST(ResponseDecoderTest, ScalarRootsAreAccepted) {
    EXPECT_EQ(ResponseDecoder::parseJson("42", false).asInt(), 42);
    EXPECT_EQ(ResponseDecoder::parseJson("\"hi\"", false).asString(), "hi");
    EXPECT_TRUE(ResponseDecoder::parseJson("null", false).isNull());
}

TEST(ResponseDecoderTest, ErrorPositionCountsLines) {
    try {
        ResponseDecoder::parseJson("{\n\"a\": tru\n}", false);
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_GE(e.position(), 2u);
        EXPECT_LT(e.position(), 13u);
    }
}

TEST(ResponseDecoderTest, ControlCharactersInStrings) {
    std::string body = "{\"a\":\"x\ty\"}";
    try {
        ResponseDecoder::parseJson(body, false);
        FAIL() << "expected JSONParseError";
    } catch (const JSONParseError& e) {
        EXPECT_EQ(e.position(), 7u);
        EXPECT_EQ(e.raw(), body);
    }

    Json::Value fixed = ResponseDecoder::parseJson(body, true);
    EXPECT_EQ(fixed["a"].asString(), "xy");

    // Whitespace between tokens is fine without fixing
    EXPECT_EQ(ResponseDecoder::parseJson("{\n\t\"a\": 1\n}", false)["a"].asInt(), 1);
}

TEST(ResponseDecoderTest, StripControlChars) {
    EXPECT_EQ(ResponseDecoder::stripControlChars(std::string("a\x00""b\x1f""c\x20", 6)), "abc ");
}

TEST(ResponseDecoderTest, TextUsesCharset) {
    DecodePolicy policy;
    policy.data_type = DataType::Text;

    ResponseData latin = ResponseDecoder::decode("caf\xE9", policy,
                                                 headersWith("Content-Type", "text/plain; charset=ISO-8859-1"));
    EXPECT_EQ(std::get<std::string>(latin), "caf\xC3\xA9");

    ResponseData utf8 = ResponseDecoder::decode("caf\xC3\xA9", policy, headersWith("Content-Type", "text/plain"));
    EXPECT_EQ(std::get<std::string>(utf8), "caf\xC3\xA9");

    EXPECT_EQ(ResponseDecoder::decodeText("bytes", "x-no-such-charset"), "bytes");
}

TEST(ResponseDecoderTest, PipesToWriteStream) {
    DecodePolicy policy;
    policy.gzip = true;
    policy.data_type = DataType::Json;
    auto sink = std::make_shared<RecordingStream>();

    ResponseDecoder decoder(policy, headersWith("Content-Encoding", "gzip"), sink);
    decoder.feed(TestServer::gzip("not even json"));
    ResponseData data = decoder.finish();

    EXPECT_TRUE(std::holds_alternative<std::monostate>(data));
    EXPECT_EQ(sink->received, "not even json");
}

TEST(ResponseDecoderTest, RejectingWriteStreamStopsTransfer) {
    auto sink = std::make_shared<RecordingStream>();
    sink->reject = true;
    ResponseDecoder decoder(DecodePolicy{}, HeaderMap(), sink);
    EXPECT_THROW(decoder.feed("abc"), TransferError);
}
