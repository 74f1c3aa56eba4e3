#include "ResponseDecoder.hpp"
#include "HTTPUtils.hpp"
#include "RequestErrors.hpp"
#include "StringUtils.hpp"

#include <iconv.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <memory>

using namespace utils;

namespace {

// Byte offset of the first "* Line L, Column C" location in a jsoncpp error report
size_t errorOffset(const std::string& text, const std::string& errors) {
    int line = 0;
    int column = 0;
    auto at = errors.find("Line ");
    if (at == std::string::npos ||
        std::sscanf(errors.c_str() + at, "Line %d, Column %d", &line, &column) != 2 || line < 1 || column < 1) {
        return 0;
    }

    size_t offset = 0;
    for (int current = 1; current < line && offset < text.size(); offset++) {
        if (text[offset] == '\n') {
            current++;
        }
    }
    return std::min(offset + static_cast<size_t>(column - 1), text.size());
}

// Offset of the first raw control character inside a JSON string literal
std::string::size_type findControlCharInString(const std::string& text) {
    bool in_string = false;
    bool escaped = false;
    for (std::string::size_type i = 0; i < text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!in_string) {
            if (c == '"') {
                in_string = true;
            }
            continue;
        }
        if (escaped) {
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == '"') {
            in_string = false;
        } else if (c < 0x20) {
            return i;
        }
    }
    return std::string::npos;
}

bool isUtf8Label(const std::string& charset) {
    std::string lower = toLower(charset);
    return lower.empty() || lower == "utf-8" || lower == "utf8" || lower == "us-ascii" || lower == "ascii";
}

} // namespace

// ============================================================================
// Incremental decoding
// ============================================================================

ResponseDecoder::ResponseDecoder(const DecodePolicy& policy, const HeaderMap& headers,
                                 std::shared_ptr<WritableStream> sink)
    : policy(policy), sink(std::move(sink)) {
    if (policy.gzip && isGzipEncoded(headers)) {
        gzip = std::make_unique<GzipDecoder>();
    }
    charset = http_utils::headerParam(headers.get("Content-Type").value_or(""), "charset");
}

void ResponseDecoder::feed(const std::string& piece) {
    raw_bytes += piece.size();
    if (!gzip) {
        emit(piece.data(), piece.size());
        return;
    }

    std::string inflated;
    if (gzip->write(piece.data(), piece.size(), inflated) == GzipDecoder::Result::kError) {
        throw DecodeError("gzip decode failed: " + gzip->lastError());
    }
    if (!inflated.empty()) {
        emit(inflated.data(), inflated.size());
    }
}

ResponseData ResponseDecoder::finish() {
    // An empty body labelled gzip is simply empty
    if (gzip && raw_bytes > 0 && gzip->finish() != GzipDecoder::Result::kDone) {
        throw DecodeError("gzip decode failed: " + gzip->lastError());
    }

    if (sink) {
        return std::monostate{};
    }

    switch (policy.data_type) {
        case DataType::Json:
            return parseJson(buffered, policy.fix_control_chars);
        case DataType::Text:
            return decodeText(buffered, charset);
        case DataType::Buffer:
        default:
            return std::vector<char>(buffered.begin(), buffered.end());
    }
}

void ResponseDecoder::emit(const char* data, size_t length) {
    if (sink) {
        if (!sink->write(data, length)) {
            throw TransferError("write stream rejected response data");
        }
        return;
    }
    buffered.append(data, length);
}

// ============================================================================
// One-shot helpers
// ============================================================================

ResponseData ResponseDecoder::decode(const std::string& body, const DecodePolicy& policy, const HeaderMap& headers) {
    ResponseDecoder decoder(policy, headers, nullptr);
    decoder.feed(body);
    return decoder.finish();
}

bool ResponseDecoder::isGzipEncoded(const HeaderMap& headers) {
    std::string encoding = toLower(trim(headers.get("Content-Encoding").value_or("")));
    return encoding == "gzip" || encoding == "x-gzip";
}

Json::Value ResponseDecoder::parseJson(const std::string& text, bool fix_control_chars) {
    std::string input = fix_control_chars ? stripControlChars(text) : text;

    if (input.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Json::Value(Json::nullValue);
    }

    // Step 1: Raw control characters are not allowed inside strings
    if (!fix_control_chars) {
        auto bad = findControlCharInString(input);
        if (bad != std::string::npos) {
            throw JSONParseError("Unexpected control character in JSON string at position " +
                                 std::to_string(bad), text, bad);
        }
    }

    // Step 2: Strict parse, any scalar may be the root, nothing may follow it
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["strictRoot"] = false;
    builder["rejectDupKeys"] = false;
    builder["failIfExtra"] = true;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(input.data(), input.data() + input.size(), &root, &errors)) {
        size_t position = errorOffset(input, errors);
        std::string detail = trim(errors.substr(std::min(errors.find('\n'), errors.size())));
        if (detail.empty()) {
            detail = "invalid JSON";
        }
        throw JSONParseError("Unexpected token in JSON at position " + std::to_string(position) +
                             ": " + detail, text, position);
    }
    return root;
}

std::string ResponseDecoder::stripControlChars(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x20) {
            out.push_back(c);
        }
    }
    return out;
}

std::string ResponseDecoder::decodeText(const std::string& body, const std::string& charset) {
    if (isUtf8Label(charset) || body.empty()) {
        return body;
    }

    iconv_t cd = iconv_open("UTF-8", charset.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        return body;
    }

    std::string out;
    std::string input = body;
    char* in_ptr = input.data();
    size_t in_left = input.size();
    char buf[4096];

    while (in_left > 0) {
        char* out_ptr = buf;
        size_t out_left = sizeof(buf);
        size_t rc = iconv(cd, &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buf, sizeof(buf) - out_left);
        if (rc == static_cast<size_t>(-1)) {
            if (errno == E2BIG) {
                continue;
            }
            // Invalid or truncated sequence: substitute and skip one byte
            out += "\xEF\xBF\xBD";
            in_ptr++;
            in_left--;
        }
    }

    iconv_close(cd);
    return out;
}
