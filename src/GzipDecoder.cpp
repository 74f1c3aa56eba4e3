#include "GzipDecoder.hpp"

#include <cstring>

GzipDecoder::GzipDecoder() : initialized(false), done(false) {
    std::memset(&stream, 0, sizeof(stream));
    // 16 + MAX_WBITS: expect a gzip header and trailer
    if (inflateInit2(&stream, 16 + MAX_WBITS) == Z_OK) {
        initialized = true;
    } else {
        error = "inflateInit2 failed";
    }
}

GzipDecoder::~GzipDecoder() {
    if (initialized) {
        inflateEnd(&stream);
    }
}

GzipDecoder::Result GzipDecoder::write(const char* in, size_t length, std::string& out) {
    if (!initialized) {
        return Result::kError;
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in));
    stream.avail_in = static_cast<uInt>(length);

    char buf[16384];
    while (stream.avail_in > 0) {
        // Another member starts after the previous one ended
        if (done) {
            if (inflateReset(&stream) != Z_OK) {
                error = "inflateReset failed";
                return Result::kError;
            }
            done = false;
        }

        stream.next_out = reinterpret_cast<Bytef*>(buf);
        stream.avail_out = sizeof(buf);

        int rc = inflate(&stream, Z_NO_FLUSH);
        out.append(buf, sizeof(buf) - stream.avail_out);

        if (rc == Z_STREAM_END) {
            done = true;
            continue;
        }
        if (rc == Z_BUF_ERROR) {
            // No progress possible: all input consumed into zlib's window
            break;
        }
        if (rc != Z_OK) {
            error = stream.msg != nullptr ? stream.msg : "invalid gzip data";
            return Result::kError;
        }
    }

    // Flush output still pending for the consumed input
    while (!done) {
        stream.next_out = reinterpret_cast<Bytef*>(buf);
        stream.avail_out = sizeof(buf);
        int rc = inflate(&stream, Z_NO_FLUSH);
        size_t produced = sizeof(buf) - stream.avail_out;
        out.append(buf, produced);
        if (rc == Z_STREAM_END) {
            done = true;
            break;
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            error = stream.msg != nullptr ? stream.msg : "invalid gzip data";
            return Result::kError;
        }
        if (produced == 0) {
            break;
        }
    }

    return done ? Result::kDone : Result::kOk;
}

GzipDecoder::Result GzipDecoder::finish() {
    if (!initialized) {
        return Result::kError;
    }
    if (!done) {
        error = "unexpected end of gzip stream";
        return Result::kNeedMoreInput;
    }
    return Result::kDone;
}
