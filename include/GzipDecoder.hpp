#ifndef GZIP_DECODER_HPP
#define GZIP_DECODER_HPP

#include <cstddef>
#include <string>

#include <zlib.h>

/**
 * GzipDecoder - Streaming gzip inflater on top of zlib
 *
 * Feed compressed bytes with write() as they arrive and call finish() after
 * the last piece. Concatenated gzip members are decoded back to back.
 */
class GzipDecoder {
public:
    enum class Result {
        kOk,            // input consumed, more members or bytes may follow
        kNeedMoreInput, // finish() called before the stream ended
        kDone,          // end of the gzip stream reached
        kError          // corrupt input, see lastError()
    };

    GzipDecoder();
    ~GzipDecoder();

    GzipDecoder(const GzipDecoder&) = delete;
    GzipDecoder& operator=(const GzipDecoder&) = delete;

    /**
     * Inflate a piece of compressed input
     *
     * @param in Compressed bytes
     * @param length Number of bytes
     * @param out Decompressed bytes are appended here
     * @return kOk, kDone or kError
     */
    Result write(const char* in, size_t length, std::string& out);

    /**
     * Signal the end of input
     *
     * @return kDone when the stream was complete, kNeedMoreInput when it was truncated
     */
    Result finish();

    bool isDone() const { return done; }
    const std::string& lastError() const { return error; }

private:
    z_stream stream;
    bool initialized;
    bool done;
    std::string error;
};

#endif // GZIP_DECODER_HPP
