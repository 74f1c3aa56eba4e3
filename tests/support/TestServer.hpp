#ifndef TEST_SERVER_HPP
#define TEST_SERVER_HPP

#include "HeaderMap.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>

namespace test_support {

/**
 * A request as the server received it
 */
struct RecordedRequest {
    std::string method;
    std::string target;     // request target as sent (origin or absolute form)
    std::string version;
    HeaderMap headers;
    std::string body;       // de-chunked
    bool chunked = false;
    int connection_id = 0;  // which accepted connection carried it

    /**
     * Path of the target without the query
     */
    std::string path() const;

    /**
     * Query of the target, "" when absent
     */
    std::string query() const;
};

/**
 * What the handler wants sent back
 */
struct CannedResponse {
    int status = 200;
    std::string reason = "OK";
    HeaderMap headers;
    std::string body;
    bool chunked = false;            // send the body with chunked encoding
    bool close_delimited = false;    // no length, close after the body
    bool close = false;              // close the connection after responding
    int delay_ms = 0;                // wait before sending the head
    int body_delay_ms = 0;           // wait between head and body
    bool hang = false;               // never answer, hold the connection until stop()
};

using RequestHandler = std::function<CannedResponse(const RecordedRequest& request)>;

/**
 * TestServer - Minimal threaded HTTP/1.1 (optionally HTTPS) server on 127.0.0.1
 *
 * Listens on an ephemeral port. Each accepted connection gets its own thread
 * that serves keep-alive requests until either side closes. Every request
 * is recorded for later assertions.
 */
class TestServer {
public:
    /**
     * @param handler Produces the response for each request
     * @param tls Server TLS context, nullptr for plain HTTP
     */
    explicit TestServer(RequestHandler handler, SSL_CTX* tls = nullptr);
    ~TestServer();

    TestServer(const TestServer&) = delete;
    TestServer& operator=(const TestServer&) = delete;

    /**
     * Bind and start accepting
     *
     * @return false if the socket could not be set up
     */
    bool start();

    /**
     * Stop accepting, abort open connections and join every thread
     */
    void stop();

    int port() const { return server_port; }

    /**
     * Absolute URL on this server, e.g. url("/a") -> "http://127.0.0.1:1234/a"
     */
    std::string url(const std::string& path) const;

    std::vector<RecordedRequest> requests() const;
    size_t requestCount() const;
    size_t connectionCount() const { return accepted.load(); }

    /**
     * Accept connections but never read from or answer them
     */
    void setSilent(bool value) { silent = value; }

    /**
     * Response with a body and a Content-Type
     */
    static CannedResponse text(int status, const std::string& body,
                               const std::string& content_type = "text/plain");

    /**
     * gzip-compress a body (single member, default level)
     */
    static std::string gzip(const std::string& body);

private:
    class Channel;

    void acceptLoop();
    void serveConnection(int client_fd, int connection_id);
    bool readRequest(Channel& channel, RecordedRequest& request);
    bool writeResponse(Channel& channel, const RecordedRequest& request, const CannedResponse& response);
    void sleepFor(int ms);

    RequestHandler handler;
    SSL_CTX* tls;

    int socket_fd;
    int server_port;
    int wake_fd;
    std::atomic<bool> running;
    std::atomic<size_t> accepted;
    std::atomic<bool> silent{false};
    std::thread accept_thread;

    mutable std::mutex mtx;
    std::condition_variable stop_cv;
    std::vector<std::thread> workers;
    std::set<int> open_fds;
    std::vector<RecordedRequest> recorded;
};

} // namespace test_support

#endif // TEST_SERVER_HPP
