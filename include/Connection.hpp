#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <chrono>
#include <memory>
#include <string>

#include <openssl/ssl.h>

class CancelToken;

/**
 * Connection - One transport connection, plain TCP or TLS
 *
 * Owns the socket and, after startTls(), the SSL session layered on it.
 * Blocking reads and writes wait on the socket and the attached
 * CancelToken together, so a tripped token aborts them with TransferError.
 * Bytes read ahead of the current parse position live in buffer().
 */
class Connection {
public:
    Connection(int fd, std::string host, int port, std::string remote_address, int remote_port);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * Perform the TLS client handshake over the socket
     *
     * @param ctx Configured SSL context
     * @param server_name Name for SNI and certificate hostname checks
     * @param verify_host Check the peer certificate against server_name
     * @throws ConnectError on handshake or verification failure
     */
    void startTls(SSL_CTX* ctx, const std::string& server_name, bool verify_host);

    /**
     * Attach the cancel token of the attempt currently using the connection
     */
    void setCancelToken(std::shared_ptr<CancelToken> token);

    /**
     * Write every byte
     *
     * @throws TransferError on socket/TLS failure or cancellation
     */
    void writeAll(const char* data, size_t length);
    void writeAll(const std::string& data);

    /**
     * Append newly received bytes to buffer()
     *
     * @return false on orderly EOF
     * @throws TransferError on socket/TLS failure or cancellation
     */
    bool fill();

    /**
     * Bytes received but not yet consumed
     */
    std::string& buffer() { return inbound; }

    /**
     * Whether an idle pooled connection can still carry a request
     */
    bool isAlive() const;

    bool isSecure() const { return ssl != nullptr; }
    int fd() const { return sock_fd; }
    const std::string& host() const { return target_host; }
    int port() const { return target_port; }
    const std::string& remoteAddress() const { return remote_address; }
    int remotePort() const { return remote_port; }

    // Pool bookkeeping
    std::string pool_key;
    std::chrono::steady_clock::time_point last_used;
    unsigned request_count = 0;

private:
    ssize_t readSome(char* buf, size_t max_length);
    std::string tlsErrorString(int ssl_result) const;

    int sock_fd;
    SSL* ssl;
    std::string target_host;
    int target_port;
    std::string remote_address;
    int remote_port;
    std::string inbound;
    std::shared_ptr<CancelToken> cancel;
};

#endif // CONNECTION_HPP
