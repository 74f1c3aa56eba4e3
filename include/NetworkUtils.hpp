#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <vector>
#include <sys/socket.h>
#include <sys/types.h>

class CancelToken;

/**
 * NetworkUtils - Socket primitives used by the connection layer
 *
 * Provides reusable networking operations:
 * - DNS resolution
 * - Non-blocking TCP connect that can be interrupted by a CancelToken
 * - Waiting for readiness on a socket and a cancel token at once
 * - Sending/receiving data with error checking
 *
 * This is a utility class with static methods only. Functions report
 * failure through their return value plus an error string.
 */
class NetworkUtils {
public:
    /**
     * One resolved socket address
     */
    struct ResolvedAddress {
        sockaddr_storage addr;
        socklen_t length;
        int family;
        std::string text;   // numeric address, e.g. "127.0.0.1"
        int port;
    };

    /**
     * Outcome of waitFor()
     */
    enum class WaitResult {
        Ready,
        Cancelled,
        Error
    };

    /**
     * Resolve a host name to socket addresses
     *
     * Supports both IPv4 and IPv6.
     *
     * @param host Hostname or IP address
     * @param port Port number
     * @param error Filled with a description on failure
     * @return Addresses in resolver order, empty on failure
     */
    static std::vector<ResolvedAddress> resolveHost(const std::string& host, int port,
                                                    std::string& error);

    /**
     * Open a non-blocking TCP connection to one address
     *
     * @param address Resolved address
     * @param cancel Optional token that aborts the wait for the handshake
     * @param error Filled with a description on failure
     * @return Socket file descriptor on success, -1 on failure
     */
    static int connectToAddress(const ResolvedAddress& address, const CancelToken* cancel,
                                std::string& error);

    /**
     * Block until fd is ready for events or the token is cancelled
     *
     * @param fd Socket file descriptor
     * @param events POLLIN and/or POLLOUT
     * @param cancel Optional cancel token
     * @return Ready, Cancelled or Error
     */
    static WaitResult waitFor(int fd, short events, const CancelToken* cancel);

    /**
     * Send complete data to socket
     *
     * Ensures all data is sent or returns error. Handles partial sends and
     * EAGAIN on non-blocking sockets.
     *
     * @param fd Socket file descriptor
     * @param data Data to send
     * @param length Length of data in bytes
     * @param cancel Optional cancel token
     * @return true on success, false on failure or cancellation
     */
    static bool sendData(int fd, const char* data, size_t length, const CancelToken* cancel = nullptr);

    /**
     * Send string data to socket
     *
     * Convenience wrapper for sending std::string data.
     */
    static bool sendData(int fd, const std::string& data, const CancelToken* cancel = nullptr);

    /**
     * Receive up to max_length bytes from socket
     *
     * Waits for data on non-blocking sockets.
     *
     * @param fd Socket file descriptor
     * @param buffer Buffer to store received data
     * @param max_length Maximum bytes to receive
     * @param cancel Optional cancel token
     * @return Number of bytes received, 0 on EOF, -1 on error or cancellation
     */
    static ssize_t receiveData(int fd, char* buffer, size_t max_length,
                               const CancelToken* cancel = nullptr);

    /**
     * Check whether an idle socket is still usable
     *
     * An idle keep-alive socket that is readable has either been closed by
     * the peer or received unsolicited data; both make it unusable.
     */
    static bool isIdleSocketAlive(int fd);

    /**
     * Get last socket error as string
     *
     * @return Human-readable error message
     */
    static std::string getLastError();

private:
    // Utility class - no instances allowed
    NetworkUtils() = delete;
    ~NetworkUtils() = delete;
    NetworkUtils(const NetworkUtils&) = delete;
    NetworkUtils& operator=(const NetworkUtils&) = delete;
};

#endif // NETWORK_UTILS_HPP
