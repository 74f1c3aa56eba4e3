#include "NetworkUtils.hpp"
#include "CancelToken.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

// ====================================================================================================
// Name Resolution
// ====================================================================================================

std::vector<NetworkUtils::ResolvedAddress> NetworkUtils::resolveHost(const std::string& host, int port,
                                                                     std::string& error) {
    std::vector<ResolvedAddress> addresses;

    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;      // IPv4 or IPv6
    hints.ai_socktype = SOCK_STREAM;  // TCP

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);

    // Perform DNS resolution
    int err = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        error = "DNS resolution failed for " + host + ": " + gai_strerror(err);
        return addresses;
    }

    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        ResolvedAddress address {};
        std::memcpy(&address.addr, ai->ai_addr, ai->ai_addrlen);
        address.length = ai->ai_addrlen;
        address.family = ai->ai_family;
        address.port = port;

        char text[INET6_ADDRSTRLEN] = {0};
        if (ai->ai_family == AF_INET) {
            inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in*>(ai->ai_addr)->sin_addr, text, sizeof(text));
        } else if (ai->ai_family == AF_INET6) {
            inet_ntop(AF_INET6, &reinterpret_cast<sockaddr_in6*>(ai->ai_addr)->sin6_addr, text, sizeof(text));
        }
        address.text = text;
        addresses.push_back(address);
    }

    freeaddrinfo(res);
    if (addresses.empty()) {
        error = "DNS resolution returned no addresses for " + host;
    }
    return addresses;
}

// ====================================================================================================
// Connection Management
// ====================================================================================================

int NetworkUtils::connectToAddress(const ResolvedAddress& address, const CancelToken* cancel,
                                   std::string& error) {
    // Step 1: Create non-blocking socket
    int sock_fd = socket(address.family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sock_fd < 0) {
        error = "Failed to create socket: " + getLastError();
        return -1;
    }

    int one = 1;
    setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    // Step 2: Start the handshake
    if (connect(sock_fd, reinterpret_cast<const sockaddr*>(&address.addr), address.length) < 0) {
        if (errno != EINPROGRESS) {
            error = "Failed to connect to " + address.text + ":" + std::to_string(address.port) +
                    " (" + getLastError() + ")";
            close(sock_fd);
            return -1;
        }

        // Step 3: Wait for completion or cancellation
        WaitResult waited = waitFor(sock_fd, POLLOUT, cancel);
        if (waited != WaitResult::Ready) {
            error = waited == WaitResult::Cancelled ? "connect cancelled" : "poll failed: " + getLastError();
            close(sock_fd);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sock_fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            error = "Failed to connect to " + address.text + ":" + std::to_string(address.port) +
                    " (" + std::strerror(so_error != 0 ? so_error : errno) + ")";
            close(sock_fd);
            return -1;
        }
    }

    return sock_fd;
}

NetworkUtils::WaitResult NetworkUtils::waitFor(int fd, short events, const CancelToken* cancel) {
    struct pollfd fds[2];
    fds[0].fd = fd;
    fds[0].events = events;
    fds[0].revents = 0;
    nfds_t count = 1;

    if (cancel != nullptr) {
        if (cancel->cancelled()) {
            return WaitResult::Cancelled;
        }
        fds[1].fd = cancel->fd();
        fds[1].events = POLLIN;
        fds[1].revents = 0;
        count = 2;
    }

    while (true) {
        int rc = poll(fds, count, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WaitResult::Error;
        }
        if (count == 2 && (fds[1].revents & POLLIN)) {
            return WaitResult::Cancelled;
        }
        // POLLHUP/POLLERR are reported as ready so the following I/O call surfaces the error
        if (fds[0].revents != 0) {
            return WaitResult::Ready;
        }
    }
}

// ====================================================================================================
// Data Transmission
// ====================================================================================================

bool NetworkUtils::sendData(int fd, const char* data, size_t length, const CancelToken* cancel) {
    size_t total_sent = 0;

    while (total_sent < length) {
        ssize_t sent = send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (waitFor(fd, POLLOUT, cancel) != WaitResult::Ready) {
                    return false;
                }
                continue;
            }
            return false;
        }

        if (sent == 0) {
            return false;
        }

        total_sent += sent;
    }

    return true;
}

bool NetworkUtils::sendData(int fd, const std::string& data, const CancelToken* cancel) {
    return sendData(fd, data.c_str(), data.size(), cancel);
}

// ====================================================================================================
// Data Reception
// ====================================================================================================

ssize_t NetworkUtils::receiveData(int fd, char* buffer, size_t max_length, const CancelToken* cancel) {
    while (true) {
        ssize_t received = recv(fd, buffer, max_length, 0);

        if (received >= 0) {
            // 0: connection closed by peer (not necessarily an error)
            return received;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (waitFor(fd, POLLIN, cancel) != WaitResult::Ready) {
                return -1;
            }
            continue;
        }
        return -1;
    }
}

bool NetworkUtils::isIdleSocketAlive(int fd) {
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int rc = poll(&pfd, 1, 0);
    if (rc < 0) {
        return false;
    }
    return rc == 0;
}

// ====================================================================================================
// Error Handling
// ====================================================================================================

std::string NetworkUtils::getLastError() {
    return std::string(strerror(errno));
}
