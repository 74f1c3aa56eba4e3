#include "Connection.hpp"
#include "CancelToken.hpp"
#include "NetworkUtils.hpp"
#include "RequestErrors.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace {

bool isIpLiteral(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

std::string drainOpenSslErrors() {
    std::string message;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!message.empty()) {
            message += "; ";
        }
        message += buf;
    }
    return message;
}

} // namespace

Connection::Connection(int fd, std::string host, int port, std::string remote_address, int remote_port)
    : last_used(std::chrono::steady_clock::now()), sock_fd(fd), ssl(nullptr),
      target_host(std::move(host)), target_port(port),
      remote_address(std::move(remote_address)), remote_port(remote_port) {}

Connection::~Connection() {
    if (ssl != nullptr) {
        SSL_free(ssl);
    }
    if (sock_fd >= 0) {
        close(sock_fd);
    }
}

// ============================================================================
// TLS
// ============================================================================

void Connection::startTls(SSL_CTX* ctx, const std::string& server_name, bool verify_host) {
    ssl = SSL_new(ctx);
    if (ssl == nullptr) {
        throw ConnectError("SSL_new failed: " + drainOpenSslErrors());
    }
    SSL_set_fd(ssl, sock_fd);

    // Step 1: SNI (not sent for IP literals)
    bool ip_literal = isIpLiteral(server_name);
    if (!ip_literal) {
        SSL_set_tlsext_host_name(ssl, server_name.c_str());
    }

    // Step 2: Hostname verification
    if (verify_host) {
        if (ip_literal) {
            X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), server_name.c_str());
        } else {
            SSL_set1_host(ssl, server_name.c_str());
        }
    }

    // Step 3: Handshake, waiting on the socket between WANT_READ/WANT_WRITE rounds
    while (true) {
        ERR_clear_error();
        int rc = SSL_connect(ssl);
        if (rc == 1) {
            break;
        }

        int err = SSL_get_error(ssl, rc);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            short events = err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT;
            NetworkUtils::WaitResult waited = NetworkUtils::waitFor(sock_fd, events, cancel.get());
            if (waited == NetworkUtils::WaitResult::Cancelled) {
                throw ConnectError("TLS handshake cancelled");
            }
            if (waited == NetworkUtils::WaitResult::Error) {
                throw ConnectError("TLS handshake poll failed: " + NetworkUtils::getLastError());
            }
            continue;
        }

        std::string reason = tlsErrorString(rc);
        long verify = SSL_get_verify_result(ssl);
        if (verify != X509_V_OK) {
            reason = std::string("certificate verification failed: ") +
                     X509_verify_cert_error_string(verify);
        }
        throw ConnectError("TLS handshake with " + server_name + " failed: " + reason);
    }
}

std::string Connection::tlsErrorString(int ssl_result) const {
    int err = SSL_get_error(ssl, ssl_result);
    std::string queued = drainOpenSslErrors();
    if (!queued.empty()) {
        return queued;
    }
    if (err == SSL_ERROR_SYSCALL) {
        return errno != 0 ? NetworkUtils::getLastError() : "unexpected EOF";
    }
    if (err == SSL_ERROR_ZERO_RETURN) {
        return "connection closed";
    }
    return "SSL error " + std::to_string(err);
}

// ============================================================================
// I/O
// ============================================================================

void Connection::setCancelToken(std::shared_ptr<CancelToken> token) {
    cancel = std::move(token);
}

void Connection::writeAll(const char* data, size_t length) {
    if (ssl == nullptr) {
        if (!NetworkUtils::sendData(sock_fd, data, length, cancel.get())) {
            if (cancel && cancel->cancelled()) {
                throw TransferError("write cancelled");
            }
            throw TransferError("write to " + target_host + " failed: " + NetworkUtils::getLastError());
        }
        return;
    }

    size_t total = 0;
    while (total < length) {
        ERR_clear_error();
        int rc = SSL_write(ssl, data + total, static_cast<int>(length - total));
        if (rc > 0) {
            total += static_cast<size_t>(rc);
            continue;
        }

        int err = SSL_get_error(ssl, rc);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            short events = err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT;
            NetworkUtils::WaitResult waited = NetworkUtils::waitFor(sock_fd, events, cancel.get());
            if (waited != NetworkUtils::WaitResult::Ready) {
                throw TransferError("write cancelled");
            }
            continue;
        }
        throw TransferError("TLS write to " + target_host + " failed: " + tlsErrorString(rc));
    }
}

void Connection::writeAll(const std::string& data) {
    writeAll(data.data(), data.size());
}

ssize_t Connection::readSome(char* buf, size_t max_length) {
    if (ssl == nullptr) {
        ssize_t n = NetworkUtils::receiveData(sock_fd, buf, max_length, cancel.get());
        if (n < 0) {
            if (cancel && cancel->cancelled()) {
                throw TransferError("read cancelled");
            }
            throw TransferError("read from " + target_host + " failed: " + NetworkUtils::getLastError());
        }
        return n;
    }

    while (true) {
        ERR_clear_error();
        int rc = SSL_read(ssl, buf, static_cast<int>(max_length));
        if (rc > 0) {
            return rc;
        }

        int err = SSL_get_error(ssl, rc);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return 0;
        }
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            short events = err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT;
            NetworkUtils::WaitResult waited = NetworkUtils::waitFor(sock_fd, events, cancel.get());
            if (waited != NetworkUtils::WaitResult::Ready) {
                throw TransferError("read cancelled");
            }
            continue;
        }
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            // Peer closed without close_notify
            return 0;
        }
        throw TransferError("TLS read from " + target_host + " failed: " + tlsErrorString(rc));
    }
}

bool Connection::fill() {
    char buf[16384];
    ssize_t n = readSome(buf, sizeof(buf));
    if (n == 0) {
        return false;
    }
    inbound.append(buf, static_cast<size_t>(n));
    return true;
}

bool Connection::isAlive() const {
    if (!inbound.empty()) {
        return false;
    }
    if (ssl != nullptr && SSL_pending(ssl) > 0) {
        return false;
    }
    return NetworkUtils::isIdleSocketAlive(sock_fd);
}
