#include "HTTPSTunnel.hpp"
#include "Connection.hpp"
#include "HTTPResponseParser.hpp"
#include "HTTPUtils.hpp"
#include "RequestErrors.hpp"

// ====================================================================================================
// Public Methods
// ====================================================================================================

void HTTPSTunnel::establish(Connection& proxy_conn,
                            const std::string& host,
                            int port,
                            const std::string& proxy_authorization) {
    // Step 1: Ask the proxy for a tunnel
    try {
        proxy_conn.writeAll(buildConnectRequest(host, port, proxy_authorization));
    } catch (const TransferError& e) {
        throw ConnectError(std::string("failed to send CONNECT to proxy: ") + e.what());
    }

    // Step 2: Read the proxy's answer
    HTTPResponseParser::ResponseHead head;
    try {
        head = HTTPResponseParser::readHead(proxy_conn);
    } catch (const RequestError& e) {
        throw ConnectError(std::string("proxy CONNECT failed: ") + e.what());
    }

    // Step 3: Anything but 2xx means no tunnel
    if (head.status_code < 200 || head.status_code >= 300) {
        throw ConnectError("proxy refused CONNECT to " + host + ":" + std::to_string(port) +
                           " with status " + std::to_string(head.status_code));
    }

    // A tunnel carries raw bytes only; leftovers would belong to the destination's handshake
    if (!proxy_conn.buffer().empty()) {
        throw ConnectError("proxy sent unexpected data after CONNECT response");
    }
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::string HTTPSTunnel::buildConnectRequest(const std::string& host, int port,
                                             const std::string& proxy_authorization) {
    std::string authority = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    authority += ":" + std::to_string(port);

    HeaderMap headers;
    headers.set("Host", authority);
    headers.set("Proxy-Connection", "keep-alive");
    if (!proxy_authorization.empty()) {
        headers.set("Proxy-Authorization", proxy_authorization);
    }
    return http_utils::buildRequestHead("CONNECT", authority, headers);
}
