#ifndef HTTPS_TUNNEL_HPP
#define HTTPS_TUNNEL_HPP

#include <string>

class Connection;

/**
 * HTTPSTunnel - Opens CONNECT tunnels through an HTTP proxy
 *
 * Responsibilities:
 * - Send the CONNECT request for the destination to the proxy
 * - Validate the proxy's reply
 * - Leave the connection positioned for the TLS handshake with the destination
 *
 * The CONNECT method creates a TCP tunnel through the proxy,
 * so the proxy cannot decrypt or inspect the traffic.
 */
class HTTPSTunnel {
public:
    /**
     * Establish a tunnel over an open proxy connection
     *
     * This method:
     * 1. Sends "CONNECT host:port HTTP/1.1" (with Proxy-Authorization when given)
     * 2. Reads the proxy's response head
     * 3. Accepts any 2xx status as "tunnel ready"
     *
     * @param proxy_conn Connection to the proxy
     * @param host Destination hostname
     * @param port Destination port (typically 443 for HTTPS)
     * @param proxy_authorization Value for Proxy-Authorization, empty for none
     * @throws ConnectError when the proxy refuses or the exchange fails
     */
    static void establish(Connection& proxy_conn,
                          const std::string& host,
                          int port,
                          const std::string& proxy_authorization);

private:
    static std::string buildConnectRequest(const std::string& host, int port,
                                           const std::string& proxy_authorization);
};

#endif // HTTPS_TUNNEL_HPP
