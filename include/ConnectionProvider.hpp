#ifndef CONNECTION_PROVIDER_HPP
#define CONNECTION_PROVIDER_HPP

#include "Agent.hpp"
#include "Connection.hpp"
#include "TlsContext.hpp"

#include <functional>
#include <memory>
#include <string>

class CancelToken;
class Logger;
struct RequestPlan;
struct Url;

/**
 * ConnectionHandle - Exclusive ownership of one Connection during an attempt
 *
 * The connection goes back to its agent only through release(); a handle
 * destroyed without release() closes the connection (error, cancellation
 * or unread body).
 */
class ConnectionHandle {
public:
    ConnectionHandle() = default;
    ConnectionHandle(std::unique_ptr<Connection> conn, std::shared_ptr<Agent> pool, bool reused);
    ~ConnectionHandle();

    ConnectionHandle(ConnectionHandle&&) = default;
    ConnectionHandle& operator=(ConnectionHandle&&) = default;
    ConnectionHandle(const ConnectionHandle&) = delete;
    ConnectionHandle& operator=(const ConnectionHandle&) = delete;

    Connection* operator->() const { return conn.get(); }
    Connection& operator*() const { return *conn; }
    Connection* get() const { return conn.get(); }
    explicit operator bool() const { return conn != nullptr; }

    /**
     * Connection was taken from a pool rather than freshly opened
     */
    bool reused() const { return was_reused; }

    /**
     * Hand the connection back to its agent (closes it when there is none)
     */
    void release();

    /**
     * Close the connection now
     */
    void destroy();

private:
    std::unique_ptr<Connection> conn;
    std::shared_ptr<Agent> pool;
    bool was_reused = false;
};

/**
 * Milestones reported while acquiring a connection
 */
enum class AcquireStage {
    Resolved,   // DNS lookup finished
    Connected   // TCP, proxy tunnel and TLS handshake finished
};

/**
 * ConnectionProvider - Hands out connections for attempts
 *
 * Responsibilities:
 * - Own the client's default plain and TLS agents
 * - Pick the agent for a request (default, custom, or none)
 * - Open new connections: direct, forwarded through a proxy, or tunneled
 *   through a proxy with CONNECT
 * - Layer TLS on top with the request's certificate settings
 */
class ConnectionProvider {
public:
    ConnectionProvider(std::shared_ptr<Agent> http_agent, std::shared_ptr<Agent> https_agent);

    /**
     * Acquire a connection for one attempt
     *
     * @param plan Request plan (agent choice, proxy, TLS settings)
     * @param target URL of this attempt
     * @param cancel Cancel token of the attempt
     * @param logger Request logger
     * @param on_stage Called at each AcquireStage of a fresh connection
     * @return Handle owning the connection
     * @throws ConnectError on DNS, TCP, proxy or TLS failure
     */
    ConnectionHandle acquire(const RequestPlan& plan,
                             const Url& target,
                             std::shared_ptr<CancelToken> cancel,
                             Logger& logger,
                             const std::function<void(AcquireStage)>& on_stage);

    /**
     * Agent the request draws from, nullptr when pooling is disabled
     */
    std::shared_ptr<Agent> agentFor(const RequestPlan& plan, const Url& target) const;

    /**
     * Whether a plain-http request goes through a forwarding proxy and must
     * use an absolute-form request target
     */
    static bool isForwardedThroughProxy(const RequestPlan& plan, const Url& target);

    /**
     * Pool key for an attempt: scheme, host, port, proxy and TLS settings
     */
    static std::string poolKey(const RequestPlan& plan, const Url& target);

    /**
     * Proxy-Authorization value for a proxy URL with userinfo, or ""
     */
    static std::string proxyAuthorization(const Url& proxy);

    /**
     * Close idle connections of the default agents and stop pooling
     */
    void shutdown();

private:
    std::unique_ptr<Connection> openConnection(const RequestPlan& plan,
                                               const Url& target,
                                               const std::shared_ptr<Agent>& agent,
                                               const std::shared_ptr<CancelToken>& cancel,
                                               Logger& logger,
                                               const std::function<void(AcquireStage)>& on_stage);

    std::shared_ptr<Agent> http_agent;
    std::shared_ptr<Agent> https_agent;
    TlsContextCache unpooled_tls_contexts;
};

#endif // CONNECTION_PROVIDER_HPP
