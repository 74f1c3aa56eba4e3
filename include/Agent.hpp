#ifndef AGENT_HPP
#define AGENT_HPP

#include "TlsContext.hpp"

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>

class Connection;

/**
 * Pool tuning
 */
struct AgentOptions {
    bool keep_alive = true;             // pool connections at all
    size_t max_free_sockets = 256;      // idle connections kept across all keys
    long free_socket_timeout_ms = 15000; // idle connections older than this are closed
};

/**
 * Agent - Pool of idle keep-alive connections
 *
 * Connections are keyed by everything that makes them interchangeable
 * (scheme, host, port, proxy and TLS configuration). An attempt checks a
 * connection out, owns it exclusively, and releases it back only when the
 * response was fully read and the server allows reuse.
 */
class Agent {
public:
    struct Stats {
        size_t idle = 0;     // connections waiting in the pool
        size_t created = 0;  // connections opened for this agent
        size_t reused = 0;   // checkouts served from the pool
    };

    explicit Agent(AgentOptions options = {});
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    /**
     * Take an idle connection for a key
     *
     * Stale connections found on the way (closed by the peer or idle too
     * long) are dropped.
     *
     * @param key Pool key
     * @return Connection, or nullptr when none is available
     */
    std::unique_ptr<Connection> checkout(const std::string& key);

    /**
     * Return a connection after a complete exchange
     *
     * The connection is closed instead when the agent is shut down,
     * keep-alive is disabled or the pool is full.
     */
    void release(std::unique_ptr<Connection> conn);

    /**
     * Count a freshly opened connection
     */
    void recordCreated();

    /**
     * Close every idle connection and stop pooling
     */
    void shutdown();

    Stats stats() const;

    const AgentOptions& options() const { return agent_options; }

    /**
     * TLS contexts shared by this agent's connections
     */
    TlsContextCache& tlsContexts() { return tls_contexts; }

private:
    AgentOptions agent_options;
    mutable std::mutex mtx;
    std::list<std::unique_ptr<Connection>> idle;
    size_t created = 0;
    size_t reused = 0;
    bool shut_down = false;
    TlsContextCache tls_contexts;
};

#endif // AGENT_HPP
