#include "ConnectionProvider.hpp"
#include "AuthInjector.hpp"
#include "CancelToken.hpp"
#include "HTTPSTunnel.hpp"
#include "Logger.hpp"
#include "NetworkUtils.hpp"
#include "RequestErrors.hpp"
#include "RequestPlan.hpp"

// ====================================================================================================
// ConnectionHandle
// ====================================================================================================

ConnectionHandle::ConnectionHandle(std::unique_ptr<Connection> conn, std::shared_ptr<Agent> pool, bool reused)
    : conn(std::move(conn)), pool(std::move(pool)), was_reused(reused) {}

ConnectionHandle::~ConnectionHandle() {
    destroy();
}

void ConnectionHandle::release() {
    if (!conn) {
        return;
    }
    conn->request_count++;
    if (pool) {
        pool->release(std::move(conn));
    }
    conn.reset();
}

void ConnectionHandle::destroy() {
    conn.reset();
}

// ====================================================================================================
// ConnectionProvider
// ====================================================================================================

ConnectionProvider::ConnectionProvider(std::shared_ptr<Agent> http_agent, std::shared_ptr<Agent> https_agent)
    : http_agent(std::move(http_agent)), https_agent(std::move(https_agent)) {}

std::shared_ptr<Agent> ConnectionProvider::agentFor(const RequestPlan& plan, const Url& target) const {
    const AgentChoice& choice = target.isSecure() ? plan.https_agent : plan.http_agent;
    if (choice.use_default) {
        return target.isSecure() ? https_agent : http_agent;
    }
    return choice.custom;
}

bool ConnectionProvider::isForwardedThroughProxy(const RequestPlan& plan, const Url& target) {
    return plan.proxy.has_value() && !target.isSecure();
}

std::string ConnectionProvider::poolKey(const RequestPlan& plan, const Url& target) {
    std::string key = target.scheme + "://" + target.host + ":" + std::to_string(target.port);
    if (plan.proxy) {
        key += "|proxy=" + plan.proxy->origin() + "@" + plan.proxy->userinfo;
    }
    if (target.isSecure()) {
        key += "|tls=" + plan.tls.cacheKey();
    }
    return key;
}

std::string ConnectionProvider::proxyAuthorization(const Url& proxy) {
    if (proxy.userinfo.empty()) {
        return "";
    }
    return AuthInjector::basicHeader(proxy.username(), proxy.password());
}

ConnectionHandle ConnectionProvider::acquire(const RequestPlan& plan,
                                             const Url& target,
                                             std::shared_ptr<CancelToken> cancel,
                                             Logger& logger,
                                             const std::function<void(AcquireStage)>& on_stage) {
    std::shared_ptr<Agent> agent = agentFor(plan, target);
    std::string key = poolKey(plan, target);

    // Step 1: Reuse an idle pooled connection when one matches
    if (agent) {
        std::unique_ptr<Connection> pooled = agent->checkout(key);
        if (pooled) {
            pooled->setCancelToken(cancel);
            logger.logConnectionReused(target.host, target.port);
            return ConnectionHandle(std::move(pooled), agent, true);
        }
    }

    // Step 2: Open a fresh one
    std::unique_ptr<Connection> conn = openConnection(plan, target, agent, cancel, logger, on_stage);
    conn->pool_key = key;
    if (agent) {
        agent->recordCreated();
    }
    return ConnectionHandle(std::move(conn), agent, false);
}

void ConnectionProvider::shutdown() {
    if (http_agent) {
        http_agent->shutdown();
    }
    if (https_agent) {
        https_agent->shutdown();
    }
    unpooled_tls_contexts.clear();
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::unique_ptr<Connection> ConnectionProvider::openConnection(const RequestPlan& plan,
                                                               const Url& target,
                                                               const std::shared_ptr<Agent>& agent,
                                                               const std::shared_ptr<CancelToken>& cancel,
                                                               Logger& logger,
                                                               const std::function<void(AcquireStage)>& on_stage) {
    // Step 1: The TCP peer is the proxy when one is configured
    const std::string& peer_host = plan.proxy ? plan.proxy->host : target.host;
    int peer_port = plan.proxy ? plan.proxy->port : target.port;

    // Step 2: DNS
    std::string error;
    auto addresses = NetworkUtils::resolveHost(peer_host, peer_port, error);
    if (addresses.empty()) {
        throw ConnectError(error);
    }
    if (cancel->cancelled()) {
        throw ConnectError("connect cancelled");
    }
    on_stage(AcquireStage::Resolved);

    // Step 3: TCP, trying each address in turn
    std::unique_ptr<Connection> conn;
    for (const auto& address : addresses) {
        int fd = NetworkUtils::connectToAddress(address, cancel.get(), error);
        if (fd >= 0) {
            conn = std::make_unique<Connection>(fd, target.host, target.port, address.text, address.port);
            break;
        }
        if (cancel->cancelled()) {
            break;
        }
    }
    if (!conn) {
        throw ConnectError(error);
    }
    conn->setCancelToken(cancel);
    logger.logConnectionOpened(peer_host, peer_port);

    // Step 4: CONNECT tunnel for https through a proxy
    if (plan.proxy && target.isSecure()) {
        HTTPSTunnel::establish(*conn, target.host, target.port, proxyAuthorization(*plan.proxy));
        logger.logTunnelEstablished(target.host, target.port);
    }

    // Step 5: TLS
    if (target.isSecure()) {
        TlsContextCache& cache = agent ? agent->tlsContexts() : unpooled_tls_contexts;
        std::shared_ptr<TlsContext> context = cache.get(plan.tls);
        conn->startTls(context->get(), target.host, context->verifyPeer());
    }

    on_stage(AcquireStage::Connected);
    return conn;
}
