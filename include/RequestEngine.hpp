#ifndef REQUEST_ENGINE_HPP
#define REQUEST_ENGINE_HPP

#include "AuthInjector.hpp"
#include "ConnectionProvider.hpp"
#include "HTTPResponseParser.hpp"
#include "Logger.hpp"
#include "PendingOutcome.hpp"
#include "RequestPlan.hpp"
#include "Response.hpp"
#include "TimeoutController.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Lifecycle checkpoints observers can subscribe to
 */
enum class EventType {
    Request,    // plan built, first attempt about to start
    Response,   // request succeeded
    Error       // request failed
};

/**
 * Payload passed to event listeners
 */
struct RequestEvent {
    EventType type;
    uint64_t request_id = 0;
    std::string method;
    std::string url;
    const RequestError* error = nullptr; // set for Error events
    std::shared_ptr<Response> res;       // final (or partial) response, may be nullptr
};

using EventListener = std::function<void(const RequestEvent& event)>;

/**
 * RequestEngine - Drives the attempts of one logical request and settles its
 * outcome exactly once
 *
 * One engine is shared by every request of a client. execute() runs on the
 * request's worker thread; a timeout is delivered from the attempt's
 * watchdog thread. Both go through the same finish path, guarded by an
 * atomic flag, so only the first of them reaches the caller.
 */
class RequestEngine {
public:
    /**
     * @param provider Connection source shared by all requests
     * @param digest_cache Shared digest challenges, nullptr to keep them per request
     * @param log_settings Destination of the per-request loggers
     * @param client_id Prefix of the logger ids
     */
    RequestEngine(std::shared_ptr<ConnectionProvider> provider,
                  std::shared_ptr<DigestCache> digest_cache,
                  LogSettings log_settings,
                  std::string client_id);

    RequestEngine(const RequestEngine&) = delete;
    RequestEngine& operator=(const RequestEngine&) = delete;

    /**
     * Run a request to completion and settle its outcome
     *
     * @param plan Normalized and encoded plan
     * @param outcome Outcome to settle
     * @param started When the caller issued the request (timing origin)
     */
    void execute(RequestPlan plan, std::shared_ptr<PendingOutcome> outcome,
                 std::chrono::steady_clock::time_point started);

    /**
     * Settle a request that failed before a plan could be built
     *
     * @param request_id Id reserved for the request
     * @param method Requested method, as given
     * @param url Requested URL, as given
     * @param error Exception pointer holding a RequestError
     * @param outcome Outcome to settle
     */
    void reject(uint64_t request_id, const std::string& method, const std::string& url,
                std::exception_ptr error, std::shared_ptr<PendingOutcome> outcome);

    /**
     * Subscribe to a lifecycle event
     *
     * @return Subscription id for off()
     */
    size_t on(EventType type, EventListener listener);

    /**
     * Remove a subscription
     *
     * @return true if the id was subscribed
     */
    bool off(size_t id);

    ConnectionProvider& connections() { return *provider; }

private:
    /**
     * State of one logical request shared by the worker and the watchdog
     */
    struct RequestContext {
        uint64_t request_id = 0;
        std::string method;
        std::string url;
        bool timing = false;
        std::chrono::steady_clock::time_point started;
        std::shared_ptr<PendingOutcome> outcome;
        std::unique_ptr<Logger> logger;

        std::atomic<bool> finished{false};

        std::mutex mtx;
        TimingRecord timing_record;
        std::shared_ptr<Response> latest;   // last response head received
        std::vector<std::string> request_urls;

        double elapsedMs() const;
        void mark(double TimingRecord::*field);
        void publish(const Response& res);
        std::shared_ptr<Response> snapshot();
    };

    /**
     * An attempt whose response head has been read
     */
    struct AttemptResult {
        std::shared_ptr<CancelToken> cancel;
        std::unique_ptr<TimeoutController> timer;
        ConnectionHandle conn;
        HTTPResponseParser::ResponseHead head;
        Response res;
        bool reusable = false;
    };

    void run(const RequestPlan& plan, const std::shared_ptr<RequestContext>& ctx);

    AttemptResult sendAttempt(const RequestPlan& plan, const AttemptState& attempt,
                              const std::optional<std::string>& authorization,
                              const std::shared_ptr<RequestContext>& ctx);

    void writeBody(const RequestPlan& plan, Connection& conn);

    void consumeBody(const RequestPlan& plan, const AttemptState& attempt,
                     AttemptResult& result, const std::shared_ptr<RequestContext>& ctx);

    void discardBody(const AttemptState& attempt, AttemptResult& result);

    void waitForWriteStream(WritableStream& sink, CancelToken& cancel);

    std::optional<std::string> digestAuthorization(const DigestCredentials& credentials,
                                                   const AttemptState& attempt,
                                                   AuthState& state,
                                                   std::shared_ptr<DigestCache::Entry>& entry);

    bool answerDigestChallenge(const AttemptState& attempt, const AttemptResult& result,
                               AuthState& state, std::shared_ptr<DigestCache::Entry>& entry);

    void succeed(const std::shared_ptr<RequestContext>& ctx, ResponseData data,
                 std::shared_ptr<Response> res);
    void fail(const std::shared_ptr<RequestContext>& ctx, std::exception_ptr error);
    void finalize(RequestContext& ctx, Response& res);

    void emit(RequestContext& ctx, const RequestEvent& event);

    std::shared_ptr<ConnectionProvider> provider;
    std::shared_ptr<DigestCache> digest_cache;
    LogSettings log_settings;
    std::string client_id;

    std::mutex listeners_mtx;
    std::map<size_t, std::pair<EventType, EventListener>> listeners;
    size_t next_listener_id = 1;
};

#endif // REQUEST_ENGINE_HPP
