#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include "Agent.hpp"
#include "PendingOutcome.hpp"
#include "RequestEngine.hpp"
#include "RequestOptions.hpp"
#include "Response.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

/**
 * Settings of one client instance
 */
struct ClientOptions {
    RequestOptions defaults;        // instance-level request defaults
    AgentOptions agent_options;     // applied to both default agents
    std::string log_file;           // empty disables file logging
    bool log_to_console = false;
    std::string client_id = "httpreq";
    bool share_digest_challenges = false; // reuse digest challenges across requests
};

/**
 * HTTPClient - Request entry points over one pair of pooled agents
 *
 * Every request runs on its own worker thread. The future and callback
 * forms share one implementation: the callback is a completion handler on
 * the outcome that also backs the future.
 *
 * Usage:
 *   HTTPClient client;
 *   RequestOptions options;
 *   options.data_type = DataType::Json;
 *   Result result = client.request("http://example.com/api", options).get();
 */
class HTTPClient {
public:
    explicit HTTPClient(ClientOptions options = {});

    /**
     * Waits for in-flight requests and closes pooled connections
     */
    ~HTTPClient();

    HTTPClient(const HTTPClient&) = delete;
    HTTPClient& operator=(const HTTPClient&) = delete;

    /**
     * Issue a request
     *
     * @param url Target URL
     * @param options Call options, layered over the client defaults
     * @return Future yielding the Result, or rethrowing the RequestError
     */
    std::future<Result> request(const std::string& url, const RequestOptions& options = {});

    /**
     * Issue a request and report the outcome to a callback
     *
     * The callback runs exactly once, on a worker thread.
     */
    void request(const std::string& url, const RequestOptions& options, Callback callback);

    /** Alias of request() */
    std::future<Result> curl(const std::string& url, const RequestOptions& options = {});

    /** Alias of request() */
    void curl(const std::string& url, const RequestOptions& options, Callback callback);

    /** Alias of the callback form of request() */
    void requestWithCallback(const std::string& url, const RequestOptions& options, Callback callback);

    /**
     * Defer a request until a callback is supplied
     *
     * @return Function that issues the request when called; the client must
     *         outlive it
     */
    std::function<void(Callback)> requestThunk(const std::string& url, const RequestOptions& options = {});

    /**
     * Subscribe to Request, Response or Error events
     *
     * @return Subscription id
     */
    size_t on(EventType type, EventListener listener);

    /**
     * Remove a subscription
     */
    bool off(size_t id);

    std::shared_ptr<Agent> httpAgent() const { return http_agent; }
    std::shared_ptr<Agent> httpsAgent() const { return https_agent; }
    const RequestOptions& defaults() const { return options.defaults; }

    /**
     * Number of requests whose worker thread is still running
     */
    size_t inFlight() const;

    /**
     * Stop accepting requests, wait for in-flight ones and close every
     * pooled connection. Safe to call more than once.
     */
    void shutdown();

private:
    /**
     * Worker bookkeeping shared with detached worker threads
     */
    struct WorkerState {
        std::mutex mtx;
        std::condition_variable idle;
        size_t in_flight = 0;
        size_t in_callbacks = 0;    // completion callbacks currently running
        bool shut_down = false;
    };

    std::shared_ptr<PendingOutcome> start(const std::string& url, const RequestOptions& call_options,
                                          Callback callback);

    Callback guardCallback(Callback callback) const;

    ClientOptions options;
    std::shared_ptr<Agent> http_agent;
    std::shared_ptr<Agent> https_agent;
    std::shared_ptr<ConnectionProvider> provider;
    std::shared_ptr<RequestEngine> engine;
    std::shared_ptr<WorkerState> workers;
};

/**
 * Module-level entry points running on an explicitly owned default client
 */
namespace httpreq {

/** Default timeout in milliseconds, for both phases */
constexpr long TIMEOUT = 5000;

/** Default (connect, response) timeout pair */
extern const Timeout TIMEOUTS;

/** Default User-Agent header value */
extern const std::string USER_AGENT;

/**
 * Default client, created on first use
 */
HTTPClient& defaultClient();

/**
 * Shut the default client down and release it; the next defaultClient()
 * call creates a fresh one
 */
void shutdownDefaultClient();

/**
 * Create an independent client
 */
std::shared_ptr<HTTPClient> create(ClientOptions options = {});

std::future<Result> request(const std::string& url, const RequestOptions& options = {});
void request(const std::string& url, const RequestOptions& options, Callback callback);
std::future<Result> curl(const std::string& url, const RequestOptions& options = {});
void curl(const std::string& url, const RequestOptions& options, Callback callback);
void requestWithCallback(const std::string& url, const RequestOptions& options, Callback callback);
std::function<void(Callback)> requestThunk(const std::string& url, const RequestOptions& options = {});

} // namespace httpreq

#endif // HTTP_CLIENT_HPP
