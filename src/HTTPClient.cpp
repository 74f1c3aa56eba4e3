#include "HTTPClient.hpp"
#include "BodyEncoder.hpp"
#include "ConnectionProvider.hpp"
#include "Logger.hpp"
#include "OptionNormalizer.hpp"
#include "RequestErrors.hpp"

#include <chrono>
#include <system_error>
#include <thread>

#include <fmt/format.h>

namespace {

// Ids are unique across every client of the process
std::atomic<uint64_t> g_next_request_id{1};

// Worker state of the client whose completion callback this thread is running
thread_local const void* t_callback_owner = nullptr;

/**
 * Marks the current thread as running a completion callback of one client
 * for the lifetime of the scope
 */
class CallbackScope {
public:
    explicit CallbackScope(const void* owner) : previous(t_callback_owner) {
        t_callback_owner = owner;
    }

    ~CallbackScope() {
        t_callback_owner = previous;
    }

    CallbackScope(const CallbackScope&) = delete;
    CallbackScope& operator=(const CallbackScope&) = delete;

private:
    const void* previous;
};

}

// ============================================================================
// Construction
// ============================================================================

HTTPClient::HTTPClient(ClientOptions client_options)
    : options(std::move(client_options)),
      http_agent(std::make_shared<Agent>(options.agent_options)),
      https_agent(std::make_shared<Agent>(options.agent_options)),
      provider(std::make_shared<ConnectionProvider>(http_agent, https_agent)),
      workers(std::make_shared<WorkerState>()) {
    LogSettings log_settings{options.log_file, options.log_to_console};
    std::shared_ptr<DigestCache> digest_cache;
    if (options.share_digest_challenges) {
        digest_cache = std::make_shared<DigestCache>();
    }
    engine = std::make_shared<RequestEngine>(provider, digest_cache, log_settings, options.client_id);
}

HTTPClient::~HTTPClient() {
    shutdown();
}

// ============================================================================
// Request entry points
// ============================================================================

std::future<Result> HTTPClient::request(const std::string& url, const RequestOptions& call_options) {
    std::shared_ptr<PendingOutcome> outcome = start(url, call_options, nullptr);
    return outcome->future();
}

void HTTPClient::request(const std::string& url, const RequestOptions& call_options, Callback callback) {
    start(url, call_options, std::move(callback));
}

std::future<Result> HTTPClient::curl(const std::string& url, const RequestOptions& call_options) {
    return request(url, call_options);
}

void HTTPClient::curl(const std::string& url, const RequestOptions& call_options, Callback callback) {
    request(url, call_options, std::move(callback));
}

void HTTPClient::requestWithCallback(const std::string& url, const RequestOptions& call_options,
                                     Callback callback) {
    request(url, call_options, std::move(callback));
}

std::function<void(Callback)> HTTPClient::requestThunk(const std::string& url,
                                                       const RequestOptions& call_options) {
    return [this, url, call_options](Callback callback) {
        request(url, call_options, std::move(callback));
    };
}

size_t HTTPClient::on(EventType type, EventListener listener) {
    return engine->on(type, std::move(listener));
}

bool HTTPClient::off(size_t id) {
    return engine->off(id);
}

size_t HTTPClient::inFlight() const {
    std::lock_guard<std::mutex> lock(workers->mtx);
    return workers->in_flight;
}

void HTTPClient::shutdown() {
    // From inside a completion callback the request that runs it still holds its slot
    bool from_callback = t_callback_owner == workers.get();
    {
        std::unique_lock<std::mutex> lock(workers->mtx);
        workers->shut_down = true;
        workers->idle.wait(lock, [this, from_callback]() {
            return from_callback ? workers->in_flight <= workers->in_callbacks : workers->in_flight == 0;
        });
    }
    provider->shutdown();
}

// ============================================================================
// Private Helper Methods
// ============================================================================

std::shared_ptr<PendingOutcome> HTTPClient::start(const std::string& url, const RequestOptions& call_options,
                                                  Callback callback) {
    auto started = std::chrono::steady_clock::now();
    auto outcome = std::make_shared<PendingOutcome>();
    if (callback) {
        outcome->onSettled(guardCallback(std::move(callback)));
    }

    uint64_t request_id = g_next_request_id.fetch_add(1);
    std::string method = call_options.method.value_or(options.defaults.method.value_or("GET"));

    // Step 1: Reserve a worker slot
    {
        std::lock_guard<std::mutex> lock(workers->mtx);
        if (workers->shut_down) {
            engine->reject(request_id, method, url,
                           std::make_exception_ptr(ConnectError("client has been shut down")), outcome);
            return outcome;
        }
        workers->in_flight++;
    }

    // Step 2: Normalize, encode and execute on the worker thread
    std::shared_ptr<RequestEngine> request_engine = engine;
    std::shared_ptr<WorkerState> state = workers;
    RequestOptions defaults = options.defaults;
    auto work = [request_engine, state, outcome, url, defaults, call_options, request_id, method, started]() {
        try {
            RequestPlan plan = OptionNormalizer::normalize(url, defaults, call_options, request_id);
            BodyEncoder::encode(plan);
            request_engine->execute(std::move(plan), outcome, started);
        } catch (const RequestError&) {
            request_engine->reject(request_id, method, url, std::current_exception(), outcome);
        } catch (const std::exception& e) {
            // beforeRequest is caller code and may throw anything
            request_engine->reject(request_id, method, url,
                                   std::make_exception_ptr(InvalidOptionError(e.what())), outcome);
        }

        std::lock_guard<std::mutex> lock(state->mtx);
        state->in_flight--;
        state->idle.notify_all();
    };

    try {
        std::thread(std::move(work)).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(workers->mtx);
            workers->in_flight--;
            workers->idle.notify_all();
        }
        engine->reject(request_id, method, url,
                       std::make_exception_ptr(TransferError(std::string("cannot start worker: ") + e.what())),
                       outcome);
    }
    return outcome;
}

Callback HTTPClient::guardCallback(Callback callback) const {
    LogSettings log_settings{options.log_file, options.log_to_console};
    std::string client_id = options.client_id;
    std::shared_ptr<WorkerState> state = workers;
    return [callback = std::move(callback), log_settings, client_id, state](const RequestError* error,
                                                                            const ResponseData& data,
                                                                            std::shared_ptr<Response> res) {
        {
            std::lock_guard<std::mutex> lock(state->mtx);
            state->in_callbacks++;
        }

        {
            CallbackScope scope(state.get());
            try {
                callback(error, data, std::move(res));
            } catch (const std::exception& e) {
                Logger logger(client_id, log_settings);
                logger.logCustomMsg(fmt::format("Request callback threw: {}", e.what()));
            }
        }

        std::lock_guard<std::mutex> lock(state->mtx);
        state->in_callbacks--;
        state->idle.notify_all();
    };
}

// ============================================================================
// Default client
// ============================================================================

namespace httpreq {

const Timeout TIMEOUTS{TIMEOUT, TIMEOUT};
const std::string USER_AGENT = OptionNormalizer::userAgent();

namespace {

std::mutex g_default_mutex;
std::unique_ptr<HTTPClient> g_default_client;

}

HTTPClient& defaultClient() {
    std::lock_guard<std::mutex> lock(g_default_mutex);
    if (!g_default_client) {
        g_default_client = std::make_unique<HTTPClient>();
    }
    return *g_default_client;
}

void shutdownDefaultClient() {
    std::unique_ptr<HTTPClient> client;
    {
        std::lock_guard<std::mutex> lock(g_default_mutex);
        client = std::move(g_default_client);
    }
    if (client) {
        client->shutdown();
    }
}

std::shared_ptr<HTTPClient> create(ClientOptions options) {
    return std::make_shared<HTTPClient>(std::move(options));
}

std::future<Result> request(const std::string& url, const RequestOptions& options) {
    return defaultClient().request(url, options);
}

void request(const std::string& url, const RequestOptions& options, Callback callback) {
    defaultClient().request(url, options, std::move(callback));
}

std::future<Result> curl(const std::string& url, const RequestOptions& options) {
    return defaultClient().curl(url, options);
}

void curl(const std::string& url, const RequestOptions& options, Callback callback) {
    defaultClient().curl(url, options, std::move(callback));
}

void requestWithCallback(const std::string& url, const RequestOptions& options, Callback callback) {
    defaultClient().requestWithCallback(url, options, std::move(callback));
}

std::function<void(Callback)> requestThunk(const std::string& url, const RequestOptions& options) {
    return [url, options](Callback callback) {
        defaultClient().request(url, options, std::move(callback));
    };
}

} // namespace httpreq
