#include "RequestEngine.hpp"
#include "CancelToken.hpp"
#include "HTTPUtils.hpp"
#include "RedirectFollower.hpp"
#include "RequestErrors.hpp"
#include "ResponseDecoder.hpp"
#include "ResponseStream.hpp"
#include "StringUtils.hpp"

#include <condition_variable>
#include <istream>

#include <fmt/format.h>

using namespace utils;

namespace {

constexpr size_t kUploadChunkSize = 16 * 1024;

std::string statusLine(const HTTPResponseParser::ResponseHead& head) {
    return fmt::format("{} {} {}", head.http_version, head.status_code, head.status_message);
}

}

// ============================================================================
// RequestContext
// ============================================================================

double RequestEngine::RequestContext::elapsedMs() const {
    auto elapsed = std::chrono::steady_clock::now() - started;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

void RequestEngine::RequestContext::mark(double TimingRecord::*field) {
    if (!timing) {
        return;
    }
    std::lock_guard<std::mutex> lock(mtx);
    timing_record.*field = elapsedMs();
}

void RequestEngine::RequestContext::publish(const Response& res) {
    auto copy = std::make_shared<Response>(res);
    std::lock_guard<std::mutex> lock(mtx);
    latest = copy;
}

std::shared_ptr<Response> RequestEngine::RequestContext::snapshot() {
    std::lock_guard<std::mutex> lock(mtx);
    return latest ? std::make_shared<Response>(*latest) : nullptr;
}

// ============================================================================
// Construction and events
// ============================================================================

RequestEngine::RequestEngine(std::shared_ptr<ConnectionProvider> provider,
                             std::shared_ptr<DigestCache> digest_cache,
                             LogSettings log_settings,
                             std::string client_id)
    : provider(std::move(provider)), digest_cache(std::move(digest_cache)),
      log_settings(std::move(log_settings)), client_id(std::move(client_id)) {}

size_t RequestEngine::on(EventType type, EventListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mtx);
    size_t id = next_listener_id++;
    listeners.emplace(id, std::make_pair(type, std::move(listener)));
    return id;
}

bool RequestEngine::off(size_t id) {
    std::lock_guard<std::mutex> lock(listeners_mtx);
    return listeners.erase(id) > 0;
}

void RequestEngine::emit(RequestContext& ctx, const RequestEvent& event) {
    std::vector<EventListener> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mtx);
        for (const auto& entry : listeners) {
            if (entry.second.first == event.type) {
                targets.push_back(entry.second.second);
            }
        }
    }

    for (const auto& listener : targets) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            ctx.logger->logCustomMsg(fmt::format("Event listener threw: {}", e.what()));
        }
    }
}

// ============================================================================
// Execution
// ============================================================================

void RequestEngine::execute(RequestPlan plan, std::shared_ptr<PendingOutcome> outcome,
                            std::chrono::steady_clock::time_point started) {
    auto ctx = std::make_shared<RequestContext>();
    ctx->request_id = plan.request_id;
    ctx->method = plan.method;
    ctx->url = plan.url.toString();
    ctx->timing = plan.timing;
    ctx->started = started;
    ctx->outcome = std::move(outcome);
    ctx->logger = std::make_unique<Logger>(fmt::format("{}-{}", client_id, plan.request_id), log_settings);
    ctx->mark(&TimingRecord::queuing);

    RequestEvent event{EventType::Request, ctx->request_id, ctx->method, ctx->url, nullptr, nullptr};
    emit(*ctx, event);

    try {
        run(plan, ctx);
    } catch (const RequestError&) {
        fail(ctx, std::current_exception());
    } catch (const std::exception& e) {
        fail(ctx, std::make_exception_ptr(TransferError(e.what())));
    }
}

void RequestEngine::reject(uint64_t request_id, const std::string& method, const std::string& url,
                           std::exception_ptr error, std::shared_ptr<PendingOutcome> outcome) {
    auto ctx = std::make_shared<RequestContext>();
    ctx->request_id = request_id;
    ctx->method = method;
    ctx->url = url;
    ctx->started = std::chrono::steady_clock::now();
    ctx->outcome = std::move(outcome);
    ctx->logger = std::make_unique<Logger>(fmt::format("{}-{}", client_id, request_id), log_settings);
    fail(ctx, error);
}

void RequestEngine::run(const RequestPlan& plan, const std::shared_ptr<RequestContext>& ctx) {
    AttemptState attempt{plan.method, plan.url, plan.headers, true, true};
    AuthState auth_state;
    std::shared_ptr<DigestCache::Entry> digest_entry;
    int hops = 0;

    // Basic credentials are attached up front unless the caller set the header
    if (const auto* basic = std::get_if<BasicCredentials>(&plan.auth)) {
        if (!attempt.headers.has("Authorization")) {
            attempt.headers.set("Authorization", AuthInjector::basicHeader(basic->username, basic->password));
        }
    }
    const auto* digest = std::get_if<DigestCredentials>(&plan.auth);

    while (true) {
        // Step 1: Credentials for this attempt
        std::optional<std::string> authorization;
        if (digest != nullptr && !attempt.headers.has("Authorization")) {
            authorization = digestAuthorization(*digest, attempt, auth_state, digest_entry);
        }

        {
            std::lock_guard<std::mutex> lock(ctx->mtx);
            ctx->request_urls.push_back(attempt.url.toString());
        }

        // Step 2: Send the request and read the response head
        AttemptResult result = sendAttempt(plan, attempt, authorization, ctx);

        // Step 3: Digest challenge, answered at most once per request
        if (digest != nullptr && result.head.status_code == 401 && !auth_state.retried &&
            attempt.digest_allowed && !attempt.headers.has("Authorization") &&
            answerDigestChallenge(attempt, result, auth_state, digest_entry)) {
            ctx->logger->logCustomMsg("Answering digest challenge for " + attempt.url.toString());
            discardBody(attempt, result);
            if (!result.timer->complete()) {
                return;
            }
            continue;
        }

        // Step 4: Redirects
        auto location = result.head.headers.get("Location");
        if (RedirectFollower::shouldFollow(plan.redirect, result.head.status_code, location)) {
            AttemptState next = RedirectFollower::nextAttempt(plan, attempt, result.head.status_code,
                                                              *location, hops);
            ctx->logger->logCustomMsg(fmt::format("Redirect {} -> {}", attempt.url.toString(),
                                                  next.url.toString()));
            discardBody(attempt, result);
            if (!result.timer->complete()) {
                return;
            }
            attempt = std::move(next);
            hops++;
            continue;
        }

        // Step 5: Final response
        consumeBody(plan, attempt, result, ctx);
        return;
    }
}

RequestEngine::AttemptResult RequestEngine::sendAttempt(const RequestPlan& plan,
                                                        const AttemptState& attempt,
                                                        const std::optional<std::string>& authorization,
                                                        const std::shared_ptr<RequestContext>& ctx) {
    AttemptResult result;
    result.cancel = std::make_shared<CancelToken>();

    std::weak_ptr<RequestContext> weak_ctx = ctx;
    std::string method = attempt.method;
    std::string url = attempt.url.toString();
    result.timer = std::make_unique<TimeoutController>(
        plan.connect_timeout_ms, plan.response_timeout_ms, result.cancel,
        [this, weak_ctx, method, url](TimeoutPhase phase, long timeout_ms) {
            auto owner = weak_ctx.lock();
            if (!owner) {
                return;
            }
            std::string message = fmt::format("{} timeout for {}ms, {} {}",
                                              phase == TimeoutPhase::Connect ? "Connect" : "Response",
                                              timeout_ms, method, url);
            fail(owner, std::make_exception_ptr(TimeoutError(phase, timeout_ms, message)));
        });

    // Step 1: Connect phase, acquisition until the request is flushed
    result.timer->startConnectPhase();
    result.conn = provider->acquire(plan, attempt.url, result.cancel, *ctx->logger,
                                    [&ctx](AcquireStage stage) {
                                        ctx->mark(stage == AcquireStage::Resolved
                                                      ? &TimingRecord::dns_lookup
                                                      : &TimingRecord::connected);
                                    });
    if (result.conn.reused()) {
        ctx->mark(&TimingRecord::connected);
    }

    std::shared_ptr<Agent> agent = provider->agentFor(plan, attempt.url);
    bool forwarded = ConnectionProvider::isForwardedThroughProxy(plan, attempt.url);

    HeaderMap headers;
    headers.set("Host", attempt.url.hostHeader());
    for (const auto& field : attempt.headers.fields()) {
        headers.append(field.first, field.second);
    }
    if (authorization) {
        headers.set("Authorization", *authorization);
    }
    if (!headers.has("Connection")) {
        headers.set("Connection", agent && agent->options().keep_alive ? "keep-alive" : "close");
    }
    if (forwarded && !plan.proxy->userinfo.empty() && !headers.has("Proxy-Authorization")) {
        headers.set("Proxy-Authorization", ConnectionProvider::proxyAuthorization(*plan.proxy));
    }
    if (!attempt.send_body) {
        headers.remove("Transfer-Encoding");
    }

    std::string target = forwarded ? attempt.url.toString() : attempt.url.requestTarget();
    std::string head = http_utils::buildRequestHead(attempt.method, target, headers);

    ctx->logger->logRequest(attempt.method + " " + attempt.url.toString());
    result.conn->writeAll(head);
    if (attempt.send_body) {
        writeBody(plan, *result.conn);
    }
    ctx->mark(&TimingRecord::request_sent);

    // Step 2: Response phase, until the body is consumed
    if (!result.timer->startResponsePhase()) {
        throw TransferError("attempt cancelled after its deadline expired");
    }
    result.head = HTTPResponseParser::readHead(*result.conn);
    ctx->mark(&TimingRecord::waiting);
    ctx->logger->logResponse(statusLine(result.head));

    Response& res = result.res;
    res.status_code = result.head.status_code;
    res.status_message = result.head.status_message;
    res.http_version = result.head.http_version;
    res.headers = result.head.headers;
    res.url = attempt.url.toString();
    res.keep_alive_socket = result.conn.reused();
    res.remote_address = result.conn->remoteAddress();
    res.remote_port = result.conn->remotePort();
    res.request_id = plan.request_id;
    {
        std::lock_guard<std::mutex> lock(ctx->mtx);
        res.request_urls = ctx->request_urls;
    }
    ctx->publish(res);

    auto connection = headers.get("Connection");
    result.reusable = agent && HTTPResponseParser::shouldKeepAlive(result.head) &&
                      !(connection && iequals(*connection, "close"));
    return result;
}

void RequestEngine::writeBody(const RequestPlan& plan, Connection& conn) {
    if (const auto* buffer = std::get_if<BufferBody>(&plan.body)) {
        if (!buffer->bytes.empty()) {
            conn.writeAll(buffer->bytes);
        }
        return;
    }

    const auto* stream = std::get_if<StreamBody>(&plan.body);
    if (stream == nullptr) {
        return;
    }
    if (stream->consumed->exchange(true)) {
        throw StreamReplayError("request stream was already sent and cannot be replayed");
    }

    // Each read is bounded so the upload never holds more than one chunk
    std::vector<char> chunk(kUploadChunkSize);
    while (true) {
        stream->stream->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize count = stream->stream->gcount();
        if (count > 0) {
            conn.writeAll(http_utils::encodeChunk(chunk.data(), static_cast<size_t>(count)));
        }
        if (stream->stream->bad()) {
            throw TransferError("failed to read the request stream");
        }
        if (stream->stream->eof() || count == 0) {
            break;
        }
    }
    conn.writeAll("0\r\n\r\n");
}

void RequestEngine::discardBody(const AttemptState& attempt, AttemptResult& result) {
    BodyReader reader(*result.conn, result.head, attempt.method);
    reader.drain();
    if (result.reusable && reader.framed()) {
        result.conn.release();
    } else {
        result.conn.destroy();
    }
}

void RequestEngine::consumeBody(const RequestPlan& plan, const AttemptState& attempt,
                                AttemptResult& result, const std::shared_ptr<RequestContext>& ctx) {
    Response& res = result.res;

    // Streaming: hand the live body over, the attempt ends with the head
    if (plan.sink.mode == SinkMode::Streaming) {
        if (!result.timer->complete()) {
            return;
        }
        res.stream = std::make_shared<ResponseStream>(std::move(result.conn), result.head,
                                                      attempt.method, result.reusable);
        succeed(ctx, ResponseData{}, std::make_shared<Response>(res));
        return;
    }

    std::shared_ptr<WritableStream> sink =
        plan.sink.mode == SinkMode::WriteStream ? plan.sink.write_stream : nullptr;
    ResponseDecoder decoder(plan.decode, result.head.headers, sink);

    // Step 1: Read the whole body, decoding as it arrives
    BodyReader reader(*result.conn, result.head, attempt.method);
    while (!reader.done()) {
        std::string piece = reader.next();
        if (piece.empty()) {
            break;
        }
        decoder.feed(piece);
    }
    ctx->mark(&TimingRecord::content_download);
    res.size = reader.bytesRead();
    ctx->publish(res);

    // Step 2: The connection is no longer needed
    if (result.reusable && reader.framed()) {
        result.conn.release();
    } else {
        ctx->logger->logConnectionClosed(result.conn->host(), result.conn->port());
        result.conn.destroy();
    }

    // Step 3: Decode, or finish the caller's stream
    ResponseData data = decoder.finish();
    if (sink) {
        if (plan.sink.consume_write_stream) {
            waitForWriteStream(*sink, *result.cancel);
        } else {
            sink->end([](std::exception_ptr) {});
        }
    }

    if (!result.timer->complete()) {
        return;
    }
    succeed(ctx, std::move(data), std::make_shared<Response>(res));
}

void RequestEngine::waitForWriteStream(WritableStream& sink, CancelToken& cancel) {
    struct FinishState {
        std::mutex mtx;
        std::condition_variable cv;
        bool finished = false;
        std::exception_ptr error;
    };
    auto state = std::make_shared<FinishState>();

    sink.end([state](std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->finished = true;
        state->error = error;
        state->cv.notify_all();
    });

    size_t subscription = cancel.subscribe([state]() {
        std::lock_guard<std::mutex> lock(state->mtx);
        state->cv.notify_all();
    });
    {
        std::unique_lock<std::mutex> lock(state->mtx);
        state->cv.wait(lock, [&]() { return state->finished || cancel.cancelled(); });
    }
    cancel.unsubscribe(subscription);

    std::lock_guard<std::mutex> lock(state->mtx);
    if (!state->finished) {
        throw TransferError("writeStream did not finish before the request was cancelled");
    }
    if (state->error) {
        try {
            std::rethrow_exception(state->error);
        } catch (const std::exception& e) {
            throw TransferError(std::string("writeStream failed: ") + e.what());
        }
    }
}

// ============================================================================
// Digest authentication
// ============================================================================

std::optional<std::string> RequestEngine::digestAuthorization(const DigestCredentials& credentials,
                                                              const AttemptState& attempt,
                                                              AuthState& state,
                                                              std::shared_ptr<DigestCache::Entry>& entry) {
    if (!attempt.digest_allowed) {
        return std::nullopt;
    }
    if (!entry && !state.challenge && digest_cache) {
        entry = digest_cache->find(attempt.url.origin());
    }

    DigestChallenge challenge;
    uint32_t nonce_count = 0;
    if (entry) {
        std::lock_guard<std::mutex> lock(entry->mtx);
        challenge = entry->challenge;
        nonce_count = ++entry->nonce_count;
    } else if (state.challenge) {
        challenge = *state.challenge;
        nonce_count = ++state.nonce_count;
    } else {
        return std::nullopt;
    }

    return AuthInjector::digestHeader(credentials, challenge, attempt.method,
                                      attempt.url.requestTarget(), nonce_count,
                                      AuthInjector::makeCnonce());
}

bool RequestEngine::answerDigestChallenge(const AttemptState& attempt, const AttemptResult& result,
                                          AuthState& state, std::shared_ptr<DigestCache::Entry>& entry) {
    for (const auto& header : result.head.headers.getAll("WWW-Authenticate")) {
        std::optional<DigestChallenge> challenge = AuthInjector::parseChallenge(header);
        if (!challenge) {
            continue;
        }
        state.challenge = challenge;
        state.nonce_count = 0;
        state.retried = true;
        if (digest_cache) {
            entry = digest_cache->store(attempt.url.origin(), *challenge);
        } else {
            entry.reset();
        }
        return true;
    }
    return false;
}

// ============================================================================
// Outcome
// ============================================================================

void RequestEngine::finalize(RequestContext& ctx, Response& res) {
    res.rt = ctx.elapsedMs();
    res.request_id = ctx.request_id;

    std::lock_guard<std::mutex> lock(ctx.mtx);
    res.request_urls = ctx.request_urls;
    if (ctx.timing) {
        res.timing = ctx.timing_record;
    }
}

void RequestEngine::succeed(const std::shared_ptr<RequestContext>& ctx, ResponseData data,
                            std::shared_ptr<Response> res) {
    if (ctx->finished.exchange(true)) {
        return;
    }
    finalize(*ctx, *res);

    RequestEvent event{EventType::Response, ctx->request_id, ctx->method, ctx->url, nullptr, res};
    emit(*ctx, event);
    ctx->outcome->resolve(std::move(data), std::move(res));
}

void RequestEngine::fail(const std::shared_ptr<RequestContext>& ctx, std::exception_ptr error) {
    if (ctx->finished.exchange(true)) {
        return;
    }

    std::shared_ptr<Response> res = ctx->snapshot();
    if (res) {
        finalize(*ctx, *res);
    }

    try {
        std::rethrow_exception(error);
    } catch (RequestError& e) {
        if (!e.response()) {
            e.setResponse(res);
        }
        e.setRequestId(ctx->request_id);
        ctx->logger->logCustomMsg(fmt::format("{}: {}", e.name(), e.what()));

        RequestEvent event{EventType::Error, ctx->request_id, ctx->method, ctx->url, &e, res};
        emit(*ctx, event);
    }
    ctx->outcome->reject(error, std::move(res));
}
