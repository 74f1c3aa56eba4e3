#ifndef PENDING_OUTCOME_HPP
#define PENDING_OUTCOME_HPP

#include "RequestErrors.hpp"
#include "Response.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>

/**
 * Callback form of a request outcome
 *
 * error is nullptr on success. res carries the response when one was
 * received, also on failure.
 */
using Callback = std::function<void(const RequestError* error, const ResponseData& data,
                                    std::shared_ptr<Response> res)>;

/**
 * PendingOutcome - The single terminal result of one logical request
 *
 * resolve() and reject() race on one atomic flag; only the first call
 * settles the outcome, later calls return false and have no effect. The
 * outcome backs a std::future and, optionally, a completion handler.
 */
class PendingOutcome {
public:
    PendingOutcome();

    PendingOutcome(const PendingOutcome&) = delete;
    PendingOutcome& operator=(const PendingOutcome&) = delete;

    /**
     * Settle with success
     *
     * @return true if this call settled the outcome
     */
    bool resolve(ResponseData data, std::shared_ptr<Response> res);

    /**
     * Settle with failure
     *
     * @param error Exception pointer holding a RequestError
     * @param res Partial response, may be nullptr
     * @return true if this call settled the outcome
     */
    bool reject(std::exception_ptr error, std::shared_ptr<Response> res);

    bool settled() const { return done.load(); }

    /**
     * Future of the outcome; may be retrieved once
     */
    std::future<Result> future();

    /**
     * Register the completion handler, called exactly once on the settling
     * thread (immediately if the outcome is already settled)
     */
    void onSettled(Callback callback);

private:
    void deliver();

    std::atomic<bool> done;
    std::promise<Result> promise;

    std::mutex mutex;
    Callback handler;
    bool stored = false;
    bool delivered = false;
    bool failed = false;
    ResponseData data;
    std::shared_ptr<Response> res;
    std::exception_ptr error;
};

#endif // PENDING_OUTCOME_HPP
