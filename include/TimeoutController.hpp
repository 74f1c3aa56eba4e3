#ifndef TIMEOUT_CONTROLLER_HPP
#define TIMEOUT_CONTROLLER_HPP

#include "RequestErrors.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

class CancelToken;

/**
 * TimeoutController - Connect-phase and response-phase deadlines for one attempt
 *
 * A watchdog thread sleeps until the active phase's deadline. If the
 * deadline passes before complete() is called, the watchdog trips the
 * attempt's CancelToken (aborting any blocked socket wait) and invokes the
 * expiry handler. Completion and expiry are decided under one lock, so
 * exactly one of them wins and the loser is a no-op.
 *
 * A timeout of 0 disables that phase's deadline.
 */
class TimeoutController {
public:
    using ExpiryHandler = std::function<void(TimeoutPhase phase, long timeout_ms)>;

    /**
     * @param connect_ms Connect-phase deadline
     * @param response_ms Response-phase deadline
     * @param cancel Token tripped on expiry
     * @param on_expire Runs on the watchdog thread after the token is tripped
     */
    TimeoutController(long connect_ms, long response_ms,
                      std::shared_ptr<CancelToken> cancel, ExpiryHandler on_expire);
    ~TimeoutController();

    TimeoutController(const TimeoutController&) = delete;
    TimeoutController& operator=(const TimeoutController&) = delete;

    /**
     * Start the connect-phase clock (connection acquisition begins)
     */
    void startConnectPhase();

    /**
     * Stop the connect clock and start the response clock (request fully written)
     *
     * @return false if the attempt already expired
     */
    bool startResponsePhase();

    /**
     * Stop all clocks
     *
     * @return true if completion won, false if a deadline already expired
     */
    bool complete();

    /**
     * Phase that expired, if any
     */
    std::optional<TimeoutPhase> expiredPhase() const;

private:
    enum class State {
        Idle,
        Connect,
        Response,
        Completed,
        Expired
    };

    void enterPhase(State phase, long timeout_ms);
    void run();

    long connect_ms;
    long response_ms;
    std::shared_ptr<CancelToken> cancel;
    ExpiryHandler on_expire;

    mutable std::mutex mtx;
    std::condition_variable cv;
    State state = State::Idle;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::optional<TimeoutPhase> expired_phase;
    bool stopping = false;
    std::thread watchdog;
};

#endif // TIMEOUT_CONTROLLER_HPP
