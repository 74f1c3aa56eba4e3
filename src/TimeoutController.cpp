#include "TimeoutController.hpp"
#include "CancelToken.hpp"

TimeoutController::TimeoutController(long connect_ms, long response_ms,
                                     std::shared_ptr<CancelToken> cancel, ExpiryHandler on_expire)
    : connect_ms(connect_ms), response_ms(response_ms),
      cancel(std::move(cancel)), on_expire(std::move(on_expire)) {}

TimeoutController::~TimeoutController() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
    }
    cv.notify_all();
    if (watchdog.joinable()) {
        if (watchdog.get_id() == std::this_thread::get_id()) {
            watchdog.detach();
        } else {
            watchdog.join();
        }
    }
}

// ============================================================================
// Phase transitions
// ============================================================================

void TimeoutController::startConnectPhase() {
    enterPhase(State::Connect, connect_ms);
}

bool TimeoutController::startResponsePhase() {
    enterPhase(State::Response, response_ms);
    std::lock_guard<std::mutex> lock(mtx);
    return state != State::Expired;
}

bool TimeoutController::complete() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state == State::Expired) {
            return false;
        }
        state = State::Completed;
        deadline.reset();
        stopping = true;
    }
    cv.notify_all();
    return true;
}

std::optional<TimeoutPhase> TimeoutController::expiredPhase() const {
    std::lock_guard<std::mutex> lock(mtx);
    return expired_phase;
}

void TimeoutController::enterPhase(State phase, long timeout_ms) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state == State::Expired || state == State::Completed) {
            return;
        }
        state = phase;
        if (timeout_ms > 0) {
            deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        } else {
            deadline.reset();
        }
        if (!watchdog.joinable()) {
            watchdog = std::thread(&TimeoutController::run, this);
        }
    }
    cv.notify_all();
}

// ============================================================================
// Watchdog
// ============================================================================

void TimeoutController::run() {
    std::unique_lock<std::mutex> lock(mtx);

    while (!stopping) {
        if (!deadline) {
            cv.wait(lock);
            continue;
        }

        auto until = *deadline;
        if (cv.wait_until(lock, until) != std::cv_status::timeout) {
            continue;   // phase changed, completed or spurious wakeup
        }
        if (stopping || !deadline || std::chrono::steady_clock::now() < *deadline) {
            continue;
        }

        // Deadline passed while still in the same phase: expiry wins
        TimeoutPhase phase = state == State::Connect ? TimeoutPhase::Connect : TimeoutPhase::Response;
        long timeout_ms = phase == TimeoutPhase::Connect ? connect_ms : response_ms;
        state = State::Expired;
        expired_phase = phase;
        deadline.reset();
        lock.unlock();

        cancel->cancel();
        if (on_expire) {
            on_expire(phase, timeout_ms);
        }
        return;
    }
}
