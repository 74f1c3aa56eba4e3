#ifndef CANCEL_TOKEN_HPP
#define CANCEL_TOKEN_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

/**
 * CancelToken - One-shot cancellation signal for an attempt
 *
 * Wraps an eventfd so blocking socket waits can poll() it alongside the
 * socket: once cancel() is called the eventfd stays readable and every
 * wait returns immediately. cancel() is idempotent.
 */
class CancelToken {
public:
    CancelToken();
    ~CancelToken();

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    /**
     * Trip the token and run subscribers (only the first call has effect)
     */
    void cancel();

    bool cancelled() const { return is_cancelled.load(); }

    /**
     * File descriptor that becomes readable on cancellation
     */
    int fd() const { return event_fd; }

    /**
     * Run a callback on cancellation; runs immediately if already cancelled
     *
     * @return Subscription id for unsubscribe()
     */
    size_t subscribe(std::function<void()> callback);
    void unsubscribe(size_t id);

private:
    int event_fd;
    std::atomic<bool> is_cancelled{false};
    std::mutex mtx;
    std::map<size_t, std::function<void()>> subscribers;
    size_t next_id = 1;
};

#endif // CANCEL_TOKEN_HPP
