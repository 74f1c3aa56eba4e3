#include "CancelToken.hpp"

#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <system_error>
#include <vector>

CancelToken::CancelToken() {
    event_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
}

CancelToken::~CancelToken() {
    close(event_fd);
}

void CancelToken::cancel() {
    bool expected = false;
    if (!is_cancelled.compare_exchange_strong(expected, true)) {
        return;
    }

    uint64_t one = 1;
    // The counter is never drained, so a failed write can only mean it is already signalled
    ssize_t written = write(event_fd, &one, sizeof(one));
    (void)written;

    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& entry : subscribers) {
            to_run.push_back(std::move(entry.second));
        }
        subscribers.clear();
    }
    for (auto& callback : to_run) {
        callback();
    }
}

size_t CancelToken::subscribe(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!is_cancelled.load()) {
            size_t id = next_id++;
            subscribers.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancelToken::unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(mtx);
    subscribers.erase(id);
}
