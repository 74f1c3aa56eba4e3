#include "PendingOutcome.hpp"

PendingOutcome::PendingOutcome() : done(false) {}

bool PendingOutcome::resolve(ResponseData value, std::shared_ptr<Response> response) {
    bool expected = false;
    if (!done.compare_exchange_strong(expected, true)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        data = std::move(value);
        res = std::move(response);
        stored = true;
    }
    promise.set_value(Result{data, res});
    deliver();
    return true;
}

bool PendingOutcome::reject(std::exception_ptr exception, std::shared_ptr<Response> response) {
    bool expected = false;
    if (!done.compare_exchange_strong(expected, true)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        failed = true;
        error = exception;
        res = std::move(response);
        stored = true;
    }
    promise.set_exception(exception);
    deliver();
    return true;
}

std::future<Result> PendingOutcome::future() {
    return promise.get_future();
}

void PendingOutcome::onSettled(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        handler = std::move(callback);
    }
    deliver();
}

void PendingOutcome::deliver() {
    Callback callback;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!handler || !stored || delivered) {
            return;
        }
        delivered = true;
        callback = handler;
    }

    if (!failed) {
        callback(nullptr, data, res);
        return;
    }

    try {
        std::rethrow_exception(error);
    } catch (const RequestError& e) {
        callback(&e, ResponseData{}, res);
    } catch (const std::exception& e) {
        RequestError wrapped(ErrorKind::Transfer, e.what());
        callback(&wrapped, ResponseData{}, res);
    }
}
