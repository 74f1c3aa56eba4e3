#include "RequestErrors.hpp"
#include "Response.hpp"

const char* toString(TimeoutPhase phase) {
    return phase == TimeoutPhase::Connect ? "connect" : "response";
}

RequestError::RequestError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), error_kind(kind) {}

std::string RequestError::name() const {
    return "RequestError";
}

int RequestError::status() const {
    return partial_response ? partial_response->status_code : 0;
}

TimeoutError::TimeoutError(TimeoutPhase phase, long timeout_ms, const std::string& message)
    : RequestError(ErrorKind::Timeout, message), timeout_phase(phase), timeout_ms(timeout_ms) {}

std::string TimeoutError::name() const {
    return timeout_phase == TimeoutPhase::Connect ? "ConnectionTimeoutError" : "ResponseTimeoutError";
}
