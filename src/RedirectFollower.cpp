#include "RedirectFollower.hpp"
#include "RequestErrors.hpp"

bool RedirectFollower::isRedirect(int status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 ||
           status_code == 307 || status_code == 308;
}

bool RedirectFollower::shouldFollow(const RedirectPolicy& policy, int status_code,
                                    const std::optional<std::string>& location) {
    return policy.follow && isRedirect(status_code) && location.has_value() && !location->empty();
}

AttemptState RedirectFollower::nextAttempt(const RequestPlan& plan,
                                           const AttemptState& current,
                                           int status_code,
                                           const std::string& location,
                                           int hops_taken) {
    // Step 1: Hop budget
    if (hops_taken >= plan.redirect.max_redirects) {
        throw TooManyRedirectsError(plan.redirect.max_redirects,
            "Exceeded maxRedirects. Probably stuck in a redirect loop " + current.url.toString());
    }

    // Step 2: Resolve the target
    std::string from = current.url.toString();
    Url target;
    if (plan.redirect.formatter) {
        std::string formatted = plan.redirect.formatter(from, location);
        target = Url::resolve(current.url, formatted);
    } else {
        target = Url::resolve(current.url, location);
    }
    if (!target.valid || (target.scheme != "http" && target.scheme != "https")) {
        throw ProtocolError("cannot follow redirect to '" + location + "'");
    }

    AttemptState next = current;
    next.url = target;

    // Step 3: Method and body
    bool to_get = (status_code == 303 && current.method != "HEAD") ||
                  ((status_code == 301 || status_code == 302) &&
                   (current.method == "POST" || current.method == "PUT" || current.method == "PATCH"));
    if (to_get) {
        next.method = "GET";
        next.send_body = false;
    } else if (current.send_body && plan.hasStreamBody() && std::get<StreamBody>(plan.body).consumed->load()) {
        throw StreamReplayError("cannot replay a consumed request stream after " +
                                std::to_string(status_code) + " redirect to " + target.toString());
    }

    if (!next.send_body) {
        next.headers.remove("Content-Type");
        next.headers.remove("Content-Length");
        next.headers.remove("Transfer-Encoding");
    }

    // Step 4: Never leak credentials to another origin
    if (!target.sameOrigin(current.url)) {
        next.headers.remove("Authorization");
        next.headers.remove("Proxy-Authorization");
        next.headers.remove("Cookie");
        next.digest_allowed = false;
    }

    next.headers.remove("Host");
    return next;
}
