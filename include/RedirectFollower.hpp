#ifndef REDIRECT_FOLLOWER_HPP
#define REDIRECT_FOLLOWER_HPP

#include "RequestPlan.hpp"

#include <optional>
#include <string>

/**
 * RedirectFollower - Turns a 3xx response into the next attempt
 *
 * Method rewriting:
 * - 301/302 on POST, PUT or PATCH and 303 on anything but HEAD become GET
 *   without a body
 * - 307/308 keep method and body; a body that came from a single-use
 *   stream cannot be sent again
 *
 * Header rewriting: Host is derived from the new URL; body headers go with
 * the body; credentials and cookies are dropped when the origin changes.
 */
class RedirectFollower {
public:
    /**
     * 301, 302, 303, 307 or 308
     */
    static bool isRedirect(int status_code);

    /**
     * Whether this response should be followed under the plan's policy
     *
     * @param policy Redirect policy
     * @param status_code Response status
     * @param location Location header, if any
     */
    static bool shouldFollow(const RedirectPolicy& policy, int status_code,
                             const std::optional<std::string>& location);

    /**
     * Build the next attempt
     *
     * @param plan Request plan (redirect policy and body source)
     * @param current Attempt that received the redirect
     * @param status_code Redirect status
     * @param location Location header value
     * @param hops_taken Redirects already followed
     * @return Attempt for the new target
     * @throws TooManyRedirectsError when hops_taken reaches max_redirects
     * @throws StreamReplayError when a consumed stream body would be resent
     * @throws ProtocolError when the Location cannot be resolved to an http(s) URL
     */
    static AttemptState nextAttempt(const RequestPlan& plan,
                                    const AttemptState& current,
                                    int status_code,
                                    const std::string& location,
                                    int hops_taken);
};

#endif // REDIRECT_FOLLOWER_HPP
