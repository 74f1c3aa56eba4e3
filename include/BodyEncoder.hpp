#ifndef BODY_ENCODER_HPP
#define BODY_ENCODER_HPP

#include "RequestPlan.hpp"

#include <string>

/**
 * BodyEncoder - Turns the plan's data/content/stream inputs into wire form
 *
 * Precedence: stream > content > data. For GET and HEAD (or when
 * dataAsQueryString is set) data goes into the URL query instead of the body.
 */
class BodyEncoder {
public:
    /**
     * Complete the plan's body, query and body headers in place
     *
     * @param plan Plan produced by OptionNormalizer
     */
    static void encode(RequestPlan& plan);

    /**
     * Serialize data as a query string (flat or nested bracket notation);
     * a string value is used as-is
     */
    static std::string toQueryString(const Json::Value& data, bool nested);

    /**
     * Compact JSON text for a request body
     */
    static std::string toJson(const Json::Value& data);

    /**
     * Whether a method sends its data in the query rather than the body
     */
    static bool isQueryMethod(const std::string& method);

    /**
     * Methods that always carry a Content-Length even without a body
     */
    static bool expectsBody(const std::string& method);

private:
    // Utility class - no instances allowed
    BodyEncoder() = delete;
};

#endif // BODY_ENCODER_HPP
