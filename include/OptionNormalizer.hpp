#ifndef OPTION_NORMALIZER_HPP
#define OPTION_NORMALIZER_HPP

#include "RequestOptions.hpp"
#include "RequestPlan.hpp"

#include <cstdint>
#include <string>

/**
 * OptionNormalizer - Resolves request options into a RequestPlan
 *
 * Precedence per field: call options > client defaults > library defaults.
 * All option validation happens here, before any I/O.
 */
class OptionNormalizer {
public:
    static constexpr long kDefaultTimeoutMs = 5000;
    static constexpr int kDefaultMaxRedirects = 10;

    /**
     * Build the plan for one logical request
     *
     * @param url Target URL; "http://" is assumed when no scheme is given
     * @param instance_defaults Client-level defaults
     * @param call_options Options of this call
     * @param request_id Id stamped on the plan
     * @return Resolved plan (body not yet encoded, see BodyEncoder)
     * @throws InvalidOptionError on conflicting or out-of-range options
     * @throws AuthError when digestAuth is not "user:password"
     */
    static RequestPlan normalize(const std::string& url,
                                 const RequestOptions& instance_defaults,
                                 const RequestOptions& call_options,
                                 uint64_t request_id = 0);

    /**
     * Default User-Agent value
     */
    static std::string userAgent();

private:
    static Url parseTarget(const std::string& url);
    static std::optional<Url> resolveProxy(const RequestOptions& options, const Url& target);
    static void validateHeaders(const HeaderMap& headers);

    // Utility class - no instances allowed
    OptionNormalizer() = delete;
};

#endif // OPTION_NORMALIZER_HPP
