#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <dnsfilter.h>
#include "rule_utils.h"

namespace dg {

/**
 * A single loaded rule list
 */
class filter {
public:
    // Context of domain match
    struct match_context {
        std::string host; // matching domain name
        std::vector<std::string_view> subdomains; // the host and its parent domains except the TLD
        std::vector<filter_rule> matched_rules; // list of matched rules
    };

    /**
     * Fill the context for the host. The subdomains refer to `ctx.host`,
     * so the context must not be moved afterwards.
     */
    static void init_match_context(match_context &ctx, std::string_view host);

    filter();
    ~filter();

    filter(filter &&) noexcept;
    filter &operator=(filter &&) noexcept;

    filter(const filter &) = delete;
    filter &operator=(const filter &) = delete;

    /**
     * Load rule list
     * @param      params    filter parameters
     * @return     nullopt if successful, error otherwise
     */
    err_string load(const dnsfilter::filter_params &params);

    /**
     * Match domain against rules
     * @param      ctx   match context
     */
    void match(match_context &ctx) const;

    /**
     * Number of loaded rules
     */
    size_t rules_count() const;

    // Filter parameters
    dnsfilter::filter_params params;

private:
    class impl;
    std::unique_ptr<impl> m_pimpl;
};

} // namespace dg
