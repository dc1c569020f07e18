#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <dg_logger.h>
#include <dnsfilter.h>

/**
 *  Set of helper functions to manage the rules
 *  Useful links:
 *   - https://github.com/AdguardTeam/AdguardHome/wiki/Hosts-Blocklists
 */
namespace dg::rule_utils {

    struct rule {
        enum match_method_id {
            MMID_EXACT, // match by comparing the domain's string repesentation against the rule domain string
            MMID_SUBDOMAINS, // a domain can be matched against such rule by comparing
                             // with items of `matching_parts`, if it's equal to any it's matched
            MMID_SHORTCUTS, // a domain can be matched against such rule, if it contains each item
                            // of `matching_parts` in corresponding order
                            // (e.g. `example*.org` -> { `example`, `.org` })
            MMID_REGEX, // a domain can be matched against such rule only by applying the regex
            MMID_SHORTCUTS_AND_REGEX, // the regex is applied only if the domain contains
                                      // the shortcuts extracted from the rule
                                      // (e.g. `/exampl.*\.com/` -> { `exampl`, `.com` })
        };

        // public part of rule structure
        filter_rule public_part;
        // see `match_method_id`
        match_method_id match_method = MMID_EXACT;
        // list of matching parts accordingly to `match_method` value
        std::vector<std::string> matching_parts;
    };

    /**
     * Check if string is a commentary
     */
    static inline bool is_comment(std::string_view str) {
        return !str.empty() && (str[0] == '!' || str[0] == '#');
    }

    /**
     * Parse rule from given string
     * @param[in]  str   input string
     * @param[in]  log   logger (if null, rule parsing errors won't be logged)
     * @return     A rule if parsed successfully,
     *             nullopt otherwise
     */
    std::optional<rule> parse(std::string_view str, const logger *log = nullptr);

    /**
     * Extract a regular expression text from rule
     * @param[in]  r     rule of `MMID_REGEX` or `MMID_SHORTCUTS_AND_REGEX` kind
     * @return     Regular expression text
     */
    std::string get_regex(const rule &r);

    /**
     * Generate the rule text without badfilter modifier
     * @param[in]  r     rule
     * @return     Text without badfilter modifier
     */
    std::string get_text_without_badfilter(const filter_rule &r);

} // namespace dg::rule_utils
