#pragma once

#include <bitset>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <ldns/ldns.h>
#include <dg_defs.h>

namespace dg {

enum rule_props {
    RP_EXCEPTION, // is exceptional (starts with `@@`)
    RP_IMPORTANT, // has `$important` modifier
    RP_BADFILTER, // has `$badfilter` modifier
    RP_NUM
};

/**
 * A rule from a filter list
 */
struct filter_rule {
    int32_t filter_id; // id of a filter which contains the matched rule
    std::string text; // rule text
    std::bitset<RP_NUM> props; // properties (see `rule_props`)
    std::optional<std::string> ip; // non-nullopt if the rule has hosts file syntax
};

/**
 * Filtering verdict kinds
 */
namespace verdict {

/** Nothing matched */
struct not_filtered {};

/** An exception rule matched */
struct whitelisted {
    std::string rule;
    int32_t filter_id = 0;
};

/** A blocking rule from a filter list matched */
struct blocked_by_list {
    std::string rule;
    int32_t filter_id = 0;
    /** Address from a hosts-file-syntax rule */
    std::optional<std::string> ip;
};

/** The domain is known to be dangerous */
struct blocked_by_safebrowsing {
    std::string rule;
};

/** The domain is inappropriate for children */
struct blocked_by_parental {
    std::string rule;
};

/** The search engine domain must be replaced with its safe version */
struct blocked_by_safesearch {
    std::string rule;
    /** IP address or host name of the safe version */
    std::string replacement;
};

/** The name is not a valid hostname */
struct blocked_invalid {};

/** The domain belongs to a blocked web service */
struct blocked_service {
    std::string rule;
    /** Id of the service, e.g. `youtube` */
    std::string service;
};

/** The domain is rewritten by the rewrites table */
struct rewritten {
    /** Non-empty if the domain is an alias of another name */
    std::string canonical_name;
    /** Addresses of a type matching the query */
    std::vector<std::string> ips;
};

} // namespace verdict

using filter_result = std::variant<
        verdict::not_filtered,
        verdict::whitelisted,
        verdict::blocked_by_list,
        verdict::blocked_by_safebrowsing,
        verdict::blocked_by_parental,
        verdict::blocked_by_safesearch,
        verdict::blocked_invalid,
        verdict::blocked_service,
        verdict::rewritten>;

/**
 * @return true if the verdict requires a blocking response
 */
bool is_filtered(const filter_result &result);

/**
 * @return short name of the verdict kind, used in logs and statistics
 */
std::string_view verdict_name(const filter_result &result);

/**
 * @return text of the rule that caused the verdict, empty if none
 */
std::string_view verdict_rule(const filter_result &result);

/**
 * Per-client filtering settings
 */
struct client_settings {
    bool filtering_enabled = true;
    bool safebrowsing_enabled = false;
    bool parental_enabled = false;
    bool safesearch_enabled = false;
    /** Ids of the services blocked for the client, nullopt to use the global list */
    std::optional<std::vector<std::string>> blocked_services;
};

/**
 * Filtering engine interface used by the DNS forwarder
 */
class filtering_engine {
public:
    struct check_result {
        filter_result result;
        err_string error;
    };

    virtual ~filtering_engine() = default;

    /**
     * Check a host name
     * @param host lowercase host name without the trailing dot
     * @param qtype query type
     * @param settings client filtering settings
     */
    virtual check_result check_host(std::string_view host, ldns_rr_type qtype, const client_settings &settings) = 0;

    /**
     * Check the CNAME targets and addresses of an upstream response against the filter lists
     * @return a blocking verdict or not_filtered
     */
    virtual check_result check_response(const ldns_pkt *response, const client_settings &settings) = 0;
};

/**
 * The DNS filter holds the rule lists, the rewrites table and the safety
 * databases, and matches host names against them.
 */
class dnsfilter : public filtering_engine {
public:
    struct filter_params {
        int32_t id = 0; // filter id
        std::string data; // path to file with rules or actual rules
        bool in_memory = false; // if true, data is actual rules, otherwise data is path to file with rules
    };

    struct rewrite_entry {
        std::string domain; // domain name, `*.` prefix matches subdomains
        std::string answer; // IP address or canonical name
    };

    struct engine_params {
        std::vector<filter_params> filters; // filter list
        std::vector<rewrite_entry> rewrites; // rewrites table
        std::vector<std::string> safebrowsing_domains; // dangerous domains, subdomains match too
        std::vector<std::string> parental_domains; // adult domains, subdomains match too
        std::vector<rewrite_entry> safesearch; // search engine domain -> safe IP or host
        std::vector<std::string> blocked_services; // ids of the services blocked for every client
    };

    struct create_result {
        std::unique_ptr<dnsfilter> filter;
        err_string error; // error, or warnings if the filter was created
    };

    /**
     * Create filtering engine
     * @param p engine parameters
     * @return {engine, nullopt} if succeeded
     *         {engine, warnings} if engine was created but some filters were not loaded
     *         {nullptr, error} if failed
     */
    static create_result create(const engine_params &p);

    ~dnsfilter() override;

    dnsfilter(const dnsfilter &) = delete;
    dnsfilter &operator=(const dnsfilter &) = delete;
    dnsfilter(dnsfilter &&) = delete;
    dnsfilter &operator=(dnsfilter &&) = delete;

    check_result check_host(std::string_view host, ldns_rr_type qtype, const client_settings &settings) override;

    check_result check_response(const ldns_pkt *response, const client_settings &settings) override;

    /**
     * Match host name against the filter lists only
     * @return all matched rules
     */
    std::vector<filter_rule> match(std::string_view host) const;

    /**
     * Select the rules which take effect from the matched ones
     * @param rules matched rules
     * @return the first blocking rule, or all the exceptions, or all the hosts-syntax rules
     */
    static std::vector<const filter_rule *> get_effective_rules(const std::vector<filter_rule> &rules);

    /**
     * Check if string is a valid rule
     */
    static bool is_valid_rule(std::string_view str);

    /**
     * Check if the name is acceptable as a host name
     */
    static bool is_valid_hostname(std::string_view host);

    /**
     * Check if there is a service with the given id, e.g. `youtube`
     */
    static bool is_known_service(std::string_view id);

    struct impl;

private:
    dnsfilter();

    std::unique_ptr<impl> m_impl;
};

} // namespace dg
