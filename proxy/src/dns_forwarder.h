#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <ldns/ldns.h>
#include <dg_cidr_range.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include <dg_logger.h>
#include <dg_utils.h>
#include <dnsfilter.h>
#include <dnsproxy_events.h>
#include <dnsproxy_settings.h>
#include <upstream.h>
#include <upstream_selector.h>
#include "access_control.h"
#include "lease_table.h"
#include "response_cache.h"

namespace dg {

namespace dns_forwarder_utils {
/**
 * Format RR list using the following format:
 * <Type>, <RDFs, space separated>\n
 * e.g.:
 * A, 1.2.3.4
 * AAAA, 12::34
 * CNAME, google.com.
 */
std::string rr_list_to_string(const ldns_rr_list *rr_list);
} // namespace dns_forwarder_utils

/**
 * Runs every incoming request through the processing stages:
 * initial checks, internal hosts, filtering, upstream resolution, DNSSEC cleanup,
 * response filtering and, in any case, logging.
 */
class dns_forwarder {
public:
    enum class stage_result {
        CONTINUE, // go to the next stage
        FINISH, // the response is ready, skip the rest of the stages
        ERROR, // processing failed, `processing_context::error` tells why
    };

    /**
     * The state of a single request, owned by the thread processing it
     */
    struct processing_context {
        ldns_pkt_ptr request;
        ldns_pkt_ptr response;
        ldns_pkt_ptr original_response; // the upstream response replaced after the response filtering
        std::optional<dns_message_info> info;
        client_settings client;
        filter_result result;
        ldns_rr_ptr original_question; // saved when a rewrite replaced the question
        bool protection_enabled = false;
        bool response_from_upstream = false;
        bool orig_req_dnssec = false; // the client itself asked for DNSSEC records
        bool cache_hit = false;
        std::string upstream_address;
        err_string error;
        int64_t start_time = 0; // epoch milliseconds
        utils::timer timer;
    };

    struct resolve_result {
        ldns_pkt_ptr response;
        std::string upstream_address; // empty if served from the cache
        bool cache_hit = false;
        err_string error;
    };

    /**
     * @param config_mtx guards the settings which may be changed while the requests are processed
     */
    explicit dns_forwarder(std::shared_mutex &config_mtx);
    ~dns_forwarder();

    dns_forwarder(const dns_forwarder &) = delete;
    dns_forwarder &operator=(const dns_forwarder &) = delete;

    /**
     * Must be called with `config_mtx` exclusively locked
     */
    std::pair<bool, err_string> init(const dnsproxy_settings &settings, const dnsproxy_events &events);

    /**
     * Must be called with `config_mtx` exclusively locked
     */
    void deinit();

    /**
     * Process a raw request
     * @return raw response, or an empty vector if the request must be dropped
     */
    uint8_vector handle_message(uint8_view message, const dns_message_info *info);

    /**
     * Run the request in `ctx` through the processing stages.
     * `ctx.response` is always set afterwards.
     */
    stage_result process(processing_context &ctx);

    /**
     * Resolve `request` without filtering and logging
     */
    upstream::exchange_result exchange(const ldns_pkt *request);

    /**
     * Resolve the host's addresses without filtering and logging
     */
    std::pair<std::vector<socket_address>, err_string> resolve(std::string_view host);

    std::pair<bool, std::string> is_blocked_ip(const socket_address &ip) const;

    void set_leases(const std::vector<dhcp_lease> &leases);

    // The setters below must be called with `config_mtx` exclusively locked

    void set_protection_enabled(bool enabled);

    err_string set_upstreams(const std::vector<upstream_options> &options);

    /**
     * Replace the filtering engine created from the settings, nullptr disables filtering
     */
    void set_filtering_engine(std::shared_ptr<filtering_engine> engine);

    /**
     * Must be called with `config_mtx` locked
     */
    const dnsproxy_settings &settings() const { return m_settings; }

private:
    using stage_fn = stage_result (dns_forwarder::*)(processing_context &);

    logger m_log;
    std::shared_mutex &m_config_mtx;

    // Apart from `protection_enabled`, changed only when no requests are processed
    dnsproxy_settings m_settings;
    dnsproxy_events m_events;

    upstream_list m_upstreams;
    std::shared_ptr<filtering_engine> m_filter;
    std::shared_ptr<response_cache> m_cache;
    std::shared_ptr<access_control> m_access;
    std::vector<cidr_range> m_bogus_nxdomain;
    lease_table m_leases;

    static const stage_fn STAGES[];

    stage_result process_initial(processing_context &ctx);
    stage_result process_internal_hosts(processing_context &ctx);
    stage_result process_internal_ip_addrs(processing_context &ctx);
    stage_result process_filtering_before_request(processing_context &ctx);
    stage_result process_upstream(processing_context &ctx);
    stage_result process_dnssec_after_response(processing_context &ctx);
    stage_result process_filtering_after_response(processing_context &ctx);
    void process_query_logs_and_stats(const processing_context &ctx);

    resolve_result do_upstream_exchange(ldns_pkt *request, const upstream_list *custom_upstreams);

    ldns_pkt_ptr create_blocking_response(const processing_context &ctx);
    ldns_pkt_ptr create_mode_response(const ldns_pkt *request, const std::optional<std::string> &rule_ip) const;
    ldns_pkt_ptr create_blocked_host_response(const processing_context &ctx, std::string_view block_host);

    bool is_bogus_nxdomain(const ldns_pkt *response) const;

    std::pair<upstream_list, err_string> create_upstreams(const std::vector<upstream_options> &options) const;
};

} // namespace dg
