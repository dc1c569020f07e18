#pragma once

#include <cstdint>
#include <string_view>
#include <ldns/ldns.h>
#include <dnsfilter.h>
#include <dnsproxy_settings.h>

namespace dg {

/**
 * Helpers for creating responses.
 * The caller owns the returned packets.
 */
class response_helpers {
public:
    static constexpr uint32_t SOA_RETRY_DEFAULT = 900;
    static constexpr uint32_t SOA_RETRY_IPV6_BLOCK = 60;

    /**
     * Create a reply shell: the request's ID, flags and question, recursion available
     */
    static ldns_pkt *create_response_by_request(const ldns_pkt *request);

    static ldns_pkt *create_servfail_response(const ldns_pkt *request);

    static ldns_pkt *create_refused_response(const ldns_pkt *request);

    static ldns_pkt *create_notimpl_response(const ldns_pkt *request);

    /**
     * Create NXDOMAIN response with the negative caching SOA record
     */
    static ldns_pkt *create_nxdomain_response(const ldns_pkt *request, const dnsproxy_settings &settings);

    /**
     * Create an empty NOERROR response with the negative caching SOA record
     */
    static ldns_pkt *create_soa_response(const ldns_pkt *request, const dnsproxy_settings &settings,
            uint32_t retry_secs);

    /**
     * Create a response with a single A or AAAA record, depending on the question type.
     * An empty response is returned if the address does not fit the question type.
     */
    static ldns_pkt *create_response_with_ip(const ldns_pkt *request, const dnsproxy_settings &settings,
            std::string_view ip);

    /**
     * Respond with 0.0.0.0 to A, with :: to AAAA, and with an empty response to other types
     */
    static ldns_pkt *create_null_ip_response(const ldns_pkt *request, const dnsproxy_settings &settings);

    /**
     * Respond with the configured blocking addresses
     */
    static ldns_pkt *create_custom_ip_response(const ldns_pkt *request, const dnsproxy_settings &settings);

    /**
     * Create a response for a rewritten name: a CNAME to the canonical name, if there is one,
     * followed by the addresses
     */
    static ldns_pkt *create_rewrite_response(const ldns_pkt *request, const dnsproxy_settings &settings,
            const verdict::rewritten &rewrite);

    /**
     * Create a response to `request` carrying the answers of `resolved` renamed to the request's name
     */
    static ldns_pkt *create_redirect_response(const ldns_pkt *request, const ldns_pkt *resolved);

    static ldns_pkt *create_ptr_response(const ldns_pkt *request, const dnsproxy_settings &settings,
            std::string_view host);

    /**
     * Create a CNAME record from the request's name to `cname`
     */
    static ldns_rr *create_cname_rr(const ldns_pkt *request, const dnsproxy_settings &settings,
            std::string_view cname);

    /**
     * Create the negative caching SOA record.
     * Its TTL is the blocked response TTL, or 3600 seconds if that is not set.
     */
    static ldns_rr *create_soa(const ldns_pkt *request, const dnsproxy_settings &settings, uint32_t retry_secs);
};

} // namespace dg
