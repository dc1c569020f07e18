#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <magic_enum.hpp>
#include <dg_logger.h>
#include <dg_net_utils.h>
#include <dnsfilter.h>
#include <upstream.h>

namespace dg {

/**
 * Specifies how to respond to blocked requests
 */
enum class dnsproxy_blocking_mode {
    /** Respond with the address from the rule, if any, otherwise as in NULL_IP mode */
    DEFAULT,
    /** Respond with REFUSED response code */
    REFUSED,
    /** Respond with NXDOMAIN response code */
    NXDOMAIN,
    /** Respond with 0.0.0.0 or ::, or with an empty response if request type is not A/AAAA */
    NULL_IP,
    /** Respond with `custom_blocking_ipv4` or `custom_blocking_ipv6` */
    CUSTOM_IP,
};

struct listener_settings {
    std::string address{"::"}; // The address to listen on
    uint16_t port{53}; // The port to listen on
    utils::transport_protocol protocol{utils::TP_UDP}; // The protocol to listen for
    bool persistent{false}; // If true, don't close the TCP connection after sending the first response
    std::chrono::milliseconds idle_timeout{3000}; // Close the TCP connection this long after the last request received

    /// If not -1, listen on this file descriptor, which must already be bound.
    /// The ownership is not transferred (caller must close the fd).
    int fd{-1};

    std::string str() const {
        return fmt::format(
                "(protocol: {}, address: {}, port: {}, persistent: {}, idle_timeout: {} ms)",
                magic_enum::enum_name(protocol), address, port, persistent, idle_timeout.count());
    }
};

/**
 * A lease of the local DHCP server, used to answer for the `.lan` names
 */
struct dhcp_lease {
    std::string hostname;
    std::string ip;
};

struct dnsproxy_settings {
    /**
     * Get the default DNS proxy settings
     * @return default DNS proxy settings
     */
    static const dnsproxy_settings &get_default();

    std::vector<upstream_options> upstreams; // DNS upstreams settings list, the default ones are used if empty

    std::vector<listener_settings> listeners; // List of addresses/ports/protocols/etc... to listen on

    bool protection_enabled; // Whether any filtering is applied

    dnsfilter::engine_params filter_params; // Filtering engine parameters (see `dnsfilter::engine_params`)

    dnsproxy_blocking_mode blocking_mode; // How to respond to blocked requests

    std::string custom_blocking_ipv4; // IPv4 address to return for filtered requests in CUSTOM_IP mode
    std::string custom_blocking_ipv6; // IPv6 address to return for filtered requests in CUSTOM_IP mode

    uint32_t blocked_response_ttl_secs; // TTL of the record for the blocked domains (in seconds)

    /** IP address or host name to answer with for the requests blocked by the safe browsing */
    std::string safebrowsing_block_host;
    /** IP address or host name to answer with for the requests blocked by the parental control */
    std::string parental_block_host;

    bool refuse_any; // Respond with NOTIMP to ANY requests and don't log them

    std::vector<std::string> allowed_clients; // IPs and CIDRs of the only clients being served, if not empty
    std::vector<std::string> disallowed_clients; // IPs and CIDRs of the clients not being served
    std::vector<std::string> blocked_hosts; // Rules for the domains not being served

    size_t dns_cache_size; // Maximum number of cached responses, 0 disables caching
    uint32_t cache_min_ttl; // If not 0, cache responses for at least this long (in seconds)
    uint32_t cache_max_ttl; // If not 0, cache responses for at most this long (in seconds)

    std::vector<std::string> bogus_nxdomain; // Responses containing these addresses are replaced with NXDOMAIN

    bool aaaa_disabled; // Respond with an empty answer to all AAAA requests

    /**
     * Request DNSSEC records from the upstreams.
     * The signatures a client did not ask for are removed from the responses.
     */
    bool enable_dnssec;

    bool ipv6_available; // If false, bootstrappers will fetch only A records
};

} // namespace dg
