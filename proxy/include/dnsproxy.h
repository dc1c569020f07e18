#pragma once

#include <memory>
#include <string_view>
#include <utility>
#include <vector>
#include <dg_defs.h>
#include <dg_socket_address.h>
#include "dnsproxy_settings.h"
#include "dnsproxy_events.h"

namespace dg {

/**
 * DNS proxy module is intended to incapsulate DNS messages processing.
 * It parses, filters, communicates with a DNS resolver and generates answer to a client.
 * All the methods are safe to call from several threads.
 */
class dnsproxy {
public:
    static const err_string LISTENER_ERROR;

    dnsproxy();
    ~dnsproxy();

    dnsproxy(const dnsproxy &) = delete;
    dnsproxy(dnsproxy &&) = delete;
    dnsproxy &operator=(const dnsproxy &) = delete;
    dnsproxy &operator=(dnsproxy &&) = delete;

    /**
     * @brief Initialize the processing part of the proxy without opening any listeners.
     *        Fails if the proxy is running.
     *
     * @param settings proxy settings (see `dnsproxy_settings`)
     * @param events proxy events (see `dnsproxy_events`)
     * @return {true, opt_warning_description} or {false, error_description}
     */
    std::pair<bool, err_string> prepare(dnsproxy_settings settings, dnsproxy_events events);

    /**
     * @brief Initialize the proxy and start the configured listeners.
     *        Fails if the proxy is already running.
     *
     * @return {true, opt_warning_description} or {false, error_description}
     */
    std::pair<bool, err_string> start(dnsproxy_settings settings, dnsproxy_events events);

    /**
     * @brief Stop the listeners and release the resources. Does nothing if the proxy is not running.
     */
    void stop();

    /**
     * @brief Replace the settings. A running proxy is restarted with the new ones,
     *        the requests being processed are completed first.
     *
     * @return {true, opt_warning_description} or {false, error_description}
     */
    std::pair<bool, err_string> reconfigure(dnsproxy_settings settings);

    bool is_running() const;

    /**
     * @brief Resolve a host name to its addresses through the upstreams, bypassing the filtering
     */
    std::pair<std::vector<socket_address>, err_string> resolve(std::string_view host);

    /**
     * @brief Send a request to an upstream, bypassing the filtering
     */
    std::pair<ldns_pkt_ptr, err_string> exchange(const ldns_pkt *request);

    /**
     * @brief Check if the client is denied by the access settings
     * @return {true, matched rule} if blocked, the rule is empty if the client is not in the allowlist
     */
    std::pair<bool, std::string> is_blocked_ip(const socket_address &ip) const;

    /**
     * @brief Replace the DHCP leases the `.lan` names are answered from
     */
    void set_leases(const std::vector<dhcp_lease> &leases);

    void set_protection_enabled(bool enabled);

    /**
     * @brief Replace the global upstreams. The default ones are used if the list is empty.
     * @return error if none of the upstreams could be created, the old ones are kept in that case
     */
    err_string set_upstreams(std::vector<upstream_options> upstreams);

    /**
     * @brief Replace the filtering engine created from the settings. nullptr disables filtering.
     */
    void set_filtering_engine(std::shared_ptr<filtering_engine> engine);

    /**
     * @brief Get the DNS proxy settings
     * @return Current settings
     */
    dnsproxy_settings get_settings() const;

    /**
     * @brief Handle a DNS message
     *
     * @param message message from client
     * @param info (optional) additional information about the message in case it is being forwarded
     * @return A blocked DNS message in case of the message was blocked.
     *         A DNS resolver response in case of the message was passed.
     *         An empty buffer in case of error. This implies that no response
     *         should be sent to the requestor over the network.
     */
    uint8_vector handle_message(uint8_view message, const dns_message_info *info);

    /**
     * @brief Get the addresses the listeners are bound to
     */
    std::vector<std::pair<utils::transport_protocol, socket_address>> get_listen_addresses() const;

    /**
     * @brief Return the DNS proxy library version
     *
     * The caller does not take ownership of the returned string.
     */
    static const char *version();

private:
    struct impl;
    std::unique_ptr<impl> pimpl;
};

} // namespace dg
