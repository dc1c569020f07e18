#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <dg_cidr_range.h>
#include <dg_defs.h>
#include <dg_logger.h>
#include <dg_socket_address.h>
#include <dnsfilter.h>

namespace dg {

/**
 * Decides which clients are served and which domains are never resolved
 */
class access_control {
public:
    struct create_result {
        std::unique_ptr<access_control> access;
        err_string error;
    };

    /**
     * @param allowed_clients    IPs and CIDRs of the only clients being served, if not empty
     * @param disallowed_clients IPs and CIDRs of the clients not being served
     * @param blocked_hosts      filtering rules matching the domains not being served
     */
    static create_result create(const std::vector<std::string> &allowed_clients,
            const std::vector<std::string> &disallowed_clients,
            const std::vector<std::string> &blocked_hosts);

    /**
     * Check if the client must not be served.
     * @return first:  true if the client is blocked
     *         second: the disallowed entry which blocked the client,
     *                 empty if the client is blocked because it is not in the non-empty allowed list
     */
    std::pair<bool, std::string> is_blocked_ip(const socket_address &ip) const;

    /**
     * Check if the domain must not be resolved
     */
    bool is_blocked_domain(std::string_view host) const;

private:
    struct client_list {
        std::vector<std::pair<std::string, cidr_range>> entries; // (configured text, range)

        bool empty() const { return entries.empty(); }
        const std::string *find(const socket_address &ip) const;
    };

    logger m_log = create_logger("access_control");
    client_list m_allowed;
    client_list m_disallowed;
    std::unique_ptr<dnsfilter> m_blocked_hosts;
    mutable std::mutex m_mtx;

    access_control() = default;

    static err_string parse_client_list(const std::vector<std::string> &src, client_list &dst);
};

} // namespace dg
