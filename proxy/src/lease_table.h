#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <dg_defs.h>
#include <dg_logger.h>
#include <dg_socket_address.h>
#include <dnsproxy_settings.h>

namespace dg {

/**
 * Names and addresses leased by the local DHCP server, served under the `lan.` zone
 */
class lease_table {
public:
    /**
     * Replace the table contents. Leases with empty or malformed host names are skipped.
     */
    void update(const std::vector<dhcp_lease> &leases);

    /**
     * @param host host name without the `.lan.` suffix, case-insensitive
     * @return leased IPv4 address, if any
     */
    std::optional<std::string> find_ip(std::string_view host) const;

    /**
     * @return lowercase host name holding the address, if any
     */
    std::optional<std::string> find_host(const socket_address &ip) const;

    /**
     * Convert a reverse lookup name (`4.3.2.1.in-addr.arpa`, `...ip6.arpa`) to the address
     * @return an invalid address if the name is not a reverse lookup name
     */
    static socket_address unreverse_addr(std::string_view arpa);

    static bool is_valid_hostname(std::string_view host);

private:
    struct tables {
        hash_map<std::string, std::string> host_to_ip;
        hash_map<socket_address, std::string> ip_to_host;
    };

    logger m_log = create_logger("lease_table");
    with_mtx<tables> m_tables;
};

} // namespace dg
