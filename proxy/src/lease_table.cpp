#include <algorithm>
#include <dg_utils.h>
#include "lease_table.h"

namespace dg {

static constexpr std::string_view IPV4_ARPA_SUFFIX = ".in-addr.arpa";
static constexpr std::string_view IPV6_ARPA_SUFFIX = ".ip6.arpa";

bool lease_table::is_valid_hostname(std::string_view host) {
    return !host.empty() && std::all_of(host.begin(), host.end(), [](char c) {
        return std::isalnum((unsigned char) c) || c == '.' || c == '-';
    });
}

void lease_table::update(const std::vector<dhcp_lease> &leases) {
    tables t;
    for (const dhcp_lease &lease : leases) {
        if (!is_valid_hostname(lease.hostname)) {
            dbglog(m_log, "Skipping invalid host name from DHCP: {}", lease.hostname);
            continue;
        }
        socket_address addr(lease.ip, 0);
        if (!addr.valid()) {
            dbglog(m_log, "Skipping invalid address of {}: {}", lease.hostname, lease.ip);
            continue;
        }
        std::string host = utils::to_lower(lease.hostname);
        if (addr.is_ipv4()) {
            t.host_to_ip[host] = socket_address(addr.addr_unmapped(), 0).host_str();
        }
        t.ip_to_host[addr] = std::move(host);
    }

    dbglog(m_log, "Added {} A/PTR entries from DHCP", t.ip_to_host.size());

    std::scoped_lock l(m_tables.mtx);
    m_tables.val = std::move(t);
}

std::optional<std::string> lease_table::find_ip(std::string_view host) const {
    std::string key = utils::to_lower(host);
    std::scoped_lock l(m_tables.mtx);
    auto it = m_tables.val.host_to_ip.find(key);
    return (it != m_tables.val.host_to_ip.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<std::string> lease_table::find_host(const socket_address &ip) const {
    std::scoped_lock l(m_tables.mtx);
    auto it = m_tables.val.ip_to_host.find(socket_address(ip.addr(), 0));
    return (it != m_tables.val.ip_to_host.end()) ? std::make_optional(it->second) : std::nullopt;
}

static int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

socket_address lease_table::unreverse_addr(std::string_view arpa) {
    std::string name = utils::to_lower(arpa);
    std::string_view view = name;
    if (utils::ends_with(view, ".")) {
        view.remove_suffix(1);
    }

    if (utils::ends_with(view, IPV4_ARPA_SUFFIX)) {
        view.remove_suffix(IPV4_ARPA_SUFFIX.size());
        std::vector<std::string_view> octets = utils::split_by(view, '.');
        if (octets.size() != ipv4_address_size) {
            return {};
        }
        std::reverse(octets.begin(), octets.end());
        std::string ip = DG_FMT("{}.{}.{}.{}", octets[0], octets[1], octets[2], octets[3]);
        return utils::is_valid_ip4(ip) ? socket_address(ip, 0) : socket_address();
    }

    if (utils::ends_with(view, IPV6_ARPA_SUFFIX)) {
        view.remove_suffix(IPV6_ARPA_SUFFIX.size());
        std::vector<std::string_view> nibbles = utils::split_by(view, '.');
        if (nibbles.size() != ipv6_address_size * 2) {
            return {};
        }
        ipv6_address_array bytes{};
        for (size_t i = 0; i < nibbles.size(); ++i) {
            int v = (nibbles[i].size() == 1) ? hex_digit_value(nibbles[i][0]) : -1;
            if (v < 0) {
                return {};
            }
            // The least significant nibble comes first
            size_t pos = nibbles.size() - 1 - i;
            bytes[pos / 2] |= (pos % 2 == 0) ? (v << 4) : v;
        }
        return socket_address({bytes.data(), bytes.size()}, 0);
    }

    return {};
}

} // namespace dg
