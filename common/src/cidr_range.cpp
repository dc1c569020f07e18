#include <charconv>
#include <cstring>
#include <dg_cidr_range.h>
#include <dg_net_utils.h>
#include <dg_utils.h>

namespace dg {

cidr_range::cidr_range(std::string_view str) {
    auto [addr_str, prefix_str] = utils::split2_by(str, '/');
    socket_address addr(addr_str, 0);
    if (!addr.valid()) {
        return;
    }

    uint32_t max_bits = addr.addr().size() * 8;
    uint32_t prefix_len = max_bits;
    if (!prefix_str.empty()) {
        auto [end, ec] = std::from_chars(prefix_str.data(), prefix_str.data() + prefix_str.size(), prefix_len);
        if (ec != std::errc() || end != prefix_str.data() + prefix_str.size() || prefix_len > max_bits) {
            return;
        }
    } else if (str.find('/') != std::string_view::npos) {
        return;
    }

    init(addr.addr(), prefix_len);
}

cidr_range::cidr_range(uint8_view addr, uint32_t prefix_len) {
    if ((addr.size() == ipv4_address_size || addr.size() == ipv6_address_size) && prefix_len <= addr.size() * 8) {
        init(addr, prefix_len);
    }
}

void cidr_range::init(uint8_view addr, uint32_t prefix_len) {
    m_address.assign(addr.begin(), addr.end());
    m_prefix_len = prefix_len;

    // Zero the host part
    uint32_t full_bytes = prefix_len / 8;
    uint32_t rem_bits = prefix_len % 8;
    for (size_t i = full_bytes; i < m_address.size(); ++i) {
        if (i == full_bytes && rem_bits != 0) {
            m_address[i] &= (uint8_t) ~(0xff >> rem_bits);
        } else {
            m_address[i] = 0;
        }
    }
}

bool cidr_range::matches(uint8_view addr) const {
    if (addr.size() != m_address.size()) {
        return false;
    }
    uint32_t full_bytes = m_prefix_len / 8;
    uint32_t rem_bits = m_prefix_len % 8;
    if (0 != std::memcmp(addr.data(), m_address.data(), full_bytes)) {
        return false;
    }
    if (rem_bits == 0) {
        return true;
    }
    auto mask = (uint8_t) ~(0xff >> rem_bits);
    return (addr[full_bytes] & mask) == m_address[full_bytes];
}

bool cidr_range::contains(const socket_address &addr) const {
    if (!valid() || !addr.valid()) {
        return false;
    }
    if (m_address.size() == ipv4_address_size) {
        return matches(addr.addr_unmapped());
    }
    return matches(addr.addr());
}

bool cidr_range::contains(const cidr_range &other) const {
    return valid() && other.valid() && other.m_prefix_len >= m_prefix_len
            && matches({other.m_address.data(), other.m_address.size()});
}

std::string cidr_range::str() const {
    if (!valid()) {
        return {};
    }
    return DG_FMT("{}/{}", utils::addr_to_str({m_address.data(), m_address.size()}), m_prefix_len);
}

} // namespace dg
