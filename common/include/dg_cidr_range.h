#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <dg_defs.h>
#include <dg_socket_address.h>

namespace dg {

/**
 * An IP network in CIDR notation, e.g. `192.168.0.0/16` or `fd00::/8`.
 * A plain address is a network of a single host.
 */
class cidr_range {
public:
    /**
     * Parse a range. Check `valid()` afterwards.
     * @param str address with optional `/prefix_len` suffix
     */
    explicit cidr_range(std::string_view str);

    /**
     * @param addr       4 or 16 address bytes
     * @param prefix_len number of significant bits
     */
    cidr_range(uint8_view addr, uint32_t prefix_len);

    bool valid() const { return !m_address.empty(); }

    /**
     * @return true if the address belongs to this range.
     *         IPv4-mapped IPv6 addresses are matched as IPv4 ones.
     */
    bool contains(const socket_address &addr) const;

    bool contains(const cidr_range &other) const;

    uint32_t prefix_len() const { return m_prefix_len; }

    /**
     * @return network in `address/prefix_len` form
     */
    std::string str() const;

private:
    std::vector<uint8_t> m_address;
    uint32_t m_prefix_len = 0;

    void init(uint8_view addr, uint32_t prefix_len);
    bool matches(uint8_view addr) const;
};

} // namespace dg
