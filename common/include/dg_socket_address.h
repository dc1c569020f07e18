#pragma once

#include <string>
#include <string_view>
#include <event2/util.h> // for sockaddr, sockaddr_storage, getaddrinfo, getnameinfo
#include <dg_defs.h>

namespace dg {

/**
 * Socket address (IP address and port)
 */
class socket_address {
public:
    socket_address();

    /**
     * @param numeric_host String containing the IP address
     * @param port         Port number
     */
    socket_address(std::string_view numeric_host, uint16_t port);
    /**
     * @param addr IP address bytes, 4 or 16 bytes long
     * @param port Port number
     */
    socket_address(uint8_view addr, uint16_t port);
    explicit socket_address(const sockaddr *addr);

    bool operator==(const socket_address &other) const;
    bool operator!=(const socket_address &other) const;

    const sockaddr *c_sockaddr() const;

    /**
     * @return sizeof(sockaddr_in) for IPv4 and sizeof(sockaddr_in6) for IPv6
     */
    ev_socklen_t c_socklen() const;

    /**
     * @return IP address bytes
     */
    uint8_view addr() const;

    /**
     * @return IPv4 bytes for an IPv4-mapped IPv6 address, otherwise same as `addr()`
     */
    uint8_view addr_unmapped() const;

    ip_address_variant addr_variant() const;

    uint16_t port() const;

    /**
     * @return String containing IP address only
     */
    std::string host_str() const;

    /**
     * @return String containing IP address and port
     */
    std::string str() const;

    /**
     * @return True if IP is valid (AF_INET or AF_INET6)
     */
    bool valid() const;

    bool is_ipv6() const;

    /**
     * @return True if address family is AF_INET or address is IPv4 mapped
     */
    bool is_ipv4() const;

private:
    sockaddr_storage m_ss;

    bool is_ipv4_mapped() const;
};

} // namespace dg

namespace std {
template<>
struct hash<dg::socket_address> {
    size_t operator()(const dg::socket_address &address) const {
        std::string_view bytes = {(const char *) address.c_sockaddr(), (size_t) address.c_socklen()};
        return std::hash<std::string_view>{}(bytes);
    }
};
} // namespace std
