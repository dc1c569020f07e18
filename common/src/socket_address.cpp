#include <cstring>
#include <string>
#include <netdb.h>
#include <netinet/in.h>
#include <dg_socket_address.h>
#include <dg_utils.h>

static constexpr uint8_t IPV4_MAPPED_PREFIX[] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};

static size_t c_socklen(const sockaddr *addr) {
    return addr->sa_family == AF_INET6 ? sizeof(sockaddr_in6) :
           addr->sa_family == AF_INET ? sizeof(sockaddr_in) :
           0;
}

static sockaddr_storage make_sockaddr_storage(dg::uint8_view addr, uint16_t port) {
    sockaddr_storage ss{};
    if (addr.size() == dg::ipv6_address_size) {
        auto *sin6 = (sockaddr_in6 *) &ss;
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        std::memcpy(&sin6->sin6_addr, addr.data(), addr.size());
    } else if (addr.size() == dg::ipv4_address_size) {
        auto *sin = (sockaddr_in *) &ss;
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        std::memcpy(&sin->sin_addr, addr.data(), addr.size());
    }
    return ss;
}

static sockaddr_storage make_sockaddr_storage(std::string_view numeric_host, uint16_t port) {
    char p[INET6_ADDRSTRLEN];
    if (numeric_host.size() > sizeof(p) - 1) {
        return {};
    }
    std::memcpy(p, numeric_host.data(), numeric_host.size());
    p[numeric_host.size()] = '\0';

    dg::ipv6_address_array ip;
    if (1 == evutil_inet_pton(AF_INET, p, ip.data())) {
        return make_sockaddr_storage({ip.data(), dg::ipv4_address_size}, port);
    }
    if (1 == evutil_inet_pton(AF_INET6, p, ip.data())) {
        return make_sockaddr_storage({ip.data(), dg::ipv6_address_size}, port);
    }
    return {};
}

dg::socket_address::socket_address()
        : m_ss{} {
}

dg::socket_address::socket_address(const sockaddr *addr)
        : m_ss{} {
    if (addr) {
        std::memcpy(&m_ss, addr, ::c_socklen(addr));
    }
}

dg::socket_address::socket_address(std::string_view numeric_host, uint16_t port)
        : m_ss{make_sockaddr_storage(numeric_host, port)} {
}

dg::socket_address::socket_address(dg::uint8_view addr, uint16_t port)
        : m_ss{make_sockaddr_storage(addr, port)} {
}

bool dg::socket_address::operator==(const dg::socket_address &other) const {
    return c_socklen() == other.c_socklen() && std::memcmp(&m_ss, &other.m_ss, c_socklen()) == 0;
}

bool dg::socket_address::operator!=(const dg::socket_address &other) const {
    return !operator==(other);
}

const sockaddr *dg::socket_address::c_sockaddr() const {
    return reinterpret_cast<const sockaddr *>(&m_ss);
}

ev_socklen_t dg::socket_address::c_socklen() const {
    return ::c_socklen((const sockaddr *) &m_ss);
}

dg::uint8_view dg::socket_address::addr() const {
    switch (m_ss.ss_family) {
    case AF_INET: {
        auto &sin = (const sockaddr_in &) m_ss;
        return {(uint8_t *) &sin.sin_addr, ipv4_address_size};
    }
    case AF_INET6: {
        auto &sin6 = (const sockaddr_in6 &) m_ss;
        return {(uint8_t *) &sin6.sin6_addr, ipv6_address_size};
    }
    default:
        return {};
    }
}

dg::uint8_view dg::socket_address::addr_unmapped() const {
    uint8_view a = addr();
    if (is_ipv4_mapped()) {
        a.remove_prefix(sizeof(IPV4_MAPPED_PREFIX));
    }
    return a;
}

dg::ip_address_variant dg::socket_address::addr_variant() const {
    switch (m_ss.ss_family) {
    case AF_INET:
        return utils::to_array<ipv4_address_size>(addr().data());
    case AF_INET6:
        return utils::to_array<ipv6_address_size>(addr().data());
    default:
        return std::monostate{};
    }
}

uint16_t dg::socket_address::port() const {
    switch (m_ss.ss_family) {
    case AF_INET6:
        return ntohs(((const sockaddr_in6 &) m_ss).sin6_port);
    case AF_INET:
        return ntohs(((const sockaddr_in &) m_ss).sin_port);
    default:
        return 0;
    }
}

std::string dg::socket_address::host_str() const {
    char host[INET6_ADDRSTRLEN] = "";
    getnameinfo(c_sockaddr(), c_socklen(), host, sizeof(host), nullptr, 0, NI_NUMERICHOST);
    return host;
}

std::string dg::socket_address::str() const {
    char host[INET6_ADDRSTRLEN] = "";
    char port[6] = "0";
    getnameinfo(c_sockaddr(), c_socklen(), host, sizeof(host), port, sizeof(port), NI_NUMERICHOST | NI_NUMERICSERV);
    if (m_ss.ss_family == AF_INET6) {
        return DG_FMT("[{}]:{}", host, port);
    }
    return DG_FMT("{}:{}", host, port);
}

bool dg::socket_address::valid() const {
    return m_ss.ss_family != AF_UNSPEC;
}

bool dg::socket_address::is_ipv6() const {
    return m_ss.ss_family == AF_INET6;
}

bool dg::socket_address::is_ipv4() const {
    return m_ss.ss_family == AF_INET || is_ipv4_mapped();
}

bool dg::socket_address::is_ipv4_mapped() const {
    return m_ss.ss_family == AF_INET6
           && !std::memcmp(&((const sockaddr_in6 *) &m_ss)->sin6_addr, IPV4_MAPPED_PREFIX, sizeof(IPV4_MAPPED_PREFIX));
}
