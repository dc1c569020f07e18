#pragma once

#include <chrono>
#include <string_view>
#include <ldns/ldns.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include <dg_net_utils.h>
#include <dns_crypt_server_info.h>
#include <dns_stamp.h>

namespace dg::dnscrypt {

/**
 * Stateless DNSCrypt client. Resolver state is kept in `server_info` returned by `dial()`.
 */
class client {
public:
    struct dial_result {
        server_info server;
        std::chrono::milliseconds round_trip_time;
        err_string error;
    };

    struct exchange_result {
        ldns_pkt_ptr packet;
        std::chrono::milliseconds round_trip_time;
        err_string error;
    };

    explicit client(utils::transport_protocol protocol = utils::TP_UDP);

    /**
     * Fetch and validate the resolver certificate
     * @param stamp_str an `sdns://` stamp of the DNSCrypt type
     */
    dial_result dial(std::string_view stamp_str, std::chrono::milliseconds timeout) const;

    /**
     * Fetch and validate the resolver certificate
     */
    dial_result dial(const server_stamp &stamp, std::chrono::milliseconds timeout) const;

    /**
     * Encrypt the message, send it over a new connection and decrypt the reply.
     * If the resolver rotated its certificate the read most likely times out,
     * which is a signal to dial again.
     * @return the reply, or an error. A timeout is reported as `utils::TIMEOUT_STR`.
     */
    exchange_result exchange(const ldns_pkt &message, const server_info &info,
            std::chrono::milliseconds timeout) const;

private:
    utils::transport_protocol m_protocol;
};

} // namespace dg::dnscrypt
