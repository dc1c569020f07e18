#pragma once

#include <string_view>
#include <dg_logger.h>
#include <dg_socket_address.h>
#include <upstream.h>

namespace dg {

/**
 * Plain DNS upstream. Queries go over UDP and are retried over TCP once if the reply is truncated.
 */
class plain_dns : public upstream {
public:
    static constexpr std::string_view TCP_SCHEME = "tcp://";
    static constexpr int DEFAULT_PORT = 53;

    /**
     * Create plain DNS upstream
     * @param opts Upstream settings
     */
    plain_dns(const upstream_options &opts, const upstream_factory_config &config);

    ~plain_dns() override = default;

private:
    err_string init() override;
    exchange_result exchange(ldns_pkt *request_pkt, const dns_message_info *info) override;

    exchange_result exchange_over(utils::transport_protocol protocol, uint8_view request,
            std::chrono::milliseconds timeout);
    std::string annotate(std::string &&error) const;

    logger m_log;
    /** Prefer TCP */
    bool m_prefer_tcp;
    socket_address m_address;
};

} // namespace dg
