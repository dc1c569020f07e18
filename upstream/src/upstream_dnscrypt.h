#pragma once

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <dg_logger.h>
#include <dns_crypt_server_info.h>
#include <dns_stamp.h>
#include <upstream.h>

namespace dg {

/**
 * DNSCrypt upstream. The resolver certificate is fetched on the first query and kept
 * until it expires or a query times out.
 */
class upstream_dnscrypt : public upstream {
public:
    /**
     * Create DNSCrypt upstream
     * @param stamp Stamp
     * @param opts Upstream settings
     */
    upstream_dnscrypt(server_stamp &&stamp, const upstream_options &opts, const upstream_factory_config &config);
    upstream_dnscrypt(const upstream_dnscrypt &) = delete;
    upstream_dnscrypt &operator=(const upstream_dnscrypt &) = delete;
    ~upstream_dnscrypt() override;

private:
    err_string init() override;
    exchange_result exchange(ldns_pkt *request_pkt, const dns_message_info *info) override;

    using server_info_ptr = std::shared_ptr<const dnscrypt::server_info>;

    struct setup_result {
        server_info_ptr server;
        std::chrono::milliseconds rtt;
        err_string error;
    };

    /** Get the current session, dial if there is none or its certificate expired */
    setup_result setup_session();
    /** Drop the session if it is still the current one */
    void invalidate_session(const server_info_ptr &server);
    exchange_result apply_exchange(const ldns_pkt &request_pkt, const dnscrypt::server_info &server,
            std::chrono::milliseconds timeout);

    logger m_log;
    server_stamp m_stamp;
    server_info_ptr m_server;
    std::shared_mutex m_guard;
};

} // namespace dg
