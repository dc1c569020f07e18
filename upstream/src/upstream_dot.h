#pragma once

#include <list>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <openssl/ssl.h>
#include <dg_blocking_socket.h>
#include <dg_logger.h>
#include <dg_tls_session_cache.h>
#include <upstream.h>
#include "bootstrapper.h"

namespace dg {

/**
 * DNS-over-TLS upstream
 */
class dns_over_tls : public upstream {
public:
    /** Default port for DoT */
    static constexpr auto DEFAULT_PORT = 853;
    static constexpr std::string_view SCHEME = "tls://";

    /**
     * Create DNS-over-TLS upstream
     * @param opts Upstream settings
     * @param config Factory configuration
     */
    dns_over_tls(const upstream_options &opts, const upstream_factory_config &config);

    ~dns_over_tls() override;

private:
    err_string init() override;
    exchange_result exchange(ldns_pkt *request_pkt, const dns_message_info *info) override;

    class tls_pool;

    /** Create the pool on the first use */
    tls_pool *get_pool(err_string &error);

    logger m_log;
    /** DNS server name */
    std::string m_server_name;
    /** TLS sessions cache */
    tls_session_cache m_tls_session_cache;
    std::unique_ptr<SSL_CTX, ftor<&SSL_CTX_free>> m_ssl_ctx;
    /** Guards the pool assignment, borrowing and returning take it shared */
    std::shared_mutex m_pool_guard;
    /** TLS connection pool */
    std::unique_ptr<tls_pool> m_pool;
};

} // namespace dg
