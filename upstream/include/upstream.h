#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <ldns/ldns.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include <dg_net_utils.h>

namespace dg {

class upstream;

using upstream_ptr = std::unique_ptr<upstream>;

/**
 * Upstream factory configuration
 */
struct upstream_factory_config {
    /** If false, bootstrappers do not query AAAA records */
    bool ipv6_available = true;
};

/**
 * Options for upstream
 */
struct upstream_options {
    /**
     * Server address, one of the following kinds:
     *     8.8.8.8:53 -- plain DNS
     *     tcp://8.8.8.8:53 -- plain DNS over TCP
     *     tls://1.1.1.1 -- DNS-over-TLS
     *     https://dns.quad9.net/dns-query -- DNS-over-HTTPS
     *     sdns://... -- DNS stamp (see https://dnscrypt.info/stamps-specifications)
     */
    std::string address;

    /** List of plain DNS servers to be used to resolve the hostname in upstreams's address. */
    std::vector<std::string> bootstrap;

    /** Upstream timeout. 0 means "default". */
    std::chrono::milliseconds timeout;

    /** Upstream's IP address. If specified, the bootstrapper is NOT used */
    ip_address_variant resolved_server_ip;

    /** User-provided ID for this upstream */
    int32_t id;
};

/**
 * Upstream is interface for handling DNS requests to upstream servers
 */
class upstream {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{10000};

    struct exchange_result {
        ldns_pkt_ptr packet;
        err_string error;
    };

    upstream(upstream_options opts, const upstream_factory_config &config)
            : m_options(std::move(opts))
            , m_config(config) {
        if (m_options.timeout.count() == 0) {
            m_options.timeout = DEFAULT_TIMEOUT;
        }
    }

    virtual ~upstream() = default;

    /**
     * Initialize upstream
     * @return non-nullopt string in case of error
     */
    virtual err_string init() = 0;

    /**
     * Do DNS exchange, considering that `request` may be a forwarded request.
     * @param request DNS request message
     * @param info (optional) out of band info about the forwarded DNS request message
     * @return DNS response message or an error
     */
    virtual exchange_result exchange(ldns_pkt *request, const dns_message_info *info = nullptr) = 0;

    const upstream_options &options() const { return m_options; }

    const upstream_factory_config &config() const { return m_config; }

    /**
     * The address string as configured, used for logging
     */
    const std::string &address() const { return m_options.address; }

    std::chrono::milliseconds rtt() {
        std::lock_guard l(m_rtt_guard);
        return m_rtt;
    }

    /**
     * Update RTT
     * @param elapsed spent time in exchange()
     */
    void adjust_rtt(std::chrono::milliseconds elapsed) {
        std::lock_guard l(m_rtt_guard);
        m_rtt = (m_rtt + elapsed) / 2;
    }

protected:
    /** Upstream options */
    upstream_options m_options;
    /** Upstream factory configuration */
    upstream_factory_config m_config;
    /** RTT + mutex */
    std::chrono::milliseconds m_rtt{0};
    std::mutex m_rtt_guard;
};

/**
 * Upstream factory entity which produces upstreams
 */
class upstream_factory {
public:
    struct create_result {
        upstream_ptr upstream; // created upstream in case of success
        err_string error; // non-nullopt in case of error
    };

    explicit upstream_factory(upstream_factory_config cfg);
    ~upstream_factory();

    /**
     * Create and initialize an upstream
     * @param opts upstream settings
     * @return Creation result
     */
    create_result create_upstream(const upstream_options &opts) const;

    struct impl;
private:
    std::unique_ptr<impl> m_factory;
};

} // namespace dg
