#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <curl/curl.h>
#include <dg_logger.h>
#include <upstream.h>
#include "bootstrapper.h"

namespace dg {

using curl_ptr = std::unique_ptr<CURL, ftor<&curl_easy_cleanup>>;
using curl_slist_ptr = std::unique_ptr<curl_slist, ftor<&curl_slist_free_all>>;

/**
 * DNS-over-HTTPS upstream. Queries are POSTed in the wire format.
 */
class dns_over_https : public upstream {
public:
    static constexpr std::string_view SCHEME = "https://";
    static constexpr int DEFAULT_PORT = 443;

    /**
     * Create DNS-over-HTTPS upstream
     * @param opts upstream settings
     * @param config factory configuration
     */
    dns_over_https(const upstream_options &opts, const upstream_factory_config &config);
    ~dns_over_https() override;

    dns_over_https(const dns_over_https &) = delete;
    dns_over_https &operator=(const dns_over_https &) = delete;

private:
    err_string init() override;
    exchange_result exchange(ldns_pkt *request_pkt, const dns_message_info *info) override;

    struct resolved_hosts_result {
        curl_slist_ptr hosts;
        std::vector<socket_address> addresses;
        err_string error;
    };

    /** Get the `CURLOPT_RESOLVE` list pinning the server name to the bootstrapped addresses */
    resolved_hosts_result get_resolved_hosts();

    /** Take an idle handle, its connection to the server is reused */
    curl_ptr get_handle();
    void put_handle(curl_ptr handle);

    logger m_log;
    std::string m_host;
    int m_port;
    curl_slist_ptr m_request_headers;
    /** Set if the server address was given explicitly */
    curl_slist_ptr m_static_resolved;
    bootstrapper_ptr m_bootstrapper;
    with_mtx<std::vector<curl_ptr>> m_idle_handles;
};

} // namespace dg
