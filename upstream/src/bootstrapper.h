#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <dg_logger.h>
#include <dg_socket_address.h>
#include <upstream.h>

namespace dg {

/**
 * Resolves the host name of an encrypted upstream through plain DNS servers
 */
class bootstrapper {
public:
    static constexpr std::chrono::milliseconds MIN_TIMEOUT{50};

    struct params {
        std::string_view address_string; // host to be resolved
        int default_port; // default to be used if not specified in `address_string`
        const std::vector<std::string> &bootstrap; // list of the resolving servers
        std::chrono::milliseconds timeout; // resolve timeout
        const upstream_factory_config &upstream_config; // configuration of the factory creating resolving upstreams
    };

    explicit bootstrapper(const params &p);

    /**
     * Initialize bootstrapper
     * @return non-nullopt if something went wrong
     */
    err_string init();

    struct resolve_result {
        std::vector<socket_address> addresses; // not empty resolved addresses list in case of success
        std::string server_name; // resolved host name
        std::chrono::milliseconds time_elapsed; // time took to resolve
        err_string error; // non-nullopt if something went wrong
    };

    /**
     * Get resolved addresses, resolving the host if nothing is cached
     */
    resolve_result get();

    /**
     * Remove resolved address from the cache
     * @param addr address to remove
     */
    void remove_resolved(const socket_address &addr);

    /**
     * Get address to resolve from bootstrapper
     */
    std::string address() const;

    // Non-copyable
    bootstrapper(const bootstrapper &) = delete;
    bootstrapper &operator=(const bootstrapper &) = delete;

private:
    struct resolver_result {
        std::vector<socket_address> addresses;
        err_string error;
    };

    resolve_result resolve();
    resolver_result resolve_with(upstream &resolver, std::chrono::milliseconds timeout);

    /**
     * Check if bootstrapper should be temporary disabled
     */
    err_string temporary_disabler_check();
    /**
     * Update information for temporary disabling bootstrapper
     */
    void temporary_disabler_update(const err_string &error);

    /** Logger */
    logger m_log;
    /** Server name to resolve */
    std::string m_server_name;
    /** Server port */
    int m_server_port;
    /** Resolve timeout */
    std::chrono::milliseconds m_timeout;
    bool m_ipv6_available;
    /** Resolved addresses cache */
    std::vector<socket_address> m_resolved_cache;
    /** Times of first and last resolve fails */
    std::pair<int64_t, int64_t> m_resolve_fail_times_ms{0, 0};
    /** Resolved addresses cache mutex */
    std::mutex m_resolved_cache_mutex;
    /** Plain DNS upstreams to resolve with */
    std::vector<upstream_ptr> m_resolvers;
};

using bootstrapper_ptr = std::unique_ptr<bootstrapper>;

} // namespace dg
