#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <dnsproxy.h>
#include "dns_forwarder.h"
#include "dnsproxy_listener.h"

#ifndef DG_VERSION
#define DG_VERSION "unknown"
#endif

namespace dg {

const err_string dnsproxy::LISTENER_ERROR = "Listener failure";

static const dnsproxy_settings DEFAULT_PROXY_SETTINGS = {
    .upstreams = {
        { .address = "8.8.8.8:53", .id = 1 },
        { .address = "8.8.4.4:53", .id = 2 },
    },
    .listeners = {},
    .protection_enabled = true,
    .filter_params = {},
    .blocking_mode = dnsproxy_blocking_mode::DEFAULT,
    .custom_blocking_ipv4 = {},
    .custom_blocking_ipv6 = {},
    .blocked_response_ttl_secs = 3600,
    .safebrowsing_block_host = {},
    .parental_block_host = {},
    .refuse_any = true,
    .allowed_clients = {},
    .disallowed_clients = {},
    .blocked_hosts = {},
    .dns_cache_size = 1000,
    .cache_min_ttl = 0,
    .cache_max_ttl = 0,
    .bogus_nxdomain = {},
    .aaaa_disabled = false,
    .enable_dnssec = false,
    .ipv6_available = true,
};

const dnsproxy_settings &dnsproxy_settings::get_default() {
    return DEFAULT_PROXY_SETTINGS;
}

struct dnsproxy::impl {
    logger log = create_logger("DNS proxy");
    // Guards the forwarder configuration, requests take it shared
    std::shared_mutex config_mtx;
    dns_forwarder forwarder{config_mtx};
    // Serializes the lifecycle operations
    mutable std::mutex lifecycle_mtx;
    bool prepared = false;
    std::atomic_bool running{false};
    dnsproxy_settings settings;
    dnsproxy_events events;
    std::vector<listener_ptr> listeners;

    // Settings are replaced under the configuration lock
    std::pair<bool, err_string> init_forwarder(dnsproxy_settings new_settings) {
        std::unique_lock l(config_mtx);
        settings = std::move(new_settings);
        if (prepared) {
            forwarder.deinit();
            prepared = false;
        }
        auto [ok, err_or_warn] = forwarder.init(settings, events);
        if (!ok) {
            return {false, std::move(err_or_warn)};
        }
        prepared = true;
        return {true, std::move(err_or_warn)};
    }

    err_string start_listeners(dnsproxy *proxy) {
        if (settings.listeners.empty()) {
            return std::nullopt;
        }
        infolog(log, "Initializing listeners...");
        listeners.reserve(settings.listeners.size());
        for (const auto &listener_settings : settings.listeners) {
            auto [listener, error] = dnsproxy_listener::create_and_listen(listener_settings, proxy);
            if (error.has_value()) {
                errlog(log, "Failed to initialize a listener ({}): {}", listener_settings.str(), error.value());
                stop_listeners();
                return LISTENER_ERROR;
            }
            listeners.push_back(std::move(listener));
        }
        return std::nullopt;
    }

    void stop_listeners() {
        infolog(log, "Shutting down listeners...");
        for (auto &listener : listeners) {
            listener->shutdown();
        }
        // Must wait for all listeners to shut down before reconfiguring the forwarder
        // (there may still be requests in process after a shutdown() call)
        for (auto &listener : listeners) {
            listener->await_shutdown();
        }
        listeners.clear();
        infolog(log, "Done");
    }

    void deinit_forwarder() {
        std::unique_lock l(config_mtx);
        if (prepared) {
            forwarder.deinit();
            prepared = false;
        }
    }
};

dnsproxy::dnsproxy()
    : pimpl(new dnsproxy::impl)
{}

dnsproxy::~dnsproxy() {
    stop();
}

std::pair<bool, err_string> dnsproxy::prepare(dnsproxy_settings settings, dnsproxy_events events) {
    impl *proxy = this->pimpl.get();
    std::scoped_lock l(proxy->lifecycle_mtx);
    if (proxy->running) {
        return {false, "Proxy is running"};
    }

    infolog(proxy->log, "Initializing proxy module...");
    proxy->events = std::move(events);

    auto [ok, err_or_warn] = proxy->init_forwarder(std::move(settings));
    if (!ok) {
        errlog(proxy->log, "Failed to initialize proxy module: {}", err_or_warn.value_or(""));
        return {false, std::move(err_or_warn)};
    }
    infolog(proxy->log, "Proxy module initialized");
    return {true, std::move(err_or_warn)};
}

std::pair<bool, err_string> dnsproxy::start(dnsproxy_settings settings, dnsproxy_events events) {
    if (is_running()) {
        return {false, "Proxy is already running"};
    }
    auto [ok, err_or_warn] = prepare(std::move(settings), std::move(events));
    if (!ok) {
        return {false, std::move(err_or_warn)};
    }

    impl *proxy = this->pimpl.get();
    std::scoped_lock l(proxy->lifecycle_mtx);
    if (err_string err = proxy->start_listeners(this); err.has_value()) {
        proxy->deinit_forwarder();
        return {false, std::move(err)};
    }
    proxy->running = true;
    infolog(proxy->log, "Proxy started");
    return {true, std::move(err_or_warn)};
}

void dnsproxy::stop() {
    impl *proxy = this->pimpl.get();
    std::scoped_lock l(proxy->lifecycle_mtx);
    if (!proxy->running && !proxy->prepared) {
        return;
    }
    infolog(proxy->log, "Deinitializing proxy module...");
    proxy->stop_listeners();
    proxy->deinit_forwarder();
    proxy->running = false;
    infolog(proxy->log, "Proxy module deinitialized");
}

std::pair<bool, err_string> dnsproxy::reconfigure(dnsproxy_settings settings) {
    impl *proxy = this->pimpl.get();
    std::scoped_lock l(proxy->lifecycle_mtx);
    infolog(proxy->log, "Reconfiguring proxy module...");

    bool was_running = proxy->running;
    // Listeners are stopped first so that no requests are processed during the swap
    proxy->stop_listeners();
    proxy->running = false;

    auto [ok, err_or_warn] = proxy->init_forwarder(std::move(settings));
    if (!ok) {
        errlog(proxy->log, "Failed to reconfigure proxy module: {}", err_or_warn.value_or(""));
        return {false, std::move(err_or_warn)};
    }

    if (was_running) {
        if (err_string err = proxy->start_listeners(this); err.has_value()) {
            proxy->deinit_forwarder();
            return {false, std::move(err)};
        }
        proxy->running = true;
    }
    infolog(proxy->log, "Proxy module reconfigured");
    return {true, std::move(err_or_warn)};
}

bool dnsproxy::is_running() const {
    return this->pimpl->running;
}

std::pair<std::vector<socket_address>, err_string> dnsproxy::resolve(std::string_view host) {
    return this->pimpl->forwarder.resolve(host);
}

std::pair<ldns_pkt_ptr, err_string> dnsproxy::exchange(const ldns_pkt *request) {
    auto [response, err] = this->pimpl->forwarder.exchange(request);
    return {std::move(response), std::move(err)};
}

std::pair<bool, std::string> dnsproxy::is_blocked_ip(const socket_address &ip) const {
    return this->pimpl->forwarder.is_blocked_ip(ip);
}

void dnsproxy::set_leases(const std::vector<dhcp_lease> &leases) {
    this->pimpl->forwarder.set_leases(leases);
}

void dnsproxy::set_protection_enabled(bool enabled) {
    impl *proxy = this->pimpl.get();
    std::unique_lock l(proxy->config_mtx);
    proxy->settings.protection_enabled = enabled;
    proxy->forwarder.set_protection_enabled(enabled);
}

err_string dnsproxy::set_upstreams(std::vector<upstream_options> upstreams) {
    impl *proxy = this->pimpl.get();
    std::unique_lock l(proxy->config_mtx);
    err_string err = proxy->forwarder.set_upstreams(upstreams);
    if (!err.has_value()) {
        proxy->settings.upstreams = proxy->forwarder.settings().upstreams;
    }
    return err;
}

void dnsproxy::set_filtering_engine(std::shared_ptr<filtering_engine> engine) {
    impl *proxy = this->pimpl.get();
    std::unique_lock l(proxy->config_mtx);
    proxy->forwarder.set_filtering_engine(std::move(engine));
}

dnsproxy_settings dnsproxy::get_settings() const {
    impl *proxy = this->pimpl.get();
    std::shared_lock l(proxy->config_mtx);
    return proxy->settings;
}

uint8_vector dnsproxy::handle_message(uint8_view message, const dns_message_info *info) {
    return this->pimpl->forwarder.handle_message(message, info);
}

std::vector<std::pair<utils::transport_protocol, socket_address>> dnsproxy::get_listen_addresses() const {
    const impl *proxy = this->pimpl.get();
    std::scoped_lock l(proxy->lifecycle_mtx);

    std::vector<std::pair<utils::transport_protocol, socket_address>> addresses;
    addresses.reserve(proxy->listeners.size());

    for (const listener_ptr &listener : proxy->listeners) {
        addresses.emplace_back(listener->get_listen_address());
    }

    return addresses;
}

const char *dnsproxy::version() {
    return DG_VERSION;
}

} // namespace dg
