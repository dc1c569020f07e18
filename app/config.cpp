#include <algorithm>
#include <magic_enum.hpp>
#include <yaml-cpp/yaml.h>
#include <dg_net_utils.h>
#include <dg_utils.h>
#include "config.h"

using namespace std::chrono;

namespace dg::app {

static constexpr uint16_t DEFAULT_PORT = 53;
static constexpr milliseconds DEFAULT_UPSTREAM_TIMEOUT{5000};

template <typename T>
static void read(const YAML::Node &node, const char *key, T &value) {
    if (const YAML::Node &child = node[key]; child && !child.IsNull()) {
        value = child.as<T>();
    }
}

template <typename E>
static E read_enum(const YAML::Node &node, const char *key, E default_value) {
    const YAML::Node &child = node[key];
    if (!child || child.IsNull()) {
        return default_value;
    }
    std::string str = utils::to_lower(child.as<std::string>());
    for (E value : magic_enum::enum_values<E>()) {
        if (utils::to_lower(magic_enum::enum_name(value)) == str) {
            return value;
        }
    }
    throw YAML::Exception(child.Mark(), fmt::format("Unknown value of '{}': {}", key, str));
}

static utils::transport_protocol read_protocol(const YAML::Node &node) {
    std::string proto = utils::to_lower(node["protocol"] ? node["protocol"].as<std::string>() : "udp");
    if (proto == "udp") {
        return utils::TP_UDP;
    }
    if (proto == "tcp") {
        return utils::TP_TCP;
    }
    throw YAML::Exception(node["protocol"].Mark(), fmt::format("Unknown listener protocol: {}", proto));
}

static std::vector<upstream_options> read_upstreams(const std::vector<std::string> &addresses,
        const std::vector<std::string> &bootstrap, milliseconds timeout) {
    std::vector<upstream_options> upstreams;
    int32_t id = 0;
    for (const std::string &address : addresses) {
        upstream_options &opts = upstreams.emplace_back();
        opts.address = address;
        opts.bootstrap = bootstrap;
        opts.timeout = timeout;
        opts.id = ++id;
    }
    return upstreams;
}

static std::vector<dnsfilter::rewrite_entry> read_rewrites(const YAML::Node &node) {
    std::vector<dnsfilter::rewrite_entry> entries;
    for (const YAML::Node &entry : node) {
        entries.push_back({entry["domain"].as<std::string>(), entry["answer"].as<std::string>()});
    }
    return entries;
}

static void read_dns(const YAML::Node &node, config &conf) {
    dnsproxy_settings &s = conf.proxy;

    if (const YAML::Node &listeners = node["listeners"]) {
        s.listeners.clear();
        for (const YAML::Node &entry : listeners) {
            listener_settings &listener = s.listeners.emplace_back();
            read(entry, "address", listener.address);
            read(entry, "port", listener.port);
            listener.protocol = read_protocol(entry);
            read(entry, "persistent", listener.persistent);
            uint32_t idle_timeout_ms = listener.idle_timeout.count();
            read(entry, "idle_timeout_ms", idle_timeout_ms);
            listener.idle_timeout = milliseconds(idle_timeout_ms);
        }
    }

    std::vector<std::string> upstream_addresses;
    std::vector<std::string> bootstrap;
    uint32_t timeout_ms = DEFAULT_UPSTREAM_TIMEOUT.count();
    read(node, "upstream_dns", upstream_addresses);
    read(node, "bootstrap_dns", bootstrap);
    read(node, "upstream_timeout_ms", timeout_ms);
    if (!upstream_addresses.empty()) {
        s.upstreams = read_upstreams(upstream_addresses, bootstrap, milliseconds(timeout_ms));
    }

    read(node, "protection_enabled", s.protection_enabled);
    s.blocking_mode = read_enum(node, "blocking_mode", s.blocking_mode);
    read(node, "blocking_ipv4", s.custom_blocking_ipv4);
    read(node, "blocking_ipv6", s.custom_blocking_ipv6);
    read(node, "blocked_response_ttl", s.blocked_response_ttl_secs);
    read(node, "safebrowsing_block_host", s.safebrowsing_block_host);
    read(node, "parental_block_host", s.parental_block_host);
    read(node, "refuse_any", s.refuse_any);
    read(node, "allowed_clients", s.allowed_clients);
    read(node, "disallowed_clients", s.disallowed_clients);
    read(node, "blocked_hosts", s.blocked_hosts);
    read(node, "cache_size", s.dns_cache_size);
    read(node, "cache_ttl_min", s.cache_min_ttl);
    read(node, "cache_ttl_max", s.cache_max_ttl);
    read(node, "bogus_nxdomain", s.bogus_nxdomain);
    read(node, "aaaa_disabled", s.aaaa_disabled);
    read(node, "enable_dnssec", s.enable_dnssec);
    read(node, "ipv6_available", s.ipv6_available);
}

static void read_filtering(const YAML::Node &node, config &conf) {
    dnsfilter::engine_params &params = conf.proxy.filter_params;

    for (const YAML::Node &entry : node["filters"]) {
        bool enabled = true;
        read(entry, "enabled", enabled);
        if (!enabled) {
            continue;
        }
        params.filters.push_back({entry["id"].as<int32_t>(), entry["path"].as<std::string>(), false});
    }

    std::vector<std::string> user_rules;
    read(node, "user_rules", user_rules);
    if (!user_rules.empty()) {
        // The user's own rules always have the zero id
        std::string rules;
        for (const std::string &rule : user_rules) {
            rules.append(rule).push_back('\n');
        }
        params.filters.push_back({0, std::move(rules), true});
    }

    params.rewrites = read_rewrites(node["rewrites"]);
    params.safesearch = read_rewrites(node["safesearch"]);
    read(node, "safebrowsing_domains", params.safebrowsing_domains);
    read(node, "parental_domains", params.parental_domains);
    read(node, "blocked_services", params.blocked_services);
}

static void read_clients(const YAML::Node &node, config &conf) {
    for (const YAML::Node &entry : node) {
        client_config &client = conf.clients.emplace_back();
        read(entry, "name", client.name);
        read(entry, "ids", client.ids);
        read(entry, "upstreams", client.upstreams);
        read(entry, "filtering_enabled", client.filtering.filtering_enabled);
        read(entry, "safebrowsing_enabled", client.filtering.safebrowsing_enabled);
        read(entry, "parental_enabled", client.filtering.parental_enabled);
        read(entry, "safesearch_enabled", client.filtering.safesearch_enabled);
        // An empty list unblocks everything for the client, no list means the global one
        if (const YAML::Node &services = entry["blocked_services"]; services && !services.IsNull()) {
            client.filtering.blocked_services = services.as<std::vector<std::string>>();
        }
        if (client.ids.empty()) {
            throw YAML::Exception(entry.Mark(), fmt::format("Client '{}' has no ids", client.name));
        }
    }
}

static err_string validate(const config &conf) {
    for (const listener_settings &listener : conf.proxy.listeners) {
        if (!utils::is_valid_ip4(listener.address) && !utils::is_valid_ip6(listener.address)) {
            return DG_FMT("Invalid listener address: {}", listener.address);
        }
    }
    for (const std::string &service : conf.proxy.filter_params.blocked_services) {
        if (!dnsfilter::is_known_service(service)) {
            return DG_FMT("Unknown blocked service: {}", service);
        }
    }
    for (const client_config &client : conf.clients) {
        for (const std::string &id : client.ids) {
            if (!utils::is_valid_ip4(id) && !utils::is_valid_ip6(id)) {
                return DG_FMT("Invalid address of client '{}': {}", client.name, id);
            }
        }
        for (const std::string &service : client.filtering.blocked_services.value_or(std::vector<std::string>{})) {
            if (!dnsfilter::is_known_service(service)) {
                return DG_FMT("Unknown blocked service of client '{}': {}", client.name, service);
            }
        }
    }
    return std::nullopt;
}

static config::parse_result parse(const YAML::Node &root) {
    config conf;
    conf.proxy = dnsproxy_settings::get_default();
    conf.proxy.listeners = {
            {"127.0.0.1", DEFAULT_PORT, utils::TP_UDP},
            {"127.0.0.1", DEFAULT_PORT, utils::TP_TCP},
    };

    try {
        conf.verbosity = read_enum(root, "log_level", conf.verbosity);
        if (const YAML::Node &dns = root["dns"]) {
            read_dns(dns, conf);
        }
        if (const YAML::Node &filtering = root["filtering"]) {
            read_filtering(filtering, conf);
        }
        read_clients(root["clients"], conf);
        if (const YAML::Node &dhcp = root["dhcp"]) {
            for (const YAML::Node &entry : dhcp["leases"]) {
                conf.leases.push_back({entry["hostname"].as<std::string>(), entry["ip"].as<std::string>()});
            }
        }
        if (const YAML::Node &querylog = root["querylog"]) {
            read(querylog, "enabled", conf.querylog.enabled);
            read(querylog, "file", conf.querylog.file);
            read(querylog, "max_file_size", conf.querylog.max_file_size);
            read(querylog, "max_files", conf.querylog.max_files);
            if (conf.querylog.enabled && conf.querylog.file.empty()) {
                return {std::nullopt, "Query log is enabled but has no file"};
            }
        }
    } catch (const YAML::Exception &e) {
        return {std::nullopt, e.what()};
    }

    if (err_string err = validate(conf); err.has_value()) {
        return {std::nullopt, std::move(err)};
    }
    return {std::move(conf), std::nullopt};
}

config::parse_result config::load_file(const std::string &path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        return {std::nullopt, DG_FMT("Unable to load configuration file '{}': {}", path, e.what())};
    }
    return parse(root);
}

config::parse_result config::load(const std::string &yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception &e) {
        return {std::nullopt, DG_FMT("Unable to parse configuration: {}", e.what())};
    }
    return parse(root);
}

const client_config *config::find_client(std::string_view ip) const {
    for (const client_config &client : clients) {
        if (std::find(client.ids.begin(), client.ids.end(), ip) != client.ids.end()) {
            return &client;
        }
    }
    return nullptr;
}

} // namespace dg::app
