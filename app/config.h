#pragma once

#include <optional>
#include <string>
#include <vector>
#include <dg_defs.h>
#include <dnsfilter.h>
#include <dnsproxy_settings.h>

namespace dg::app {

/**
 * Settings of a known client, matched by its IP address
 */
struct client_config {
    std::string name;
    std::vector<std::string> ids; // IP addresses of the client
    std::vector<std::string> upstreams; // Own upstreams, the global ones are used if empty
    client_settings filtering;
};

struct querylog_config {
    bool enabled = false;
    std::string file; // Path of the log file
    size_t max_file_size = 10 * 1024 * 1024; // Rotate when the file grows beyond this
    size_t max_files = 3; // Number of rotated files kept
};

struct config {
    dnsproxy_settings proxy;
    std::vector<client_config> clients;
    std::vector<dhcp_lease> leases;
    querylog_config querylog;
    log_level verbosity = INFO;

    struct parse_result {
        std::optional<config> conf;
        err_string error;
    };

    /**
     * Load the configuration from a YAML file.
     * Missing keys keep the default values.
     */
    static parse_result load_file(const std::string &path);

    /**
     * Load the configuration from a YAML document
     */
    static parse_result load(const std::string &yaml);

    /**
     * Find the settings of the client with the given address
     */
    const client_config *find_client(std::string_view ip) const;
};

} // namespace dg::app
