#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <ldns/ldns.h>
#include <dg_dns_utils.h>
#include <dnsfilter.h>
#include <upstream_selector.h>

namespace dg {

/**
 * DNS request processed event
 */
struct dns_request_processed_event {
    std::string domain; /**< Queried domain name */
    std::string type; /**< Query type */
    int64_t start_time; /**< Time when dnsproxy started processing request (epoch in milliseconds) */
    int32_t elapsed; /**< Time elapsed on processing (in milliseconds) */
    std::string status; /**< DNS answer's status */
    std::string answer; /**< DNS Answers string representation */
    std::string original_answer; /**< If blocked by response, here will be DNS original answer's string representation */
    std::string upstream; /**< Address of the upstream which provided the answer, empty if none did */
    std::string client; /**< Client IP address */
    filter_result result; /**< Filtering verdict */
    std::string error; /**< If not empty, contains the error text (occurred while processing the DNS query) */
    bool cache_hit; /**< True if this response was served from the cache */
};

namespace stats_names {
static constexpr std::string_view QUERIES_TOTAL = "queries_total";
static constexpr std::string_view QUERIES_FILTERED = "queries_filtered";
static constexpr std::string_view QUERIES_SAFEBROWSING = "queries_safebrowsing";
static constexpr std::string_view QUERIES_PARENTAL = "queries_parental";
static constexpr std::string_view QUERIES_SAFESEARCH = "queries_safesearch";
static constexpr std::string_view QUERIES_ERROR = "queries_error";
static constexpr std::string_view PROCESSING_TIME_MS = "processing_time_ms";
} // namespace stats_names

/**
 * Set of DNS proxy events and collaborators.
 * All of them are optional and may be called from several threads at once.
 */
struct dnsproxy_events {
    /**
     * Raised right after a request is processed, including the failed ones.
     * Must not block for long.
     */
    std::function<void(const dns_request_processed_event &)> on_request_processed;

    /**
     * Increase the counter with the given name (see `stats_names`)
     */
    std::function<void(std::string_view counter, int64_t timestamp_ms)> on_stats_increment;

    /**
     * Record a value of the histogram with the given name (see `stats_names`)
     */
    std::function<void(std::string_view histogram, double value, int64_t timestamp_ms)> on_stats_observe;

    /**
     * Raised when a request is received, before any processing
     */
    std::function<void(const ldns_pkt *request, const dns_message_info &info)> on_request;

    /**
     * Get the upstreams of the client with the given IP.
     * Return nullopt if the client uses the global ones.
     */
    std::function<std::optional<upstream_list>(std::string_view client_ip)> get_custom_upstreams;

    /**
     * Adjust the filtering settings of the client with the given IP
     */
    std::function<void(std::string_view client_ip, client_settings &settings)> on_client_settings;
};

} // namespace dg
