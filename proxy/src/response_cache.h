#pragma once

#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <ldns/ldns.h>
#include <dg_cache.h>
#include <dg_clock.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include <dg_logger.h>

namespace dg {

/**
 * Response cache
 *
 * Keeps upstream responses keyed by the question type, class and lowercased name.
 * A served response gets the remaining lifetime as the TTL of every record.
 */
class response_cache {
public:
    struct result {
        ldns_pkt_ptr response; // nullptr on miss
    };

    /**
     * @param capacity maximum number of cached responses, 0 disables caching
     * @param min_ttl if not 0, responses with a lower TTL are kept at least this long
     * @param max_ttl if not 0, responses with a greater TTL are kept at most this long
     */
    explicit response_cache(size_t capacity, uint32_t min_ttl = 0, uint32_t max_ttl = 0);

    /**
     * Get a response for the request.
     * The stale entry, if any, is removed.
     * @return response with the request's ID and question, or nullptr
     */
    result get(const ldns_pkt *request);

    /**
     * Put a response into the cache, if it is cacheable
     */
    void set(const ldns_pkt *response);

    void clear();

    size_t size() const;

    bool enabled() const {
        return m_capacity != 0;
    }

    /**
     * @return cache key of the first question of the message, or an empty string if there is no question
     */
    static std::string get_cache_key(const ldns_pkt *msg);

    /**
     * @return the minimum TTL of the message's answer, authority and additional records,
     *         0 if there are no records
     */
    static uint32_t compute_lowest_ttl(const ldns_pkt *msg);

private:
    struct entry {
        ldns_pkt_ptr response;
        steady_clock::time_point cached_at;
        uint32_t ttl;
    };

    logger m_log;
    size_t m_capacity;
    uint32_t m_min_ttl;
    uint32_t m_max_ttl;
    with_mtx<lru_cache<std::string, entry>, std::shared_mutex> m_cache;
};

} // namespace dg
