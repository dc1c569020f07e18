#include <algorithm>
#include <cctype>
#include <cmath>
#include <dg_utils.h>
#include "response_cache.h"

using namespace std::chrono;

namespace dg {

static constexpr ldns_pkt_section CACHED_SECTIONS[] = {
        LDNS_SECTION_ANSWER,
        LDNS_SECTION_AUTHORITY,
        LDNS_SECTION_ADDITIONAL,
};

static ldns_rr_list *get_section(const ldns_pkt *pkt, ldns_pkt_section section) {
    switch (section) {
    case LDNS_SECTION_ANSWER:
        return ldns_pkt_answer(pkt);
    case LDNS_SECTION_AUTHORITY:
        return ldns_pkt_authority(pkt);
    case LDNS_SECTION_ADDITIONAL:
        return ldns_pkt_additional(pkt);
    default:
        return nullptr;
    }
}

// Build the reply served to `request` from a cached template
static ldns_pkt_ptr make_served_response(const ldns_pkt *cached, const ldns_pkt *request, uint32_t ttl) {
    ldns_pkt_ptr response(ldns_pkt_new());
    ldns_pkt *r = response.get();

    ldns_pkt_set_id(r, ldns_pkt_id(request));
    ldns_pkt_set_qr(r, true);
    ldns_pkt_set_opcode(r, ldns_pkt_get_opcode(cached));
    ldns_pkt_set_rd(r, ldns_pkt_rd(request));
    ldns_pkt_set_cd(r, ldns_pkt_cd(request));
    // This is NOT an authoritative answer
    ldns_pkt_set_aa(r, false);
    ldns_pkt_set_ra(r, ldns_pkt_ra(cached));
    ldns_pkt_set_ad(r, ldns_pkt_ad(cached));
    ldns_pkt_set_rcode(r, ldns_pkt_get_rcode(cached));
    // The cached OPT belongs to the upstream hop, answer with the one of the current request
    if (ldns_pkt_edns(request)) {
        ldns_pkt_set_edns_udp_size(r, ldns_pkt_edns_udp_size(request));
        ldns_pkt_set_edns_do(r, ldns_pkt_edns_do(request));
    }

    ldns_rr_list_deep_free(ldns_pkt_question(r));
    ldns_pkt_set_question(r, ldns_pkt_get_section_clone(request, LDNS_SECTION_QUESTION));
    ldns_pkt_set_qdcount(r, ldns_pkt_qdcount(request));

    for (ldns_pkt_section section : CACHED_SECTIONS) {
        const ldns_rr_list *list = get_section(cached, section);
        for (size_t i = 0; i < ldns_rr_list_rr_count(list); ++i) {
            const ldns_rr *rr = ldns_rr_list_rr(list, i);
            if (ldns_rr_get_type(rr) == LDNS_RR_TYPE_OPT) {
                continue;
            }
            ldns_rr *copy = ldns_rr_clone(rr);
            ldns_rr_set_ttl(copy, ttl);
            ldns_pkt_push_rr(r, section, copy);
        }
    }

    return response;
}

response_cache::response_cache(size_t capacity, uint32_t min_ttl, uint32_t max_ttl)
        : m_log(create_logger("response_cache"))
        , m_capacity(capacity)
        , m_min_ttl(min_ttl)
        , m_max_ttl(max_ttl)
        , m_cache{lru_cache<std::string, entry>(capacity)} {
}

std::string response_cache::get_cache_key(const ldns_pkt *msg) {
    const ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(msg), 0);
    if (question == nullptr) {
        return {};
    }

    std::string key = fmt::format("{}|{}|", // '|' is to avoid collisions
            (int) ldns_rr_get_type(question), (int) ldns_rr_get_class(question));

    // Compute the domain name, in lower case for case-insensitivity
    const ldns_rdf *owner = ldns_rr_owner(question);
    const size_t size = ldns_rdf_size(owner);
    key.reserve(key.size() + size);
    if (size <= 1) {
        key.push_back('.');
        return key;
    }

    const auto *data = (const uint8_t *) ldns_rdf_data(owner);
    size_t pos = 0;
    while (pos < size && data[pos] != 0) {
        uint8_t len = data[pos++];
        for (uint8_t i = 0; i < len && pos < size; ++i, ++pos) {
            key.push_back((char) std::tolower(data[pos]));
        }
        key.push_back('.');
    }

    return key;
}

uint32_t response_cache::compute_lowest_ttl(const ldns_pkt *msg) {
    uint32_t lowest = UINT32_MAX;
    for (ldns_pkt_section section : CACHED_SECTIONS) {
        const ldns_rr_list *list = get_section(msg, section);
        for (size_t i = 0; i < ldns_rr_list_rr_count(list); ++i) {
            const ldns_rr *rr = ldns_rr_list_rr(list, i);
            if (ldns_rr_get_type(rr) == LDNS_RR_TYPE_OPT) {
                continue;
            }
            lowest = std::min(lowest, ldns_rr_ttl(rr));
        }
    }
    if (lowest == UINT32_MAX) { // No RRs in msg
        lowest = 0;
    }
    return lowest;
}

response_cache::result response_cache::get(const ldns_pkt *request) {
    if (!enabled()) {
        return {};
    }

    std::string key = get_cache_key(request);
    if (key.empty()) {
        return {};
    }

    {
        std::shared_lock l(m_cache.mtx);
        auto acc = m_cache.val.get(key);
        if (!acc) {
            dbglog(m_log, "Cache miss for key {}", key);
            return {};
        }

        double elapsed = duration<double>(steady_clock::now() - acc->cached_at).count();
        if (acc->ttl != 0 && elapsed < acc->ttl) {
            auto ttl = (uint32_t) std::max(0L, std::lround(acc->ttl - elapsed));
            dbglog(m_log, "Cache hit for key {}, TTL {}", key, ttl);
            return {make_served_response(acc->response.get(), request, ttl)};
        }
    }

    // The entry could have been replaced since the read lock was released
    std::unique_lock l(m_cache.mtx);
    auto acc = m_cache.val.get(key);
    if (acc && steady_clock::now() - acc->cached_at >= seconds(acc->ttl)) {
        dbglog(m_log, "Removing expired entry for key {}", key);
        m_cache.val.erase(key);
    }
    return {};
}

void response_cache::set(const ldns_pkt *response) {
    if (!enabled() || response == nullptr) {
        return;
    }

    if (ldns_pkt_tc(response) // Truncated
            || ldns_pkt_qdcount(response) != 1) { // Invalid
        return;
    }
    ldns_pkt_rcode rcode = ldns_pkt_get_rcode(response);
    if (rcode != LDNS_RCODE_NOERROR && rcode != LDNS_RCODE_NXDOMAIN) {
        return;
    }

    uint32_t ttl = compute_lowest_ttl(response);
    if (ttl == 0) {
        return;
    }
    if (m_min_ttl != 0 && ttl < m_min_ttl) {
        ttl = m_min_ttl;
    } else if (m_max_ttl != 0 && ttl > m_max_ttl) {
        ttl = m_max_ttl;
    }

    std::string key = get_cache_key(response);
    if (key.empty()) {
        return;
    }

    entry e{ldns_pkt_ptr(ldns_pkt_clone(response)), steady_clock::now(), ttl};

    std::unique_lock l(m_cache.mtx);
    tracelog(m_log, "Caching response for key {} for {} seconds", key, ttl);
    m_cache.val.insert(std::move(key), std::move(e));
}

void response_cache::clear() {
    std::unique_lock l(m_cache.mtx);
    m_cache.val.clear();
}

size_t response_cache::size() const {
    std::shared_lock l(m_cache.mtx);
    return m_cache.val.size();
}

} // namespace dg
