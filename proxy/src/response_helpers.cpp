#include <string>
#include <dg_defs.h>
#include <dg_utils.h>
#include "response_helpers.h"

namespace dg {

static constexpr uint32_t DEFAULT_BLOCKED_RESPONSE_TTL = 3600;
static constexpr std::string_view SOA_MNAME = "fake-for-negative-caching.dnsguard.local.";
static constexpr uint32_t SOA_SERIAL = 100500;
static constexpr uint32_t SOA_REFRESH = 1800;
static constexpr uint32_t SOA_EXPIRE = 604800;
static constexpr uint32_t SOA_MINIMUM = 86400;

static const ldns_rr *get_question(const ldns_pkt *request) {
    return ldns_rr_list_rr(ldns_pkt_question(request), 0);
}

static ldns_rdf *clone_question_name(const ldns_pkt *request) {
    const ldns_rr *question = get_question(request);
    return (question != nullptr) ? ldns_rdf_clone(ldns_rr_owner(question)) : ldns_dname_new_frm_str(".");
}

static ldns_rr_type get_question_type(const ldns_pkt *request) {
    const ldns_rr *question = get_question(request);
    return (question != nullptr) ? ldns_rr_get_type(question) : LDNS_RR_TYPE_A;
}

static std::string make_fqdn(std::string_view name) {
    return utils::ends_with(name, ".") ? std::string(name) : std::string(name) + ".";
}

static ldns_rr *make_rr(ldns_rdf *owner, ldns_rr_type type, uint32_t ttl, ldns_rdf *rdata) {
    ldns_rr *rr = ldns_rr_new();
    ldns_rr_set_owner(rr, owner);
    ldns_rr_set_type(rr, type);
    ldns_rr_set_class(rr, LDNS_RR_CLASS_IN);
    ldns_rr_set_ttl(rr, ttl);
    ldns_rr_push_rdf(rr, rdata);
    return rr;
}

// Return nullptr if the address is not of the requested type
static ldns_rr *make_address_rr(ldns_rdf *owner, ldns_rr_type type, uint32_t ttl, std::string_view ip) {
    bool fits = (type == LDNS_RR_TYPE_A) ? utils::is_valid_ip4(ip)
            : (type == LDNS_RR_TYPE_AAAA) && utils::is_valid_ip6(ip);
    ldns_rdf *rdata = nullptr;
    if (fits) {
        rdata = ldns_rdf_new_frm_str((type == LDNS_RR_TYPE_A) ? LDNS_RDF_TYPE_A : LDNS_RDF_TYPE_AAAA,
                std::string(ip).c_str());
    }
    if (rdata == nullptr) {
        ldns_rdf_deep_free(owner);
        return nullptr;
    }
    return make_rr(owner, type, ttl, rdata);
}

static ldns_pkt *create_response_with_rcode(const ldns_pkt *request, ldns_pkt_rcode rcode) {
    ldns_pkt *response = response_helpers::create_response_by_request(request);
    ldns_pkt_set_rcode(response, rcode);
    return response;
}

ldns_pkt *response_helpers::create_response_by_request(const ldns_pkt *request) {
    ldns_pkt *response = ldns_pkt_new();
    ldns_pkt_set_id(response, ldns_pkt_id(request));
    ldns_pkt_set_qr(response, true); // answer flag
    ldns_pkt_set_opcode(response, ldns_pkt_get_opcode(request));
    ldns_pkt_set_rd(response, ldns_pkt_rd(request));
    ldns_pkt_set_cd(response, ldns_pkt_cd(request));
    ldns_pkt_set_ra(response, true);
    ldns_pkt_set_rcode(response, LDNS_RCODE_NOERROR);
    ldns_rr_list_deep_free(ldns_pkt_question(response));
    ldns_pkt_set_question(response, ldns_pkt_get_section_clone(request, LDNS_SECTION_QUESTION));
    ldns_pkt_set_qdcount(response, ldns_pkt_section_count(request, LDNS_SECTION_QUESTION));
    return response;
}

ldns_pkt *response_helpers::create_servfail_response(const ldns_pkt *request) {
    return create_response_with_rcode(request, LDNS_RCODE_SERVFAIL);
}

ldns_pkt *response_helpers::create_refused_response(const ldns_pkt *request) {
    return create_response_with_rcode(request, LDNS_RCODE_REFUSED);
}

ldns_pkt *response_helpers::create_notimpl_response(const ldns_pkt *request) {
    return create_response_with_rcode(request, LDNS_RCODE_NOTIMPL);
}

ldns_rr *response_helpers::create_soa(const ldns_pkt *request, const dnsproxy_settings &settings,
        uint32_t retry_secs) {
    ldns_rdf *zone = clone_question_name(request);

    std::string mbox = "hostmaster.";
    allocated_ptr<char> zone_str{ldns_rdf2str(zone)};
    if (zone_str != nullptr && zone_str.get()[0] != '\0' && zone_str.get()[0] != '.') {
        mbox += zone_str.get();
    }

    uint32_t ttl = settings.blocked_response_ttl_secs ? settings.blocked_response_ttl_secs
                                                      : DEFAULT_BLOCKED_RESPONSE_TTL;

    ldns_rr *soa = make_rr(zone, LDNS_RR_TYPE_SOA, ttl, ldns_dname_new_frm_str(std::string(SOA_MNAME).c_str()));
    ldns_rr_push_rdf(soa, ldns_dname_new_frm_str(mbox.c_str())); // RNAME
    ldns_rr_push_rdf(soa, ldns_native2rdf_int32(LDNS_RDF_TYPE_INT32, SOA_SERIAL));
    ldns_rr_push_rdf(soa, ldns_native2rdf_int32(LDNS_RDF_TYPE_PERIOD, SOA_REFRESH));
    ldns_rr_push_rdf(soa, ldns_native2rdf_int32(LDNS_RDF_TYPE_PERIOD, retry_secs));
    ldns_rr_push_rdf(soa, ldns_native2rdf_int32(LDNS_RDF_TYPE_PERIOD, SOA_EXPIRE));
    ldns_rr_push_rdf(soa, ldns_native2rdf_int32(LDNS_RDF_TYPE_PERIOD, SOA_MINIMUM));
    return soa;
}

ldns_pkt *response_helpers::create_nxdomain_response(const ldns_pkt *request, const dnsproxy_settings &settings) {
    ldns_pkt *response = create_response_with_rcode(request, LDNS_RCODE_NXDOMAIN);
    ldns_pkt_push_rr(response, LDNS_SECTION_AUTHORITY, create_soa(request, settings, SOA_RETRY_DEFAULT));
    return response;
}

ldns_pkt *response_helpers::create_soa_response(const ldns_pkt *request, const dnsproxy_settings &settings,
        uint32_t retry_secs) {
    ldns_pkt *response = create_response_by_request(request);
    ldns_pkt_push_rr(response, LDNS_SECTION_AUTHORITY, create_soa(request, settings, retry_secs));
    return response;
}

ldns_pkt *response_helpers::create_response_with_ip(const ldns_pkt *request, const dnsproxy_settings &settings,
        std::string_view ip) {
    ldns_pkt *response = create_response_by_request(request);
    ldns_rr *answer = make_address_rr(clone_question_name(request), get_question_type(request),
            settings.blocked_response_ttl_secs, ip);
    if (answer != nullptr) {
        ldns_pkt_push_rr(response, LDNS_SECTION_ANSWER, answer);
    }
    return response;
}

ldns_pkt *response_helpers::create_null_ip_response(const ldns_pkt *request, const dnsproxy_settings &settings) {
    switch (get_question_type(request)) {
    case LDNS_RR_TYPE_A:
        return create_response_with_ip(request, settings, "0.0.0.0");
    case LDNS_RR_TYPE_AAAA:
        return create_response_with_ip(request, settings, "::");
    default:
        return create_response_by_request(request);
    }
}

ldns_pkt *response_helpers::create_custom_ip_response(const ldns_pkt *request, const dnsproxy_settings &settings) {
    switch (get_question_type(request)) {
    case LDNS_RR_TYPE_A:
        return create_response_with_ip(request, settings, settings.custom_blocking_ipv4);
    case LDNS_RR_TYPE_AAAA:
        return create_response_with_ip(request, settings, settings.custom_blocking_ipv6);
    default:
        return create_response_by_request(request);
    }
}

ldns_rr *response_helpers::create_cname_rr(const ldns_pkt *request, const dnsproxy_settings &settings,
        std::string_view cname) {
    ldns_rdf *target = ldns_dname_new_frm_str(make_fqdn(cname).c_str());
    if (target == nullptr) {
        return nullptr;
    }
    return make_rr(clone_question_name(request), LDNS_RR_TYPE_CNAME, settings.blocked_response_ttl_secs, target);
}

ldns_pkt *response_helpers::create_rewrite_response(const ldns_pkt *request, const dnsproxy_settings &settings,
        const verdict::rewritten &rewrite) {
    ldns_pkt *response = create_response_by_request(request);
    ldns_rdf *name = clone_question_name(request);

    if (!rewrite.canonical_name.empty()) {
        if (ldns_rr *cname = create_cname_rr(request, settings, rewrite.canonical_name); cname != nullptr) {
            ldns_pkt_push_rr(response, LDNS_SECTION_ANSWER, cname);
            ldns_rdf_deep_free(name);
            name = ldns_rdf_clone(ldns_rr_rdf(cname, 0));
        }
    }

    ldns_rr_type type = get_question_type(request);
    for (const std::string &ip : rewrite.ips) {
        ldns_rr *rr = make_address_rr(ldns_rdf_clone(name), type, settings.blocked_response_ttl_secs, ip);
        if (rr != nullptr) {
            ldns_pkt_push_rr(response, LDNS_SECTION_ANSWER, rr);
        }
    }

    ldns_rdf_deep_free(name);
    return response;
}

ldns_pkt *response_helpers::create_redirect_response(const ldns_pkt *request, const ldns_pkt *resolved) {
    ldns_pkt *response = create_response_by_request(request);
    if (resolved == nullptr) {
        return response;
    }

    const ldns_rr_list *answer = ldns_pkt_answer(resolved);
    for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
        ldns_rr *rr = ldns_rr_clone(ldns_rr_list_rr(answer, i));
        ldns_rdf_deep_free(ldns_rr_owner(rr));
        ldns_rr_set_owner(rr, clone_question_name(request));
        ldns_pkt_push_rr(response, LDNS_SECTION_ANSWER, rr);
    }
    return response;
}

ldns_pkt *response_helpers::create_ptr_response(const ldns_pkt *request, const dnsproxy_settings &settings,
        std::string_view host) {
    ldns_pkt *response = create_response_by_request(request);
    ldns_rdf *target = ldns_dname_new_frm_str(make_fqdn(host).c_str());
    if (target != nullptr) {
        ldns_pkt_push_rr(response, LDNS_SECTION_ANSWER,
                make_rr(clone_question_name(request), LDNS_RR_TYPE_PTR, settings.blocked_response_ttl_secs, target));
    }
    return response;
}

} // namespace dg
