#include <algorithm>
#include <ldns/rbtree.h>
#include "dns_truncate.h"

namespace dg {

static constexpr size_t HEADER_SIZE = 12;
// Owner ".", TYPE, CLASS, TTL, RDLENGTH
static constexpr size_t OPT_RR_SIZE = 1 + 2 + 2 + 4 + 2;
// Compression pointers are 14 bits wide
static constexpr size_t MAX_COMPRESSION_OFFSET = 0x3fff;

namespace {

// Tracks the size of the packet being written and the names available for compression
class wire_size_counter {
public:
    wire_size_counter()
            : m_names(ldns_rbtree_create((int (*)(const void *, const void *)) ldns_dname_compare)) {
    }

    ~wire_size_counter() {
        ldns_traverse_postorder(m_names, [](ldns_rbnode_t *node, void *) {
            ldns_rdf_deep_free((ldns_rdf *) node->key);
            LDNS_FREE(node);
        }, nullptr);
        ldns_rbtree_free(m_names);
    }

    wire_size_counter(const wire_size_counter &) = delete;
    wire_size_counter &operator=(const wire_size_counter &) = delete;

    size_t pos = HEADER_SIZE;

    void add_rr(const ldns_rr *rr, ldns_pkt_section section) {
        add_name(ldns_rr_owner(rr), true);
        pos += 4; // TYPE, CLASS
        if (section == LDNS_SECTION_QUESTION) {
            return;
        }
        pos += 6; // TTL, RDLENGTH
        bool compress = ldns_rr_descript(ldns_rr_get_type(rr))->_compress != LDNS_RR_NO_COMPRESS;
        for (size_t i = 0; i < ldns_rr_rd_count(rr); ++i) {
            const ldns_rdf *rdf = ldns_rr_rdf(rr, i);
            if (ldns_rdf_get_type(rdf) == LDNS_RDF_TYPE_DNAME) {
                add_name(rdf, compress);
            } else {
                pos += ldns_rdf_size(rdf);
            }
        }
    }

private:
    ldns_rbtree_t *m_names;

    void add_name(const ldns_rdf *name, bool compress) {
        if (name == nullptr) {
            return;
        }
        if (!compress) {
            pos += ldns_rdf_size(name);
            return;
        }
        if (ldns_dname_label_count(name) == 0) {
            pos += 1; // root
            return;
        }
        if (ldns_rbtree_search(m_names, name) != nullptr) {
            pos += 2; // pointer
            return;
        }
        if (pos <= MAX_COMPRESSION_OFFSET) {
            auto *node = LDNS_MALLOC(ldns_rbnode_t);
            node->key = ldns_rdf_clone(name);
            ldns_rbtree_insert(m_names, node);
        }
        ldns_rdf *first = ldns_dname_label(name, 0);
        pos += ldns_rdf_size(first) - 1; // without the terminating zero
        ldns_rdf_deep_free(first);
        ldns_rdf *rest = ldns_dname_left_chop(name);
        add_name(rest, true);
        ldns_rdf_deep_free(rest);
    }
};

} // namespace

static ldns_rr_list *get_section(ldns_pkt *pkt, ldns_pkt_section section) {
    switch (section) {
    case LDNS_SECTION_QUESTION:
        return ldns_pkt_question(pkt);
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

static bool same_rrset(const ldns_rr *a, const ldns_rr *b) {
    return ldns_rr_get_type(a) == ldns_rr_get_type(b) && ldns_rr_get_class(a) == ldns_rr_get_class(b)
            && 0 == ldns_dname_compare(ldns_rr_owner(a), ldns_rr_owner(b));
}

bool ldns_pkt_truncate(ldns_pkt *pkt, uint16_t max_size) {
    static constexpr ldns_pkt_section SECTIONS[] = {
            LDNS_SECTION_QUESTION,
            LDNS_SECTION_ANSWER,
            LDNS_SECTION_AUTHORITY,
            LDNS_SECTION_ADDITIONAL,
    };

    size_t limit = std::max(max_size, DNS_MIN_UDP_PAYLOAD);
    wire_size_counter counter;
    if (ldns_pkt_edns(pkt)) {
        const ldns_rdf *edns_data = ldns_pkt_edns_data(pkt);
        counter.pos += OPT_RR_SIZE + ((edns_data != nullptr) ? ldns_rdf_size(edns_data) : 0);
    }
    if (const ldns_rr *tsig = ldns_pkt_tsig(pkt); tsig != nullptr) {
        wire_size_counter tsig_counter;
        tsig_counter.pos = 0;
        tsig_counter.add_rr(tsig, LDNS_SECTION_ADDITIONAL);
        counter.pos += tsig_counter.pos;
    }

    bool truncated = false;
    for (ldns_pkt_section section : SECTIONS) {
        ldns_rr_list *rrs = get_section(pkt, section);
        size_t kept = 0;
        for (; rrs != nullptr && !truncated && kept < ldns_rr_list_rr_count(rrs); ++kept) {
            counter.add_rr(ldns_rr_list_rr(rrs, kept), section);
            truncated = counter.pos > limit;
            if (truncated) {
                break;
            }
        }
        // An RRset is either sent whole or not at all
        while (truncated && kept > 0 && kept < ldns_rr_list_rr_count(rrs)
                && same_rrset(ldns_rr_list_rr(rrs, kept - 1), ldns_rr_list_rr(rrs, kept))) {
            --kept;
        }
        while (rrs != nullptr && ldns_rr_list_rr_count(rrs) > kept) {
            ldns_rr_free(ldns_rr_list_pop_rr(rrs));
            truncated = true;
        }
        ldns_pkt_set_section_count(pkt, section, (uint16_t) kept);
    }

    if (truncated) {
        ldns_pkt_set_tc(pkt, true);
    }
    return truncated;
}

} // namespace dg
