#pragma once

#include <atomic>
#include <cstring>
#include <ctime>
#include <string>
#include <thread>
#include <vector>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <ldns/ldns.h>
#include <sodium.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include <dg_socket_address.h>
#include <dns_crypt_utils.h>
#include <dns_stamp.h>
#include "dns_crypt_cipher.h"
#include "dns_crypt_padding.h"

namespace dg::dnscrypt::test {

/**
 * Minimal DNSCrypt resolver serving over UDP on the loopback.
 * Answers the certificate query and every encrypted A query with `ANSWER_ADDRESS`.
 */
class test_resolver {
public:
    static constexpr const char *PROVIDER_NAME = "2.dnscrypt-cert.test.";
    static constexpr const char *ANSWER_ADDRESS = "1.2.3.4";

    struct cert_params {
        crypto_construction construction = crypto_construction::X_SALSA_20_POLY_1305;
        uint32_t serial = 1;
        /** Validity period relative to now, seconds */
        int64_t not_before = -3600;
        int64_t not_after = 3600;
    };

    explicit test_resolver(std::vector<cert_params> certs = {cert_params{}})
            : m_certs(std::move(certs)) {
        if (sodium_init() < 0) {
            return;
        }
        crypto_sign_keypair(m_sign_pk.data(), m_sign_sk.data());
        crypto_box_keypair(m_resolver_pk.data(), m_resolver_sk.data());

        m_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        socket_address any("127.0.0.1", 0);
        ::bind(m_fd, any.c_sockaddr(), any.c_socklen());
        sockaddr_storage ss{};
        socklen_t len = sizeof(ss);
        ::getsockname(m_fd, (sockaddr *) &ss, &len);
        m_address = socket_address((sockaddr *) &ss);
        timeval tv{0, 50000};
        ::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        m_thread = std::thread([this] { serve(); });
    }

    ~test_resolver() {
        m_stop = true;
        if (m_thread.joinable()) {
            m_thread.join();
        }
        if (m_fd != -1) {
            ::close(m_fd);
        }
    }

    test_resolver(const test_resolver &) = delete;
    test_resolver &operator=(const test_resolver &) = delete;

    server_stamp stamp() const {
        server_stamp s{};
        s.proto = stamp_proto_type::DNSCRYPT;
        s.server_addr_str = m_address.str();
        s.server_pk.assign(m_sign_pk.begin(), m_sign_pk.end());
        s.provider_name = PROVIDER_NAME;
        return s;
    }

    const socket_address &address() const {
        return m_address;
    }

    /** Stop answering encrypted queries, the certificate is still served */
    void ignore_queries(bool ignore) {
        m_ignore_queries = ignore;
    }

    size_t cert_requests() const {
        return m_cert_requests;
    }

private:
    static constexpr uint8_t SERVER_MAGIC[]{0x72, 0x36, 0x66, 0x6e, 0x76, 0x57, 0x6a, 0x38};

    std::vector<cert_params> m_certs;
    uint8_array<crypto_sign_PUBLICKEYBYTES> m_sign_pk{};
    uint8_array<crypto_sign_SECRETKEYBYTES> m_sign_sk{};
    key_array m_resolver_pk{};
    key_array m_resolver_sk{};
    int m_fd = -1;
    socket_address m_address;
    std::thread m_thread;
    std::atomic_bool m_stop{false};
    std::atomic_bool m_ignore_queries{false};
    std::atomic_size_t m_cert_requests{0};

    static client_magic_array magic_of(const cert_params &p) {
        client_magic_array magic{};
        magic.fill(uint8_t(p.serial));
        magic[0] = uint8_t(p.construction);
        return magic;
    }

    static void put_be32(uint8_vector &out, uint32_t v) {
        out.push_back(v >> 24);
        out.push_back(v >> 16);
        out.push_back(v >> 8);
        out.push_back(v);
    }

    uint8_vector make_cert(const cert_params &p) const {
        uint8_vector cert{'D', 'N', 'S', 'C', 0, uint8_t(p.construction), 0, 0};
        uint8_vector signed_part(m_resolver_pk.begin(), m_resolver_pk.end());
        auto magic = magic_of(p);
        signed_part.insert(signed_part.end(), magic.begin(), magic.end());
        put_be32(signed_part, p.serial);
        int64_t now = ::time(nullptr);
        put_be32(signed_part, uint32_t(now + p.not_before));
        put_be32(signed_part, uint32_t(now + p.not_after));
        uint8_t signature[crypto_sign_BYTES];
        crypto_sign_detached(signature, nullptr, signed_part.data(), signed_part.size(), m_sign_sk.data());
        cert.insert(cert.end(), std::begin(signature), std::end(signature));
        cert.insert(cert.end(), signed_part.begin(), signed_part.end());
        return cert;
    }

    static ldns_pkt_ptr make_reply(const ldns_pkt *request) {
        ldns_pkt_ptr reply(ldns_pkt_new());
        ldns_pkt_set_id(reply.get(), ldns_pkt_id(request));
        ldns_pkt_set_qr(reply.get(), true);
        ldns_pkt_set_rd(reply.get(), ldns_pkt_rd(request));
        ldns_pkt_set_ra(reply.get(), true);
        ldns_rr_list_deep_free(ldns_pkt_question(reply.get()));
        ldns_pkt_set_question(reply.get(), ldns_rr_list_clone(ldns_pkt_question(request)));
        ldns_pkt_set_qdcount(reply.get(), ldns_rr_list_rr_count(ldns_pkt_question(request)));
        return reply;
    }

    static uint8_vector to_wire(const ldns_pkt *pkt) {
        uint8_t *buf = nullptr;
        size_t size = 0;
        if (LDNS_STATUS_OK != ldns_pkt2wire(&buf, pkt, &size)) {
            return {};
        }
        uint8_vector result(buf, buf + size);
        std::free(buf);
        return result;
    }

    uint8_vector answer_cert_query(const ldns_pkt *request) const {
        ldns_pkt_ptr reply = make_reply(request);
        for (const cert_params &p : m_certs) {
            uint8_vector cert = make_cert(p);
            uint8_vector rdata{uint8_t(cert.size())};
            rdata.insert(rdata.end(), cert.begin(), cert.end());
            ldns_rr *rr = ldns_rr_new();
            ldns_rr_set_owner(rr, ldns_dname_new_frm_str(PROVIDER_NAME));
            ldns_rr_set_type(rr, LDNS_RR_TYPE_TXT);
            ldns_rr_set_class(rr, LDNS_RR_CLASS_IN);
            ldns_rr_set_ttl(rr, 60);
            ldns_rr_push_rdf(rr, ldns_rdf_new_frm_data(LDNS_RDF_TYPE_STR, rdata.size(), rdata.data()));
            ldns_pkt_push_rr(reply.get(), LDNS_SECTION_ANSWER, rr);
        }
        return to_wire(reply.get());
    }

    bool has_known_magic(uint8_view query) const {
        for (const cert_params &p : m_certs) {
            auto magic = magic_of(p);
            if (query.size() >= magic.size() && 0 == std::memcmp(magic.data(), query.data(), magic.size())) {
                return true;
            }
        }
        return false;
    }

    uint8_vector answer_encrypted_query(uint8_view query) const {
        constexpr size_t header_len = CLIENT_MAGIC_LEN + KEY_SIZE + HALF_NONCE_SIZE;
        if (query.size() < header_len) {
            return {};
        }
        const cert_params *cert = nullptr;
        for (const cert_params &p : m_certs) {
            auto magic = magic_of(p);
            if (0 == std::memcmp(magic.data(), query.data(), magic.size())) {
                cert = &p;
            }
        }
        if (cert == nullptr) {
            return {};
        }
        key_array client_pk{};
        std::memcpy(client_pk.data(), query.data() + CLIENT_MAGIC_LEN, KEY_SIZE);
        nonce_array nonce{};
        std::memcpy(nonce.data(), query.data() + CLIENT_MAGIC_LEN + KEY_SIZE, HALF_NONCE_SIZE);

        auto [key, key_err] = cipher_shared_key(cert->construction, m_resolver_sk, client_pk);
        if (key_err) {
            return {};
        }
        query.remove_prefix(header_len);
        auto [plain, open_err] = cipher_open(cert->construction, query, nonce, key);
        if (open_err || !unpad(plain)) {
            return {};
        }
        ldns_pkt *request = nullptr;
        if (LDNS_STATUS_OK != ldns_wire2pkt(&request, plain.data(), plain.size())) {
            return {};
        }
        ldns_pkt_ptr request_ptr(request);
        ldns_pkt_ptr reply = make_reply(request);
        const ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(request), 0);
        if (question != nullptr && ldns_rr_get_type(question) == LDNS_RR_TYPE_A) {
            ldns_rr *rr = ldns_rr_new();
            ldns_rr_set_owner(rr, ldns_rdf_clone(ldns_rr_owner(question)));
            ldns_rr_set_type(rr, LDNS_RR_TYPE_A);
            ldns_rr_set_class(rr, LDNS_RR_CLASS_IN);
            ldns_rr_set_ttl(rr, 60);
            ldns_rr_push_rdf(rr, ldns_rdf_new_frm_str(LDNS_RDF_TYPE_A, ANSWER_ADDRESS));
            ldns_pkt_push_rr(reply.get(), LDNS_SECTION_ANSWER, rr);
        }
        uint8_vector reply_wire = to_wire(reply.get());
        if (!pad(reply_wire, (reply_wire.size() + 64) & ~size_t(63))) {
            return {};
        }
        randombytes_buf(nonce.data() + HALF_NONCE_SIZE, HALF_NONCE_SIZE);
        auto [sealed, seal_err] = cipher_seal(cert->construction,
                uint8_view{reply_wire.data(), reply_wire.size()}, nonce, key);
        if (seal_err) {
            return {};
        }
        uint8_vector out(std::begin(SERVER_MAGIC), std::end(SERVER_MAGIC));
        out.insert(out.end(), nonce.begin(), nonce.end());
        out.insert(out.end(), sealed.begin(), sealed.end());
        return out;
    }

    void serve() {
        uint8_t buf[4096];
        while (!m_stop) {
            sockaddr_storage peer{};
            socklen_t peer_len = sizeof(peer);
            ssize_t r = ::recvfrom(m_fd, buf, sizeof(buf), 0, (sockaddr *) &peer, &peer_len);
            if (r <= 0) {
                continue;
            }
            uint8_view query{buf, size_t(r)};
            uint8_vector reply;
            if (has_known_magic(query)) {
                if (!m_ignore_queries) {
                    reply = answer_encrypted_query(query);
                }
            } else if (ldns_pkt *pkt = nullptr; LDNS_STATUS_OK == ldns_wire2pkt(&pkt, query.data(), query.size())) {
                ldns_pkt_ptr request(pkt);
                if (ldns_pkt_qdcount(pkt) == 1
                        && ldns_rr_get_type(ldns_rr_list_rr(ldns_pkt_question(pkt), 0)) == LDNS_RR_TYPE_TXT) {
                    ++m_cert_requests;
                    reply = answer_cert_query(pkt);
                }
            }
            if (!reply.empty()) {
                ::sendto(m_fd, reply.data(), reply.size(), 0, (sockaddr *) &peer, peer_len);
            }
        }
    }
};

} // namespace dg::dnscrypt::test
