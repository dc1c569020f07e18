#include <algorithm>
#include <iterator>
#include <sodium.h>
#include <magic_enum.hpp>
#include <dg_clock.h>
#include <dg_logger.h>
#include <dg_utils.h>
#include <dns_crypt_ldns.h>
#include <dns_crypt_server_info.h>
#include "dns_crypt_cipher.h"
#include "dns_crypt_padding.h"

using namespace std::chrono;

namespace dg::dnscrypt {

static constexpr uint8_t CERT_MAGIC[]{0x44, 0x4e, 0x53, 0x43};
static constexpr uint8_t SERVER_MAGIC[]{0x72, 0x36, 0x66, 0x6e, 0x76, 0x57, 0x6a, 0x38};
static constexpr size_t MIN_DNS_PACKET_SIZE = 12 + 5;
// Some resolvers reject queries padded to less than 256 bytes
static constexpr size_t MIN_UDP_QUESTION_SIZE = 256;

// Certificate layout
static constexpr size_t ES_VERSION_OFFSET = 4;
static constexpr size_t SIGNATURE_OFFSET = 8;
static constexpr size_t SIGNATURE_SIZE = 64;
static constexpr size_t RESOLVER_PK_OFFSET = SIGNATURE_OFFSET + SIGNATURE_SIZE;
static constexpr size_t CLIENT_MAGIC_OFFSET = RESOLVER_PK_OFFSET + KEY_SIZE;
static constexpr size_t SERIAL_OFFSET = CLIENT_MAGIC_OFFSET + CLIENT_MAGIC_LEN;
static constexpr size_t TS_START_OFFSET = SERIAL_OFFSET + 4;
static constexpr size_t TS_END_OFFSET = TS_START_OFFSET + 4;
static constexpr size_t MIN_CERT_SIZE = TS_END_OFFSET + 4;

static uint32_t read_be32(const uint8_vector &data, size_t offset) {
    return (uint32_t(data[offset]) << 24) | (uint32_t(data[offset + 1]) << 16)
            | (uint32_t(data[offset + 2]) << 8) | uint32_t(data[offset + 3]);
}

static std::string format_epoch(uint32_t secs) {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::gmtime(std::time_t(secs)));
}

static const logger &server_info_log() {
    static logger log = create_logger("dnscrypt");
    return log;
}

server_info::fetch_result server_info::fetch_current_dnscrypt_cert(utils::transport_protocol protocol,
        milliseconds timeout) {
    static constexpr utils::make_error<fetch_result> make_error;
    if (m_server_public_key.size() != crypto_sign_PUBLICKEYBYTES) {
        return make_error("Invalid public key length");
    }
    ldns_pkt_ptr query = create_request_ldns_pkt(LDNS_RR_TYPE_TXT, LDNS_RR_CLASS_IN, LDNS_RD, m_provider_name,
            utils::make_optional_if(protocol == utils::TP_UDP, MAX_DNS_UDP_SAFE_PACKET_SIZE));
    if (query == nullptr) {
        return make_error(DG_FMT("Invalid provider name: {}", m_provider_name));
    }
    ldns_pkt_set_random_id(query.get());

    auto [reply, rtt, exchange_err] = dns_exchange_from_ldns_pkt(timeout,
            utils::str_to_socket_address(m_server_address), *query, protocol);
    if (exchange_err) {
        return make_error(std::move(exchange_err));
    }

    cert_info best{};
    const ldns_rr_list *answer = ldns_pkt_answer(reply.get());
    for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
        const ldns_rr *rr = ldns_rr_list_rr(answer, i);
        if (ldns_rr_get_type(rr) != LDNS_RR_TYPE_TXT) {
            continue;
        }
        auto [cert, cert_err] = txt_to_cert_info(*rr);
        if (cert_err) {
            warnlog(server_info_log(), "[{}] {}", m_provider_name, *cert_err);
            continue;
        }
        if (cert.serial < best.serial) {
            dbglog(server_info_log(), "[{}] Superseded by a previous certificate", m_provider_name);
            continue;
        }
        if (cert.serial == best.serial) {
            if (cert.encryption_algorithm <= best.encryption_algorithm) {
                dbglog(server_info_log(), "[{}] Keeping the previous, preferred crypto construction",
                        m_provider_name);
                continue;
            }
            dbglog(server_info_log(), "[{}] Upgrading the construction from {} to {}", m_provider_name,
                    magic_enum::enum_name(best.encryption_algorithm),
                    magic_enum::enum_name(cert.encryption_algorithm));
        }
        best = cert;
    }
    if (best.encryption_algorithm == crypto_construction::UNDEFINED) {
        return make_error("No usable certificate found");
    }
    return {best, rtt, std::nullopt};
}

server_info::encrypt_result server_info::encrypt(utils::transport_protocol protocol, uint8_view packet) const {
    static constexpr utils::make_error<encrypt_result> make_error;

    uint8_vector client_nonce(HALF_NONCE_SIZE);
    randombytes_buf(client_nonce.data(), client_nonce.size());
    nonce_array nonce{};
    std::copy(client_nonce.begin(), client_nonce.end(), nonce.begin());

    size_t min_question_size = QUERY_OVERHEAD + packet.size();
    if (protocol == utils::TP_TCP) {
        uint8_t xpad = 0;
        randombytes_buf(&xpad, sizeof(xpad));
        min_question_size += xpad;
    } else {
        min_question_size = std::max(MIN_UDP_QUESTION_SIZE, min_question_size);
    }
    size_t padded_length = std::min(MAX_DNS_UDP_SAFE_PACKET_SIZE, (min_question_size + 63) & ~size_t(63));
    if (QUERY_OVERHEAD + packet.size() + 1 > padded_length) {
        return make_error("Question too large; cannot be padded");
    }

    uint8_vector plain(packet.begin(), packet.end());
    if (!pad(plain, padded_length - QUERY_OVERHEAD)) {
        return make_error("Failed to pad the question");
    }
    auto [sealed, seal_err] = cipher_seal(m_server_cert.encryption_algorithm,
            uint8_view{plain.data(), plain.size()}, nonce, m_server_cert.shared_key);
    if (seal_err) {
        return make_error(std::move(seal_err));
    }
    auto ciphertext = utils::join<uint8_vector>(m_server_cert.magic_query, m_public_key, client_nonce, sealed);
    return {std::move(ciphertext), std::move(client_nonce), std::nullopt};
}

server_info::decrypt_result server_info::decrypt(uint8_view encrypted, uint8_view nonce) const {
    static constexpr utils::make_error<decrypt_result> make_error;
    constexpr size_t response_header_len = std::size(SERVER_MAGIC) + NONCE_SIZE;
    if (encrypted.size() < response_header_len + TAG_SIZE + MIN_DNS_PACKET_SIZE
            || encrypted.size() > response_header_len + TAG_SIZE + MAX_DNS_PACKET_SIZE
            || !std::equal(std::begin(SERVER_MAGIC), std::end(SERVER_MAGIC), encrypted.begin())) {
        return make_error("Invalid message size or prefix");
    }
    if (nonce.size() < HALF_NONCE_SIZE) {
        return make_error("Invalid client nonce");
    }
    auto server_nonce = utils::to_array<NONCE_SIZE>(encrypted.data() + std::size(SERVER_MAGIC));
    if (!std::equal(nonce.begin(), nonce.begin() + HALF_NONCE_SIZE, server_nonce.begin())) {
        return make_error("Unexpected nonce");
    }
    encrypted.remove_prefix(response_header_len);
    auto [packet, open_err] = cipher_open(m_server_cert.encryption_algorithm, encrypted, server_nonce,
            m_server_cert.shared_key);
    if (open_err) {
        return make_error(std::move(open_err));
    }
    if (!unpad(packet) || packet.size() < MIN_DNS_PACKET_SIZE) {
        return make_error("Incorrect padding");
    }
    return {std::move(packet), std::nullopt};
}

server_info::txt_to_cert_info_result server_info::txt_to_cert_info(const ldns_rr &answer_rr) const {
    static constexpr utils::make_error<txt_to_cert_info_result> make_error;

    uint8_vector bin_cert;
    for (size_t i = 0; i < ldns_rr_rd_count(&answer_rr); ++i) {
        const ldns_rdf *rdf = ldns_rr_rdf(&answer_rr, i);
        // Character strings carry their length in the first byte
        if (ldns_rdf_get_type(rdf) == LDNS_RDF_TYPE_STR && ldns_rdf_size(rdf) > 1) {
            bin_cert.insert(bin_cert.end(), ldns_rdf_data(rdf) + 1, ldns_rdf_data(rdf) + ldns_rdf_size(rdf));
        }
    }

    if (bin_cert.size() < MIN_CERT_SIZE) {
        return make_error("Certificate too short");
    }
    if (!std::equal(std::begin(CERT_MAGIC), std::end(CERT_MAGIC), bin_cert.begin())) {
        return make_error("Invalid cert magic");
    }

    cert_info cert{};
    auto es_version = crypto_construction((bin_cert[ES_VERSION_OFFSET] << 8) | bin_cert[ES_VERSION_OFFSET + 1]);
    switch (es_version) {
    case crypto_construction::X_SALSA_20_POLY_1305:
    case crypto_construction::X_CHACHA_20_POLY_1305:
        cert.encryption_algorithm = es_version;
        break;
    case crypto_construction::UNDEFINED:
    default:
        return make_error(DG_FMT("Unsupported crypto construction: {}", uint16_t(es_version)));
    }

    const uint8_t *signature = &bin_cert[SIGNATURE_OFFSET];
    const uint8_t *signed_part = &bin_cert[RESOLVER_PK_OFFSET];
    size_t signed_len = bin_cert.size() - RESOLVER_PK_OFFSET;
    if (0 != crypto_sign_verify_detached(signature, signed_part, signed_len, m_server_public_key.data())) {
        return make_error("Incorrect signature");
    }

    cert.serial = read_be32(bin_cert, SERIAL_OFFSET);
    cert.not_before = read_be32(bin_cert, TS_START_OFFSET);
    cert.not_after = read_be32(bin_cert, TS_END_OFFSET);
    auto now = duration_cast<seconds>(dg::system_clock::now().time_since_epoch()).count();
    if (now < cert.not_before) {
        return make_error(DG_FMT("Certificate not valid before {}", format_epoch(cert.not_before)));
    }
    if (now > cert.not_after) {
        return make_error(DG_FMT("Certificate expired at {}", format_epoch(cert.not_after)));
    }

    cert.server_pk = utils::to_array<KEY_SIZE>(&bin_cert[RESOLVER_PK_OFFSET]);
    auto [shared_key, key_err] = cipher_shared_key(cert.encryption_algorithm, m_secret_key, cert.server_pk);
    if (key_err) {
        return make_error(std::move(key_err));
    }
    cert.shared_key = shared_key;
    cert.magic_query = utils::to_array<CLIENT_MAGIC_LEN>(&bin_cert[CLIENT_MAGIC_OFFSET]);
    return {cert, std::nullopt};
}

} // namespace dg::dnscrypt
