#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <ldns/ldns.h>
#include <dg_defs.h>
#include <dg_net_utils.h>
#include <dns_crypt_utils.h>

namespace dg::dnscrypt {

/**
 * Resolver certificate data, retrieved from the resolver with a plain TXT query
 */
struct cert_info {
    /** A cert can be superseded by another one with a higher serial */
    uint32_t serial;
    key_array server_pk;
    key_array shared_key;
    client_magic_array magic_query;
    crypto_construction encryption_algorithm;
    /** Validity period, seconds since epoch */
    uint32_t not_before;
    uint32_t not_after;
};

/**
 * Everything needed to encrypt queries to a resolver and decrypt its answers
 */
class server_info {
public:
    struct fetch_result {
        cert_info cert;
        std::chrono::milliseconds round_trip_time;
        err_string error;
    };

    struct encrypt_result {
        uint8_vector ciphertext;
        uint8_vector client_nonce;
        err_string error;
    };

    struct decrypt_result {
        uint8_vector message;
        err_string error;
    };

    /**
     * Fetch the resolver certificates and pick the best valid one
     */
    fetch_result fetch_current_dnscrypt_cert(utils::transport_protocol protocol, std::chrono::milliseconds timeout);

    /**
     * Encrypt a query. Padding depends on the transport.
     */
    encrypt_result encrypt(utils::transport_protocol protocol, uint8_view packet) const;

    /**
     * Decrypt a response
     * @param nonce the client nonce the query was encrypted with
     */
    decrypt_result decrypt(uint8_view encrypted, uint8_view nonce) const;

    const std::string &get_provider_name() const { return m_provider_name; }

    const std::string &get_server_address() const { return m_server_address; }

    const cert_info &get_server_cert() const { return m_server_cert; }

private:
    struct txt_to_cert_info_result {
        cert_info cert;
        err_string error;
    };

    txt_to_cert_info_result txt_to_cert_info(const ldns_rr &answer_rr) const;

    key_array m_secret_key{};
    key_array m_public_key{};
    /** Resolver's long-term Ed25519 key used to sign the certificates */
    uint8_vector m_server_public_key;
    std::string m_server_address;
    std::string m_provider_name;
    cert_info m_server_cert{};

    friend class client;
};

} // namespace dg::dnscrypt
