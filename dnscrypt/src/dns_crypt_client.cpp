#include <sodium.h>
#include <dg_utils.h>
#include <dns_crypt_client.h>
#include <dns_crypt_ldns.h>

using namespace std::chrono;

namespace dg::dnscrypt {

client::client(utils::transport_protocol protocol)
        : m_protocol(protocol) {
}

client::dial_result client::dial(std::string_view stamp_str, milliseconds timeout) const {
    static constexpr utils::make_error<dial_result> make_error;
    auto [stamp, stamp_err] = server_stamp::from_string(stamp_str);
    if (stamp_err) {
        return make_error(DG_FMT("Failed to parse stamp: {}", *stamp_err));
    }
    if (stamp.proto != stamp_proto_type::DNSCRYPT) {
        return make_error("Stamp is not for a DNSCrypt server");
    }
    return dial(stamp, timeout);
}

client::dial_result client::dial(const server_stamp &stamp, milliseconds timeout) const {
    static constexpr utils::make_error<dial_result> make_error;
    if (sodium_init() < 0) {
        return make_error("Failed to initialize libsodium");
    }

    server_info info;
    if (0 != crypto_box_keypair(info.m_public_key.data(), info.m_secret_key.data())) {
        return make_error("Failed to generate a key pair");
    }
    info.m_server_public_key = stamp.server_pk;
    info.m_server_address = stamp.server_addr_str;
    if (socket_address addr = utils::str_to_socket_address(info.m_server_address); addr.port() == 0) {
        info.m_server_address = utils::join_host_port(addr.host_str(), std::to_string(DEFAULT_DNSCRYPT_PORT));
    }
    info.m_provider_name = stamp.provider_name;
    if (info.m_provider_name.empty()) {
        return make_error("Provider name is empty");
    }
    if (info.m_provider_name.back() != '.') {
        info.m_provider_name.push_back('.');
    }

    auto [cert, rtt, fetch_err] = info.fetch_current_dnscrypt_cert(m_protocol, timeout);
    if (fetch_err) {
        return make_error(DG_FMT("Failed to fetch certificate info from {}: {}",
                info.m_server_address, *fetch_err));
    }
    info.m_server_cert = cert;
    return {std::move(info), rtt, std::nullopt};
}

client::exchange_result client::exchange(const ldns_pkt &message, const server_info &info,
        milliseconds timeout) const {
    static constexpr utils::make_error<exchange_result> make_error;
    utils::timer timer;

    auto [query, query_err] = create_ldns_buffer(message);
    if (query_err) {
        return make_error(std::move(query_err));
    }
    auto [encrypted, client_nonce, encrypt_err] = info.encrypt(m_protocol,
            {ldns_buffer_begin(query.get()), ldns_buffer_position(query.get())});
    if (encrypt_err) {
        return make_error(DG_FMT("Failed to encrypt the query: {}", *encrypt_err));
    }

    auto [encrypted_reply, rtt, exchange_err] = dns_exchange(timeout,
            utils::str_to_socket_address(info.m_server_address), {encrypted.data(), encrypted.size()}, m_protocol);
    if (exchange_err) {
        return make_error(std::move(exchange_err));
    }

    auto [reply, decrypt_err] = info.decrypt({encrypted_reply.data(), encrypted_reply.size()},
            {client_nonce.data(), client_nonce.size()});
    if (decrypt_err) {
        return make_error(DG_FMT("Failed to decrypt the reply: {}", *decrypt_err));
    }
    auto [reply_pkt, parse_err] = create_ldns_pkt({reply.data(), reply.size()});
    if (parse_err) {
        return make_error(std::move(parse_err));
    }
    return {std::move(reply_pkt), timer.elapsed<milliseconds>(), std::nullopt};
}

} // namespace dg::dnscrypt
