#include <dg_blocking_socket.h>
#include <dg_utils.h>
#include <dns_crypt_ldns.h>

using namespace std::chrono;

namespace dg::dnscrypt {

ldns_pkt_ptr create_request_ldns_pkt(ldns_rr_type rr_type, ldns_rr_class rr_class, uint16_t flags,
        std::string_view dname_str, std::optional<size_t> size_opt) {
    ldns_rdf *dname = ldns_dname_new_frm_str(std::string(dname_str).c_str());
    if (dname == nullptr) {
        return nullptr;
    }
    ldns_pkt_ptr pkt(ldns_pkt_query_new(dname, rr_type, rr_class, flags));
    if (pkt == nullptr) {
        ldns_rdf_deep_free(dname);
        return nullptr;
    }
    if (size_opt.has_value()) {
        ldns_pkt_set_edns_udp_size(pkt.get(), *size_opt);
    }
    return pkt;
}

create_ldns_buffer_result create_ldns_buffer(const ldns_pkt &request_pkt) {
    ldns_buffer_ptr buffer(ldns_buffer_new(REQUEST_BUFFER_INITIAL_CAPACITY));
    if (ldns_status status = ldns_pkt2buffer_wire(buffer.get(), &request_pkt); status != LDNS_STATUS_OK) {
        return {nullptr, DG_FMT("Failed to serialize packet: {}", ldns_get_errorstr_by_id(status))};
    }
    return {std::move(buffer), std::nullopt};
}

create_ldns_pkt_result create_ldns_pkt(uint8_view data) {
    ldns_pkt *pkt = nullptr;
    ldns_status status = ldns_wire2pkt(&pkt, data.data(), data.size());
    ldns_pkt_ptr result(pkt);
    if (status != LDNS_STATUS_OK) {
        return {nullptr, DG_FMT("Failed to parse packet: {}", ldns_get_errorstr_by_id(status))};
    }
    return {std::move(result), std::nullopt};
}

static err_string socket_error_to_string(const blocking_socket::error &e) {
    if (e.code == utils::DG_ETIMEDOUT) {
        return std::string(utils::TIMEOUT_STR);
    }
    return e.description;
}

dns_exchange_unparsed_result dns_exchange(milliseconds timeout, const socket_address &address,
        uint8_view request, utils::transport_protocol protocol) {
    static constexpr utils::make_error<dns_exchange_unparsed_result> make_error;
    utils::timer timer;

    blocking_socket socket(protocol);
    if (auto e = socket.connect(address, timeout)) {
        return make_error(socket_error_to_string(*e));
    }
    if (auto e = socket.send_dns_packet(request, timeout - timer.elapsed<milliseconds>())) {
        return make_error(socket_error_to_string(*e));
    }
    auto r = socket.receive_dns_packet(timeout - timer.elapsed<milliseconds>());
    if (auto *e = std::get_if<blocking_socket::error>(&r)) {
        return make_error(socket_error_to_string(*e));
    }
    return {std::get<uint8_vector>(std::move(r)), timer.elapsed<milliseconds>(), std::nullopt};
}

dns_exchange_result dns_exchange_from_ldns_pkt(milliseconds timeout, const socket_address &address,
        const ldns_pkt &request_pkt, utils::transport_protocol protocol) {
    static constexpr utils::make_error<dns_exchange_result> make_error;
    auto [buffer, buffer_err] = create_ldns_buffer(request_pkt);
    if (buffer_err) {
        return make_error(std::move(buffer_err));
    }
    auto [reply, rtt, exchange_err] = dns_exchange(timeout, address,
            {ldns_buffer_begin(buffer.get()), ldns_buffer_position(buffer.get())}, protocol);
    if (exchange_err) {
        return make_error(std::move(exchange_err));
    }
    auto [reply_pkt, reply_err] = create_ldns_pkt({reply.data(), reply.size()});
    if (reply_err) {
        return make_error(std::move(reply_err));
    }
    if (ldns_pkt_tc(reply_pkt.get())) {
        return make_error("Truncated response");
    }
    return {std::move(reply_pkt), rtt, std::nullopt};
}

} // namespace dg::dnscrypt
