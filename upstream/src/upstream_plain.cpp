#include <dg_blocking_socket.h>
#include <dg_utils.h>
#include "upstream_plain.h"

#define tracelog_id(l_, pkt_, fmt_, ...) tracelog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)

using std::chrono::milliseconds;

static dg::socket_address prepare_address(std::string_view address_string) {
    auto address = dg::utils::str_to_socket_address(address_string);
    if (address.port() == 0) {
        return dg::socket_address(address.addr(), dg::plain_dns::DEFAULT_PORT);
    }
    return address;
}

static std::string socket_error_to_string(dg::blocking_socket::error &&e) {
    // A timeout is not retried by the caller
    return (e.code == dg::utils::DG_ETIMEDOUT) ? std::string(dg::utils::TIMEOUT_STR) : std::move(e.description);
}

dg::plain_dns::plain_dns(const upstream_options &opts, const upstream_factory_config &config)
        : upstream(opts, config)
        , m_log(create_logger(DG_FMT("Plain upstream ({})", opts.address)))
        , m_prefer_tcp(utils::starts_with(opts.address, TCP_SCHEME))
        , m_address(prepare_address(m_prefer_tcp
                ? std::string_view(opts.address).substr(TCP_SCHEME.length())
                : std::string_view(opts.address))) {
}

std::string dg::plain_dns::annotate(std::string &&error) const {
    if (error == utils::TIMEOUT_STR) {
        return std::move(error);
    }
    return DG_FMT("{} ({})", error, m_options.address);
}

dg::err_string dg::plain_dns::init() {
    if (!m_address.valid()) {
        return DG_FMT("Passed server address is not valid: {}", m_options.address);
    }
    return std::nullopt;
}

dg::plain_dns::exchange_result dg::plain_dns::exchange_over(utils::transport_protocol protocol,
        uint8_view request, milliseconds timeout) {
    utils::timer timer;
    blocking_socket socket(protocol);
    if (auto e = socket.connect(m_address, timeout); e.has_value()) {
        return {nullptr, socket_error_to_string(std::move(*e))};
    }
    if (auto e = socket.send_dns_packet(request, timeout - timer.elapsed<milliseconds>()); e.has_value()) {
        return {nullptr, socket_error_to_string(std::move(*e))};
    }
    auto r = socket.receive_dns_packet(timeout - timer.elapsed<milliseconds>());
    if (auto *e = std::get_if<blocking_socket::error>(&r); e != nullptr) {
        return {nullptr, socket_error_to_string(std::move(*e))};
    }

    auto &reply = std::get<uint8_vector>(r);
    ldns_pkt *reply_pkt = nullptr;
    if (ldns_status status = ldns_wire2pkt(&reply_pkt, reply.data(), reply.size()); status != LDNS_STATUS_OK) {
        return {nullptr, ldns_get_errorstr_by_id(status)};
    }
    return {ldns_pkt_ptr(reply_pkt), std::nullopt};
}

dg::plain_dns::exchange_result dg::plain_dns::exchange(ldns_pkt *request_pkt, const dns_message_info *info) {
    ldns_buffer_ptr buffer{ldns_buffer_new(REQUEST_BUFFER_INITIAL_CAPACITY)};
    if (ldns_status status = ldns_pkt2buffer_wire(buffer.get(), request_pkt); status != LDNS_STATUS_OK) {
        return {nullptr, ldns_get_errorstr_by_id(status)};
    }
    uint8_view request{ldns_buffer_begin(buffer.get()), ldns_buffer_position(buffer.get())};

    utils::timer timer;
    milliseconds timeout = m_options.timeout;

    if (!m_prefer_tcp && !(info != nullptr && info->proto == utils::TP_TCP)) {
        tracelog_id(m_log, request_pkt, "Sending UDP request");
        auto [reply, err] = exchange_over(utils::TP_UDP, request, timeout);
        if (err.has_value()) {
            return {nullptr, annotate(std::move(*err))};
        }
        // If not truncated, return result. Otherwise, try TCP.
        if (!ldns_pkt_tc(reply.get())) {
            return {std::move(reply), std::nullopt};
        }
        tracelog_id(m_log, request_pkt, "Truncated reply, retrying over TCP");
    }

    timeout -= timer.elapsed<milliseconds>();
    if (timeout.count() <= 0) {
        return {nullptr, std::string(utils::TIMEOUT_STR)};
    }

    tracelog_id(m_log, request_pkt, "Sending TCP request");
    auto [reply, err] = exchange_over(utils::TP_TCP, request, timeout);
    if (err.has_value()) {
        return {nullptr, annotate(std::move(*err))};
    }
    return {std::move(reply), std::nullopt};
}
