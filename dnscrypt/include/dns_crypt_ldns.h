#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <ldns/ldns.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include <dg_net_utils.h>
#include <dg_socket_address.h>

namespace dg::dnscrypt {

using create_ldns_buffer_result = std::pair<ldns_buffer_ptr, err_string>;
using create_ldns_pkt_result = std::pair<ldns_pkt_ptr, err_string>;

struct dns_exchange_unparsed_result {
    uint8_vector reply;
    std::chrono::milliseconds round_trip_time;
    err_string error;
};

struct dns_exchange_result {
    ldns_pkt_ptr reply;
    std::chrono::milliseconds round_trip_time;
    err_string error;
};

/**
 * Create a query packet
 * @param size_opt EDNS0 UDP payload size to advertise, if any
 * @return the packet, or nullptr if the name is invalid
 */
ldns_pkt_ptr create_request_ldns_pkt(ldns_rr_type rr_type, ldns_rr_class rr_class, uint16_t flags,
        std::string_view dname_str, std::optional<size_t> size_opt);

/**
 * Serialize a packet in the wire format
 */
create_ldns_buffer_result create_ldns_buffer(const ldns_pkt &request_pkt);

/**
 * Parse a wire format packet
 */
create_ldns_pkt_result create_ldns_pkt(uint8_view data);

/**
 * Send a raw DNS message and wait for a single reply.
 * A new connection is made for every call.
 * @return the reply, or an error. A timeout is reported as `utils::TIMEOUT_STR`.
 */
dns_exchange_unparsed_result dns_exchange(std::chrono::milliseconds timeout, const socket_address &address,
        uint8_view request, utils::transport_protocol protocol);

/**
 * Same as `dns_exchange` but works with parsed packets. A truncated reply is an error.
 */
dns_exchange_result dns_exchange_from_ldns_pkt(std::chrono::milliseconds timeout, const socket_address &address,
        const ldns_pkt &request_pkt, utils::transport_protocol protocol);

} // namespace dg::dnscrypt
