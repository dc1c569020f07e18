#pragma once

#include <memory>
#include <ldns/ldns.h>
#include <dg_defs.h>
#include <dg_net_utils.h>

namespace dg {

using ldns_pkt_ptr = std::unique_ptr<ldns_pkt, ftor<&ldns_pkt_free>>;
using ldns_buffer_ptr = std::unique_ptr<ldns_buffer, ftor<&ldns_buffer_free>>;
using ldns_rr_ptr = std::unique_ptr<ldns_rr, ftor<&ldns_rr_free>>;
using ldns_rdf_ptr = std::unique_ptr<ldns_rdf, ftor<&ldns_rdf_deep_free>>;

static constexpr size_t REQUEST_BUFFER_INITIAL_CAPACITY = 64;

/** Receive buffer size for UDP exchanges, also advertised in the EDNS0 record set by the proxy */
static constexpr size_t UDP_RECV_BUF_SIZE = 4096;

/** Additional info about the DNS message */
struct dns_message_info {
    /** Transport protocol over which the message was received */
    utils::transport_protocol proto;
    /** Socket address of the peer from which the message was received */
    socket_address peername;
};

} // namespace dg
