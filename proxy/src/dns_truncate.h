#pragma once

#include <cstdint>
#include <ldns/ldns.h>

namespace dg {

/**
 * Minimum response size every DNS client must accept over UDP
 */
static constexpr uint16_t DNS_MIN_UDP_PAYLOAD = 512;

/**
 * Drop the trailing RRs of `pkt` until its wire form (with name compression) fits in `max_size` bytes.
 * An RRset that does not fit entirely is dropped entirely.
 * Sizes smaller than `DNS_MIN_UDP_PAYLOAD` are raised to it.
 * If any RR is dropped, the TC flag is set.
 * @return true if the packet was truncated
 */
bool ldns_pkt_truncate(ldns_pkt *pkt, uint16_t max_size);

} // namespace dg
