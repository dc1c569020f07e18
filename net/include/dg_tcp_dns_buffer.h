#pragma once

#include <optional>
#include <vector>
#include <dg_defs.h>

namespace dg {

/**
 * Reassembles length-prefixed DNS messages received over a stream transport
 */
class tcp_dns_buffer {
public:
    tcp_dns_buffer() = default;

    /**
     * Store a chunk of data
     * @param data the data chunk
     * @return a part of the chunk remaining after the DNS packet
     */
    uint8_view store(uint8_view data);

    /**
     * Try to extract a packet from the buffer
     * @return some packet if it's complete
     */
    std::optional<uint8_vector> extract_packet();

private:
    std::optional<size_t> m_total_length;
    uint8_vector m_buffer;
};

} // namespace dg
