#include <algorithm>
#include <utility>
#include <netinet/in.h>
#include <dg_tcp_dns_buffer.h>

static constexpr size_t PACKET_LENGTH_LENGTH = 2;
static constexpr size_t BUFFER_MIN_CAPACITY = 512;

dg::uint8_view dg::tcp_dns_buffer::store(uint8_view data) {
    while (!m_total_length.has_value()) {
        if (data.empty()) {
            return {};
        }
        m_buffer.push_back(data.front());
        data.remove_prefix(1);
        if (m_buffer.size() == PACKET_LENGTH_LENGTH) {
            m_total_length = (size_t(m_buffer[0]) << 8) | m_buffer[1];
            m_buffer.clear();
            m_buffer.reserve(std::max(m_total_length.value(), BUFFER_MIN_CAPACITY));
        }
    }

    size_t to_insert = std::min(data.size(), m_total_length.value() - m_buffer.size());
    m_buffer.insert(m_buffer.end(), data.begin(), std::next(data.begin(), (ssize_t) to_insert));
    data.remove_prefix(to_insert);
    return data;
}

std::optional<dg::uint8_vector> dg::tcp_dns_buffer::extract_packet() {
    if (!m_total_length.has_value() || m_buffer.size() < m_total_length.value()) {
        return std::nullopt;
    }
    m_total_length.reset();
    return std::exchange(m_buffer, {});
}
