#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <event2/event.h>
#include <openssl/ssl.h>
#include <dg_defs.h>
#include <dg_logger.h>
#include <dg_net_utils.h>
#include <dg_socket_address.h>
#include <dg_tls_session_cache.h>

namespace dg {

/**
 * Socket performing blocking I/O on behalf of the calling thread.
 * Waiting is done on a private libevent base, so each operation is bounded by its own timeout.
 */
class blocking_socket {
public:
    struct error {
        /** System or library error code, `utils::DG_ETIMEDOUT` on timeout */
        int code;
        std::string description;
    };

    struct tls_parameters {
        /** Context the connection is created from, must outlive the socket */
        SSL_CTX *ctx;
        /** Server name for SNI and certificate hostname verification */
        std::string server_name;
        std::vector<std::string> alpn;
        /** Optional session cache for the resumption */
        tls_session_cache *session_cache = nullptr;
    };

    using receive_dns_packet_result = std::variant<
            /** A DNS packet if successful */
            uint8_vector,
            /** An error if failed */
            error>;

    explicit blocking_socket(utils::transport_protocol protocol);
    ~blocking_socket();

    blocking_socket(const blocking_socket &) = delete;
    blocking_socket &operator=(const blocking_socket &) = delete;

    /**
     * Connect to the peer. UDP sockets are just bound to the peer address.
     * @param peer the peer address
     * @param timeout operation timeout
     * @param tls non-nullopt to run TLS handshake over the TCP connection
     * @return some error if failed
     */
    [[nodiscard]] std::optional<error> connect(const socket_address &peer, std::chrono::milliseconds timeout,
            std::optional<tls_parameters> tls = std::nullopt);

    /**
     * Send DNS packet to the peer. Stream transports prefix it with the length.
     * @return some error if failed
     */
    [[nodiscard]] std::optional<error> send_dns_packet(uint8_view data, std::chrono::milliseconds timeout);

    /**
     * Receive DNS packet from the peer.
     * Blocks until either an error happened or the packet is fully received.
     */
    [[nodiscard]] receive_dns_packet_result receive_dns_packet(std::chrono::milliseconds timeout);

    utils::transport_protocol protocol() const {
        return m_protocol;
    }

    const socket_address &peer() const {
        return m_peer;
    }

private:
    logger m_log;
    size_t m_id;
    utils::transport_protocol m_protocol;
    socket_address m_peer;
    evutil_socket_t m_fd = -1;
    std::unique_ptr<event_base, ftor<&event_base_free>> m_base;
    std::unique_ptr<SSL, ftor<&SSL_free>> m_ssl;

    using deadline = std::chrono::steady_clock::time_point;

    std::optional<error> wait(short what, deadline until);
    std::optional<error> handshake(const tls_parameters &tls, deadline until);
    std::optional<error> send_all(uint8_view data, deadline until);
    std::variant<size_t, error> recv_some(uint8_t *buf, size_t size, deadline until);
    std::optional<error> wait_ssl(int ret, deadline until);
    error make_socket_error(int code) const;
};

} // namespace dg
