#include <atomic>
#include <cerrno>
#include <cstring>
#include <numeric>
#include <sys/socket.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <dg_blocking_socket.h>
#include <dg_tcp_dns_buffer.h>
#include <dg_utils.h>

#define log_sock(s_, lvl_, fmt_, ...) lvl_##log((s_)->m_log, "[id={}] {}(): " fmt_, (s_)->m_id, __func__, ##__VA_ARGS__)

using namespace std::chrono;

static constexpr std::string_view UNEXPECTED_EOF = "Unexpected EOF";
static constexpr size_t MAX_DNS_MESSAGE_SIZE = 65535;

static std::atomic_size_t next_id = {0};

static dg::uint8_vector make_alpn(const std::vector<std::string> &protos) {
    dg::uint8_vector alpn;
    alpn.reserve(std::accumulate(protos.begin(), protos.end(), protos.size(),
            [] (size_t acc, const std::string &p) { return acc + p.length(); }));
    for (const std::string &p : protos) {
        alpn.push_back(p.length());
        alpn.insert(alpn.end(), p.begin(), p.end());
    }
    return alpn;
}

static std::string ssl_error_string() {
    unsigned long e = ERR_get_error();
    if (e == 0) {
        return "Unknown TLS error";
    }
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    return buf;
}

dg::blocking_socket::blocking_socket(utils::transport_protocol protocol)
        : m_log(create_logger("blocking_socket"))
        , m_id(next_id.fetch_add(1, std::memory_order_relaxed))
        , m_protocol(protocol)
        , m_base(event_base_new()) {
}

dg::blocking_socket::~blocking_socket() {
    m_ssl.reset();
    if (m_fd != -1) {
        evutil_closesocket(m_fd);
    }
}

dg::blocking_socket::error dg::blocking_socket::make_socket_error(int code) const {
    return {code, DG_FMT("{} ({})", evutil_socket_error_to_string(code), code)};
}

std::optional<dg::blocking_socket::error> dg::blocking_socket::wait(short what, deadline until) {
    auto timeout = duration_cast<microseconds>(until - steady_clock::now());
    if (timeout.count() <= 0) {
        return error{utils::DG_ETIMEDOUT, "Timed out"};
    }

    short fired = 0;
    timeval tv = utils::duration_to_timeval(timeout);
    if (0 != event_base_once(m_base.get(), m_fd, what,
            [] (evutil_socket_t, short ev, void *arg) { *(short *) arg = ev; }, &fired, &tv)) {
        return error{-1, "Failed to schedule socket event"};
    }
    event_base_dispatch(m_base.get());

    if (fired & EV_TIMEOUT) {
        log_sock(this, trace, "timed out");
        return error{utils::DG_ETIMEDOUT, "Timed out"};
    }
    return std::nullopt;
}

std::optional<dg::blocking_socket::error> dg::blocking_socket::connect(const socket_address &peer,
        milliseconds timeout, std::optional<tls_parameters> tls) {
    log_sock(this, trace, "{}", peer.str());
    deadline until = steady_clock::now() + timeout;

    if (m_base == nullptr) {
        return error{-1, "Failed to create event base"};
    }
    if (!peer.valid()) {
        return error{-1, DG_FMT("Invalid peer address: {}", peer.str())};
    }
    m_peer = peer;

    int type = (m_protocol == utils::TP_UDP) ? SOCK_DGRAM : SOCK_STREAM;
    m_fd = ::socket(peer.c_sockaddr()->sa_family, type, 0);
    if (m_fd == -1) {
        return make_socket_error(evutil_socket_geterror(m_fd));
    }
    if (0 != evutil_make_socket_nonblocking(m_fd) || 0 != evutil_make_socket_closeonexec(m_fd)) {
        return make_socket_error(evutil_socket_geterror(m_fd));
    }

    if (0 != ::connect(m_fd, peer.c_sockaddr(), peer.c_socklen())) {
        int err = evutil_socket_geterror(m_fd);
        if (err != EINPROGRESS) {
            return make_socket_error(err);
        }
        if (auto e = wait(EV_WRITE, until); e.has_value()) {
            return e;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (0 != getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &so_error, &len)) {
            return make_socket_error(evutil_socket_geterror(m_fd));
        }
        if (so_error != 0) {
            return make_socket_error(so_error);
        }
    }

    if (tls.has_value()) {
        return handshake(tls.value(), until);
    }
    return std::nullopt;
}

std::optional<dg::blocking_socket::error> dg::blocking_socket::handshake(const tls_parameters &tls, deadline until) {
    m_ssl.reset(SSL_new(tls.ctx));
    if (m_ssl == nullptr) {
        return error{-1, ssl_error_string()};
    }
    SSL_set_fd(m_ssl.get(), m_fd);

    if (!tls.server_name.empty()) {
        if (!utils::is_valid_ip4(tls.server_name) && !utils::is_valid_ip6(tls.server_name)) {
            SSL_set_tlsext_host_name(m_ssl.get(), tls.server_name.c_str());
            SSL_set1_host(m_ssl.get(), tls.server_name.c_str());
        } else {
            X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(m_ssl.get()), tls.server_name.c_str());
        }
    }
    if (!tls.alpn.empty()) {
        uint8_vector serialized = make_alpn(tls.alpn);
        if (0 != SSL_set_alpn_protos(m_ssl.get(), serialized.data(), serialized.size())) {
            return error{-1, "Failed to set ALPN protocols"};
        }
    }
    if (tls.session_cache != nullptr) {
        tls.session_cache->prepare_ssl(m_ssl.get());
        if (ssl_session_ptr session = tls.session_cache->get_session()) {
            SSL_set_session(m_ssl.get(), session.get());
        }
    }

    SSL_set_connect_state(m_ssl.get());
    for (int ret; 1 != (ret = SSL_do_handshake(m_ssl.get()));) {
        if (auto e = wait_ssl(ret, until); e.has_value()) {
            if (long verify = SSL_get_verify_result(m_ssl.get()); verify != X509_V_OK) {
                e->description = DG_FMT("Failed to verify server certificate: {}",
                        X509_verify_cert_error_string(verify));
            }
            return e;
        }
    }
    log_sock(this, trace, "TLS handshake done, protocol {}", SSL_get_version(m_ssl.get()));
    return std::nullopt;
}

std::optional<dg::blocking_socket::error> dg::blocking_socket::wait_ssl(int ret, deadline until) {
    switch (int err = SSL_get_error(m_ssl.get(), ret)) {
    case SSL_ERROR_WANT_READ:
        return wait(EV_READ, until);
    case SSL_ERROR_WANT_WRITE:
        return wait(EV_WRITE, until);
    case SSL_ERROR_ZERO_RETURN:
        return error{-1, std::string(UNEXPECTED_EOF)};
    case SSL_ERROR_SYSCALL:
        if (errno != 0) {
            return make_socket_error(errno);
        }
        return error{-1, std::string(UNEXPECTED_EOF)};
    default:
        return error{err, ssl_error_string()};
    }
}

std::optional<dg::blocking_socket::error> dg::blocking_socket::send_all(uint8_view data, deadline until) {
    while (!data.empty()) {
        ssize_t r;
        if (m_ssl != nullptr) {
            r = SSL_write(m_ssl.get(), data.data(), (int) data.size());
            if (r <= 0) {
                if (auto e = wait_ssl((int) r, until); e.has_value()) {
                    return e;
                }
                continue;
            }
        } else {
            r = ::send(m_fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (r < 0) {
                int err = evutil_socket_geterror(m_fd);
                if (err != EAGAIN && err != EWOULDBLOCK) {
                    return make_socket_error(err);
                }
                if (auto e = wait(EV_WRITE, until); e.has_value()) {
                    return e;
                }
                continue;
            }
        }
        data.remove_prefix(r);
    }
    return std::nullopt;
}

std::variant<size_t, dg::blocking_socket::error> dg::blocking_socket::recv_some(uint8_t *buf, size_t size,
        deadline until) {
    while (true) {
        if (m_ssl != nullptr) {
            int r = SSL_read(m_ssl.get(), buf, (int) size);
            if (r > 0) {
                return (size_t) r;
            }
            if (auto e = wait_ssl(r, until); e.has_value()) {
                return e.value();
            }
            continue;
        }

        ssize_t r = ::recv(m_fd, buf, size, 0);
        if (r > 0) {
            return (size_t) r;
        }
        if (r == 0 && m_protocol == utils::TP_TCP) {
            return error{-1, std::string(UNEXPECTED_EOF)};
        }
        if (r < 0) {
            int err = evutil_socket_geterror(m_fd);
            if (err != EAGAIN && err != EWOULDBLOCK) {
                return make_socket_error(err);
            }
        }
        if (auto e = wait(EV_READ, until); e.has_value()) {
            return e.value();
        }
    }
}

std::optional<dg::blocking_socket::error> dg::blocking_socket::send_dns_packet(uint8_view data,
        milliseconds timeout) {
    log_sock(this, trace, "{}", data.size());
    deadline until = steady_clock::now() + timeout;
    if (m_fd == -1) {
        return error{-1, "Socket is not connected"};
    }

    if (m_protocol == utils::TP_UDP) {
        return send_all(data, until);
    }
    if (data.size() > MAX_DNS_MESSAGE_SIZE) {
        return error{-1, "Packet is too long"};
    }
    uint8_t length[2] = {uint8_t(data.size() >> 8), uint8_t(data.size())};
    uint8_vector packet = utils::join<uint8_vector>(uint8_view{length, 2}, data);
    return send_all({packet.data(), packet.size()}, until);
}

dg::blocking_socket::receive_dns_packet_result dg::blocking_socket::receive_dns_packet(milliseconds timeout) {
    deadline until = steady_clock::now() + timeout;
    if (m_fd == -1) {
        return error{-1, "Socket is not connected"};
    }

    uint8_vector chunk(m_protocol == utils::TP_UDP ? MAX_DNS_MESSAGE_SIZE : 4096);
    if (m_protocol == utils::TP_UDP) {
        auto r = recv_some(chunk.data(), chunk.size(), until);
        if (auto *e = std::get_if<error>(&r)) {
            return std::move(*e);
        }
        chunk.resize(std::get<size_t>(r));
        log_sock(this, trace, "received {} bytes", chunk.size());
        return chunk;
    }

    tcp_dns_buffer buffer;
    while (true) {
        auto r = recv_some(chunk.data(), chunk.size(), until);
        if (auto *e = std::get_if<error>(&r)) {
            return std::move(*e);
        }
        uint8_view rest = buffer.store({chunk.data(), std::get<size_t>(r)});
        if (auto packet = buffer.extract_packet(); packet.has_value()) {
            if (!rest.empty()) {
                log_sock(this, dbg, "dropping {} unexpected bytes after the reply", rest.size());
            }
            return std::move(packet.value());
        }
    }
}
