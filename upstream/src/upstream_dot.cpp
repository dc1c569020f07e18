#include <openssl/err.h>
#include <dg_utils.h>
#include "upstream_dot.h"

#define tracelog_id(l_, pkt_, fmt_, ...) tracelog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)

using std::chrono::milliseconds;
using std::chrono::duration_cast;

// https://www.iana.org/assignments/tls-extensiontype-values/tls-extensiontype-values.xml#alpn-protocol-ids
static const std::string DOT_ALPN = "dot";
static constexpr size_t MAX_IDLE_CONNECTIONS = 8;

/**
 * Pool of established TLS connections to the server
 */
class dg::dns_over_tls::tls_pool {
public:
    struct connection {
        std::unique_ptr<blocking_socket> socket;
        /** False if the connection was just made */
        bool reused;
    };

    struct get_result {
        connection conn;
        milliseconds time_elapsed;
        err_string error;
    };

    tls_pool(dns_over_tls *upstream, bootstrapper_ptr bootstrapper)
            : m_upstream(upstream)
            , m_bootstrapper(std::move(bootstrapper)) {
    }

    /** Take an idle connection or make a new one */
    get_result get(milliseconds timeout) {
        {
            std::scoped_lock l(m_idle.mtx);
            if (!m_idle.val.empty()) {
                std::unique_ptr<blocking_socket> socket = std::move(m_idle.val.back());
                m_idle.val.pop_back();
                return {{std::move(socket), true}, milliseconds(0), std::nullopt};
            }
        }
        return create(timeout);
    }

    /** Return a healthy connection back */
    void put(std::unique_ptr<blocking_socket> socket) {
        std::scoped_lock l(m_idle.mtx);
        if (m_idle.val.size() < MAX_IDLE_CONNECTIONS) {
            m_idle.val.emplace_back(std::move(socket));
        }
    }

    /** Forget a failed connection and the address it was made to */
    void discard(std::unique_ptr<blocking_socket> socket) {
        m_bootstrapper->remove_resolved(socket->peer());
    }

private:
    get_result create(milliseconds timeout) {
        static constexpr utils::make_error<get_result> make_error;
        bootstrapper::resolve_result resolved = m_bootstrapper->get();
        if (resolved.error.has_value()) {
            return make_error(std::move(resolved.error), connection{}, resolved.time_elapsed);
        }
        timeout -= resolved.time_elapsed;
        if (timeout.count() <= 0) {
            return make_error(DG_FMT("DNS server name resolving took too much time: {}", resolved.time_elapsed),
                    connection{}, resolved.time_elapsed);
        }

        const socket_address &address = resolved.addresses[0];
        auto socket = std::make_unique<blocking_socket>(utils::TP_TCP);
        blocking_socket::tls_parameters tls{m_upstream->m_ssl_ctx.get(), m_upstream->m_server_name, {DOT_ALPN},
                &m_upstream->m_tls_session_cache};
        if (auto e = socket->connect(address, timeout, std::move(tls)); e.has_value()) {
            m_bootstrapper->remove_resolved(address);
            return make_error((e->code == utils::DG_ETIMEDOUT) ? std::string(utils::TIMEOUT_STR)
                                                                : std::move(e->description),
                    connection{}, resolved.time_elapsed);
        }
        return {{std::move(socket), false}, resolved.time_elapsed, std::nullopt};
    }

    dns_over_tls *m_upstream;
    bootstrapper_ptr m_bootstrapper;
    with_mtx<std::list<std::unique_ptr<blocking_socket>>> m_idle;
};

static std::string_view strip_dot_url(std::string_view url) {
    url.remove_prefix(dg::dns_over_tls::SCHEME.length());
    return url.substr(0, url.find('/'));
}

static std::string get_host_name(std::string_view url) {
    std::string_view host = dg::utils::split_host_port(strip_dot_url(url)).first;
    dg::utils::trim(host);
    return std::string(host);
}

static dg::bootstrapper_ptr create_bootstrapper(const dg::upstream_options &opts,
        const dg::upstream_factory_config &config) {
    auto [host, port_str] = dg::utils::split_host_port(strip_dot_url(opts.address));
    int port = port_str.empty() ? 0 : std::strtol(std::string(port_str).c_str(), nullptr, 10);
    if (port == 0) {
        port = dg::dns_over_tls::DEFAULT_PORT;
    }

    std::string address(host);
    if (const auto *ipv4 = std::get_if<dg::ipv4_address_array>(&opts.resolved_server_ip)) {
        address = dg::socket_address({ipv4->data(), ipv4->size()}, port).str();
    } else if (const auto *ipv6 = std::get_if<dg::ipv6_address_array>(&opts.resolved_server_ip)) {
        address = dg::socket_address({ipv6->data(), ipv6->size()}, port).str();
    }
    return std::make_unique<dg::bootstrapper>(
            dg::bootstrapper::params{address, port, opts.bootstrap, opts.timeout, config});
}

dg::dns_over_tls::dns_over_tls(const upstream_options &opts, const upstream_factory_config &config)
        : upstream(opts, config)
        , m_log(create_logger(DG_FMT("DoT upstream ({})", opts.address)))
        , m_server_name(get_host_name(opts.address))
        , m_tls_session_cache(opts.address) {
}

dg::dns_over_tls::~dns_over_tls() = default;

dg::err_string dg::dns_over_tls::init() {
    if (m_server_name.empty()
            || (m_options.bootstrap.empty() && std::holds_alternative<std::monostate>(m_options.resolved_server_ip)
                    && !socket_address(m_server_name, 0).valid())) {
        std::string err = "At least one the following should be true: server address is specified, "
                          "url contains valid server address as a host name, bootstrap server is specified";
        errlog(m_log, "{}", err);
        return err;
    }

    m_ssl_ctx.reset(SSL_CTX_new(TLS_client_method()));
    if (m_ssl_ctx == nullptr) {
        return DG_FMT("Failed to create SSL context: {}", ERR_error_string(ERR_get_error(), nullptr));
    }
    SSL_CTX_set_verify(m_ssl_ctx.get(), SSL_VERIFY_PEER, nullptr);
    if (1 != SSL_CTX_set_default_verify_paths(m_ssl_ctx.get())) {
        warnlog(m_log, "Failed to load the default CA certificates");
    }
    tls_session_cache::prepare_ssl_ctx(m_ssl_ctx.get());
    return std::nullopt;
}

dg::dns_over_tls::tls_pool *dg::dns_over_tls::get_pool(err_string &error) {
    {
        std::shared_lock l(m_pool_guard);
        if (m_pool != nullptr) {
            return m_pool.get();
        }
    }
    std::unique_lock l(m_pool_guard);
    if (m_pool == nullptr) {
        bootstrapper_ptr bootstrapper = create_bootstrapper(m_options, m_config);
        if (err_string err = bootstrapper->init(); err.has_value()) {
            error = DG_FMT("Failed to create bootstrapper: {}", *err);
            errlog(m_log, "{}", *error);
            return nullptr;
        }
        m_pool = std::make_unique<tls_pool>(this, std::move(bootstrapper));
    }
    return m_pool.get();
}

dg::dns_over_tls::exchange_result dg::dns_over_tls::exchange(ldns_pkt *request_pkt, const dns_message_info *) {
    ldns_buffer_ptr buffer{ldns_buffer_new(REQUEST_BUFFER_INITIAL_CAPACITY)};
    if (ldns_status status = ldns_pkt2buffer_wire(buffer.get(), request_pkt); status != LDNS_STATUS_OK) {
        return {nullptr, ldns_get_errorstr_by_id(status)};
    }
    uint8_view request{ldns_buffer_begin(buffer.get()), ldns_buffer_position(buffer.get())};

    err_string pool_err;
    tls_pool *pool = get_pool(pool_err);
    if (pool == nullptr) {
        return {nullptr, std::move(pool_err)};
    }

    utils::timer timer;
    milliseconds timeout = m_options.timeout;
    err_string error;
    // A pooled connection may have been closed by the server while idle, so one fresh retry is allowed
    for (int attempt = 0; attempt < 2; ++attempt) {
        std::shared_lock l(m_pool_guard);
        milliseconds remaining = timeout - timer.elapsed<milliseconds>();
        if (remaining.count() <= 0) {
            return {nullptr, std::string(utils::TIMEOUT_STR)};
        }
        auto [conn, elapsed, get_err] = pool->get(remaining);
        if (get_err.has_value()) {
            return {nullptr, std::move(get_err)};
        }
        remaining = timeout - timer.elapsed<milliseconds>();

        tracelog_id(m_log, request_pkt, "Sending request over {} connection", conn.reused ? "pooled" : "new");
        std::optional<blocking_socket::error> e = conn.socket->send_dns_packet(request, remaining);
        blocking_socket::receive_dns_packet_result r;
        if (!e.has_value()) {
            r = conn.socket->receive_dns_packet(timeout - timer.elapsed<milliseconds>());
            if (auto *re = std::get_if<blocking_socket::error>(&r)) {
                e = std::move(*re);
            }
        }
        if (e.has_value()) {
            bool timed_out = e->code == utils::DG_ETIMEDOUT;
            dbglog(m_log, "Dropping connection to {}: {}", conn.socket->peer().str(), e->description);
            pool->discard(std::move(conn.socket));
            error = timed_out ? std::string(utils::TIMEOUT_STR) : std::move(e->description);
            if (conn.reused && !timed_out) {
                continue;
            }
            return {nullptr, std::move(error)};
        }

        auto &reply = std::get<uint8_vector>(r);
        ldns_pkt *reply_pkt = nullptr;
        ldns_status status = ldns_wire2pkt(&reply_pkt, reply.data(), reply.size());
        if (status != LDNS_STATUS_OK) {
            pool->discard(std::move(conn.socket));
            return {nullptr, ldns_get_errorstr_by_id(status)};
        }
        pool->put(std::move(conn.socket));
        return {ldns_pkt_ptr(reply_pkt), std::nullopt};
    }
    return {nullptr, std::move(error)};
}
