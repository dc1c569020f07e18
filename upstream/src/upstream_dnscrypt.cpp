#include <mutex>
#include <dg_clock.h>
#include <dg_utils.h>
#include <dns_crypt_client.h>
#include "upstream_dnscrypt.h"

#define tracelog_id(l_, pkt_, fmt_, ...) tracelog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)

using std::chrono::milliseconds;

static bool is_expired(const dg::dnscrypt::server_info &server) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
            dg::system_clock::now().time_since_epoch()).count();
    return server.get_server_cert().not_after < now;
}

dg::upstream_dnscrypt::upstream_dnscrypt(server_stamp &&stamp, const upstream_options &opts,
        const upstream_factory_config &config)
        : upstream(opts, config)
        , m_log(create_logger(DG_FMT("DNSCrypt upstream ({})", stamp.provider_name)))
        , m_stamp(std::move(stamp)) {
}

dg::upstream_dnscrypt::~upstream_dnscrypt() = default;

dg::err_string dg::upstream_dnscrypt::init() {
    if (m_stamp.proto != stamp_proto_type::DNSCRYPT) {
        return "Stamp is not of the DNSCrypt type";
    }
    if (m_stamp.server_pk.empty() || m_stamp.provider_name.empty()) {
        return "Stamp lacks the provider name or the public key";
    }
    return std::nullopt;
}

dg::upstream_dnscrypt::setup_result dg::upstream_dnscrypt::setup_session() {
    {
        std::shared_lock l(m_guard);
        if (m_server != nullptr && !is_expired(*m_server)) {
            return {m_server, milliseconds(0), std::nullopt};
        }
    }

    std::unique_lock l(m_guard);
    // Someone may have dialed while the lock was released
    if (m_server != nullptr && !is_expired(*m_server)) {
        return {m_server, milliseconds(0), std::nullopt};
    }
    dbglog(m_log, "Fetching certificate");
    dnscrypt::client client;
    auto [server, rtt, err] = client.dial(m_stamp, m_options.timeout);
    if (err.has_value()) {
        return {nullptr, rtt,
                DG_FMT("Failed to fetch certificate info from {} with error: {}", m_stamp.server_addr_str, *err)};
    }
    m_server = std::make_shared<const dnscrypt::server_info>(std::move(server));
    return {m_server, rtt, std::nullopt};
}

void dg::upstream_dnscrypt::invalidate_session(const server_info_ptr &server) {
    std::unique_lock l(m_guard);
    if (m_server == server) {
        m_server.reset();
    }
}

dg::upstream_dnscrypt::exchange_result dg::upstream_dnscrypt::exchange(ldns_pkt *request_pkt,
        const dns_message_info *) {
    static constexpr utils::make_error<exchange_result> make_error;
    tracelog_id(m_log, request_pkt, "Started");

    auto [server, rtt, setup_err] = setup_session();
    if (setup_err.has_value()) {
        return make_error(std::move(setup_err));
    }
    if (m_options.timeout <= rtt) {
        return make_error(DG_FMT("Certificate fetch took too much time: {}ms", rtt.count()));
    }

    auto [reply, reply_err] = apply_exchange(*request_pkt, *server, m_options.timeout - rtt);
    if (reply_err.has_value()) {
        if (*reply_err == utils::TIMEOUT_STR) {
            // The resolver might have rotated its keys, the next query dials again
            dbglog(m_log, "Query timed out, dropping the session");
            invalidate_session(server);
        }
        return make_error(std::move(reply_err));
    }
    if (ldns_pkt_id(reply.get()) != ldns_pkt_id(request_pkt)) {
        return make_error("Request and reply ids are not equal");
    }
    tracelog_id(m_log, request_pkt, "Finished");
    return {std::move(reply), std::nullopt};
}

dg::upstream_dnscrypt::exchange_result dg::upstream_dnscrypt::apply_exchange(const ldns_pkt &request_pkt,
        const dnscrypt::server_info &server, milliseconds timeout) {
    utils::timer timer;
    dnscrypt::client udp_client;
    auto [udp_reply, udp_rtt, udp_err] = udp_client.exchange(request_pkt, server, timeout);
    if (udp_err.has_value() || !ldns_pkt_tc(udp_reply.get())) {
        return {std::move(udp_reply), std::move(udp_err)};
    }

    tracelog_id(m_log, &request_pkt, "Truncated message was received, retrying over TCP");
    timeout -= timer.elapsed<milliseconds>();
    if (timeout.count() <= 0) {
        return {nullptr, std::string(utils::TIMEOUT_STR)};
    }
    dnscrypt::client tcp_client(utils::TP_TCP);
    auto [tcp_reply, tcp_rtt, tcp_err] = tcp_client.exchange(request_pkt, server, timeout);
    return {std::move(tcp_reply), std::move(tcp_err)};
}
