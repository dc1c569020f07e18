#include <algorithm>
#include <iterator>
#include <dg_clock.h>
#include <dg_utils.h>
#include <dns_stamp.h>
#include "bootstrapper.h"

#define log_addr(l_, lvl_, addr_, fmt_, ...) lvl_##log(l_, "[{}] " fmt_, addr_, ##__VA_ARGS__)

using std::chrono::duration_cast;
using std::chrono::milliseconds;

static constexpr int64_t RESOLVE_TRYING_INTERVAL_MS = 7000;
static constexpr int64_t TEMPORARY_DISABLE_INTERVAL_MS = 7000;

static int64_t now_ms() {
    return duration_cast<milliseconds>(dg::steady_clock::now().time_since_epoch()).count();
}

static dg::ldns_pkt_ptr create_req(std::string_view domain_name, ldns_rr_type rr_type) {
    ldns_rdf *name = ldns_dname_new_frm_str(std::string(domain_name).c_str());
    if (name == nullptr) {
        return nullptr;
    }
    dg::ldns_pkt_ptr request(ldns_pkt_query_new(name, rr_type, LDNS_RR_CLASS_IN, LDNS_RD));
    ldns_pkt_set_random_id(request.get());
    return request;
}

static std::vector<dg::socket_address> addresses_from_reply(const ldns_pkt *reply, int port) {
    std::vector<dg::socket_address> addrs;
    const ldns_rr_list *answer = ldns_pkt_answer(reply);
    for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
        const ldns_rr *rr = ldns_rr_list_rr(answer, i);
        ldns_rr_type type = ldns_rr_get_type(rr);
        if (type != LDNS_RR_TYPE_A && type != LDNS_RR_TYPE_AAAA) {
            continue;
        }
        const ldns_rdf *rdf = ldns_rr_rdf(rr, 0);
        if (dg::socket_address addr({ldns_rdf_data(rdf), ldns_rdf_size(rdf)}, port); addr.valid()) {
            addrs.emplace_back(addr);
        }
    }
    return addrs;
}

dg::bootstrapper::resolver_result dg::bootstrapper::resolve_with(upstream &resolver, milliseconds timeout) {
    std::vector<socket_address> addrs;
    err_string error;
    utils::timer timer;

    std::vector<ldns_rr_type> types{LDNS_RR_TYPE_A};
    if (m_ipv6_available) {
        types.push_back(LDNS_RR_TYPE_AAAA);
    }
    for (ldns_rr_type type : types) {
        if (timer.elapsed<milliseconds>() + MIN_TIMEOUT > timeout) {
            break;
        }
        ldns_pkt_ptr req = create_req(m_server_name, type);
        if (req == nullptr) {
            return {{}, DG_FMT("Invalid host name: {}", m_server_name)};
        }
        auto [reply, err] = resolver.exchange(req.get());
        if (err.has_value()) {
            log_addr(m_log, dbg, m_server_name, "Failed to get {} record from {}: {}",
                    (type == LDNS_RR_TYPE_A) ? "A" : "AAAA", resolver.address(), *err);
            error = std::move(err);
            continue;
        }
        auto resolved = addresses_from_reply(reply.get(), m_server_port);
        std::move(resolved.begin(), resolved.end(), std::back_inserter(addrs));
    }

    if (!addrs.empty()) {
        error.reset();
    } else if (!error.has_value()) {
        error = "No address";
    }
    return {std::move(addrs), std::move(error)};
}

// For each resolver a half of time out is given for a try. If one fails, it's moved to the end
// of the list to give it a chance in the future.
dg::bootstrapper::resolve_result dg::bootstrapper::resolve() {
    if (socket_address addr(m_server_name, m_server_port); addr.valid()) {
        return {{addr}, m_server_name, milliseconds(0), std::nullopt};
    }

    if (m_resolvers.empty()) {
        return {{}, m_server_name, milliseconds(0), "Empty bootstrap list"};
    }

    hash_set<socket_address> addrs;
    utils::timer whole_resolve_timer;
    milliseconds timeout = m_timeout;
    err_string error;

    for (size_t tried = 0, failed = 0, curr = 0; tried < m_resolvers.size(); ++tried, curr = tried - failed) {
        utils::timer single_resolve_timer;
        milliseconds try_timeout = std::max(timeout / 2, MIN_TIMEOUT);
        resolver_result result = resolve_with(*m_resolvers[curr], try_timeout);
        if (result.error.has_value()) {
            log_addr(m_log, dbg, m_server_name, "Failed to resolve host: {}", *result.error);
            std::rotate(m_resolvers.begin() + curr, m_resolvers.begin() + curr + 1, m_resolvers.end());
            ++failed;
            if (addrs.empty()) {
                error = DG_FMT("{}{}\n", error.value_or(""), *result.error);
            }
        } else {
            std::move(result.addresses.begin(), result.addresses.end(), std::inserter(addrs, addrs.begin()));
            error.reset();
        }
        timeout -= single_resolve_timer.elapsed<milliseconds>();
        if (timeout <= MIN_TIMEOUT) {
            log_addr(m_log, dbg, m_server_name, "Stop resolving loop as timeout reached ({})", m_timeout);
            break;
        }
    }

    for (const socket_address &a : addrs) {
        log_addr(m_log, dbg, m_server_name, "Resolved address: {}", a.str());
    }

    std::vector<socket_address> addresses(addrs.begin(), addrs.end());
    if (addresses.empty() && !error.has_value()) {
        error = "Resolved addresses list is empty";
    }
    return {std::move(addresses), m_server_name, whole_resolve_timer.elapsed<milliseconds>(), std::move(error)};
}

dg::err_string dg::bootstrapper::temporary_disabler_check() {
    if (m_resolve_fail_times_ms.first != 0) {
        if (int64_t tries_timeout_ms = m_resolve_fail_times_ms.first + RESOLVE_TRYING_INTERVAL_MS;
                m_resolve_fail_times_ms.second > tries_timeout_ms) {
            if (int64_t remaining_ms = TEMPORARY_DISABLE_INTERVAL_MS - (now_ms() - tries_timeout_ms);
                    remaining_ms > 0) {
                return DG_FMT("Bootstrapping this server is disabled for {}ms, too many failures", remaining_ms);
            }
            m_resolve_fail_times_ms.first = 0;
        }
    }
    return std::nullopt;
}

void dg::bootstrapper::temporary_disabler_update(const err_string &error) {
    if (error.has_value()) {
        m_resolve_fail_times_ms.second = now_ms();
        if (m_resolve_fail_times_ms.first == 0) {
            m_resolve_fail_times_ms.first = m_resolve_fail_times_ms.second;
        }
    } else {
        m_resolve_fail_times_ms.first = 0;
    }
}

dg::bootstrapper::resolve_result dg::bootstrapper::get() {
    std::scoped_lock l(m_resolved_cache_mutex);
    if (!m_resolved_cache.empty()) {
        return {m_resolved_cache, m_server_name, milliseconds(0), std::nullopt};
    }
    if (auto error = temporary_disabler_check()) {
        return {{}, m_server_name, milliseconds(0), std::move(error)};
    }

    resolve_result result = resolve();
    temporary_disabler_update(result.error);
    m_resolved_cache = result.addresses;
    return result;
}

void dg::bootstrapper::remove_resolved(const socket_address &addr) {
    std::scoped_lock l(m_resolved_cache_mutex);
    m_resolved_cache.erase(std::remove(m_resolved_cache.begin(), m_resolved_cache.end(), addr),
            m_resolved_cache.end());
}

static std::vector<dg::upstream_ptr> create_resolvers(const dg::logger &log, const dg::bootstrapper::params &p) {
    std::vector<dg::upstream_ptr> resolvers;
    resolvers.reserve(p.bootstrap.size());

    dg::upstream_factory factory(p.upstream_config);
    for (const std::string &server : p.bootstrap) {
        if (dg::utils::starts_with(server, dg::STAMP_URL_PREFIX_WITH_SCHEME)
                || !dg::utils::str_to_socket_address(server).valid()) {
            log_addr(log, warn, p.address_string, "Bootstrap server must be a plain DNS IP address: {}", server);
            continue;
        }
        dg::upstream_options opts{};
        opts.address = server;
        opts.timeout = p.timeout;
        auto [upstream, err] = factory.create_upstream(opts);
        if (err.has_value()) {
            log_addr(log, warn, p.address_string, "Failed to create resolver '{}': {}", server, *err);
            continue;
        }
        resolvers.emplace_back(std::move(upstream));
    }

    if (p.bootstrap.empty() && !dg::utils::str_to_socket_address(p.address_string).valid()) {
        log_addr(log, warn, p.address_string, "Got empty or invalid list of servers for bootstrapping");
    }

    return resolvers;
}

dg::bootstrapper::bootstrapper(const params &p)
        : m_log(create_logger("bootstrapper"))
        , m_timeout(p.timeout)
        , m_ipv6_available(p.upstream_config.ipv6_available)
        , m_resolvers(create_resolvers(m_log, p)) {
    auto [host, port] = utils::split_host_port(p.address_string);
    m_server_port = std::strtol(std::string(port).c_str(), nullptr, 10);
    if (m_server_port == 0) {
        m_server_port = p.default_port;
    }
    m_server_name = host;
}

dg::err_string dg::bootstrapper::init() {
    if (m_server_name.empty()) {
        return "Empty server name";
    }
    if (m_resolvers.empty() && !socket_address(m_server_name, m_server_port).valid()) {
        return "Failed to create any resolver";
    }
    return std::nullopt;
}

std::string dg::bootstrapper::address() const {
    return utils::join_host_port(m_server_name, std::to_string(m_server_port));
}
