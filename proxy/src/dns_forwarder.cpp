#include <algorithm>
#include <cstring>
#include <dg_net_utils.h>
#include "dns_forwarder.h"
#include "dns_truncate.h"
#include "response_helpers.h"

#define dbglog_id(l_, pkt_, fmt_, ...) dbglog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)
#define dbglog_fid(l_, pkt_, fmt_, ...) dbglog((l_), "[{}] {} " fmt_, ldns_pkt_id(pkt_), __func__, ##__VA_ARGS__)
#define warnlog_id(l_, pkt_, fmt_, ...) warnlog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)
#define tracelog_id(l_, pkt_, fmt_, ...) tracelog((l_), "[{}] " fmt_, ldns_pkt_id(pkt_), ##__VA_ARGS__)

using namespace std::chrono;

namespace dg {

static constexpr std::string_view MOZILLA_DOH_HOST = "use-application-dns.net.";
static constexpr std::string_view LAN_SUFFIX = ".lan.";

// An ldns_buffer grows automatically.
// We set the initial capacity so that most responses will fit without reallocations.
static constexpr size_t RESPONSE_BUFFER_INITIAL_CAPACITY = 512;

const dns_forwarder::stage_fn dns_forwarder::STAGES[] = {
        &dns_forwarder::process_initial,
        &dns_forwarder::process_internal_hosts,
        &dns_forwarder::process_internal_ip_addrs,
        &dns_forwarder::process_filtering_before_request,
        &dns_forwarder::process_upstream,
        &dns_forwarder::process_dnssec_after_response,
        &dns_forwarder::process_filtering_after_response,
};

static void log_packet(const logger &log, const ldns_pkt *packet, std::string_view pkt_name) {
    if (!log->should_log(spdlog::level::debug)) {
        return;
    }

    ldns_buffer_ptr str_dns(ldns_buffer_new(RESPONSE_BUFFER_INITIAL_CAPACITY));
    ldns_status status = ldns_pkt2buffer_str(str_dns.get(), packet);
    if (status != LDNS_STATUS_OK) {
        dbglog_id(log, packet, "Failed to print {}: {} ({})", pkt_name, ldns_get_errorstr_by_id(status), (int) status);
    } else {
        dbglog_id(log, packet, "{}:\n{}", pkt_name,
                std::string_view((char *) ldns_buffer_begin(str_dns.get()), ldns_buffer_position(str_dns.get())));
    }
}

static uint8_vector transform_response_to_raw_data(const ldns_pkt *message) {
    ldns_buffer_ptr buffer(ldns_buffer_new(RESPONSE_BUFFER_INITIAL_CAPACITY));
    // Names are compressed while writing
    if (ldns_status status = ldns_pkt2buffer_wire(buffer.get(), message); status != LDNS_STATUS_OK) {
        return {};
    }
    return {ldns_buffer_at(buffer.get(), 0), ldns_buffer_at(buffer.get(), 0) + ldns_buffer_position(buffer.get())};
}

static const ldns_rr *get_question(const ldns_pkt *pkt) {
    return ldns_rr_list_rr(ldns_pkt_question(pkt), 0);
}

// Question name in lower case without the trailing dot
static std::string get_normalized_host(const ldns_pkt *pkt) {
    const ldns_rr *question = get_question(pkt);
    if (question == nullptr) {
        return {};
    }
    allocated_ptr<char> name(ldns_rdf2str(ldns_rr_owner(question)));
    if (name == nullptr) {
        return {};
    }
    std::string host = utils::to_lower(name.get());
    if (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    return host;
}

static void replace_question(ldns_pkt *pkt, const ldns_rr *question) {
    ldns_rr_list *list = ldns_rr_list_new();
    ldns_rr_list_push_rr(list, ldns_rr_clone(question));
    ldns_rr_list_deep_free(ldns_pkt_question(pkt));
    ldns_pkt_set_question(pkt, list);
    ldns_pkt_set_qdcount(pkt, 1);
}

static void remove_rrsigs(ldns_pkt *pkt, const logger &log) {
    for (ldns_pkt_section section : {LDNS_SECTION_ANSWER, LDNS_SECTION_AUTHORITY}) {
        ldns_rr_list *old_list = (section == LDNS_SECTION_ANSWER) ? ldns_pkt_answer(pkt) : ldns_pkt_authority(pkt);
        ldns_rr_list *new_list = ldns_rr_list_new();
        for (size_t i = 0; i < ldns_rr_list_rr_count(old_list); ++i) {
            ldns_rr *rr = ldns_rr_list_rr(old_list, i);
            if (ldns_rr_get_type(rr) == LDNS_RR_TYPE_RRSIG) {
                tracelog_id(log, pkt, "Removing RRSIG record from response");
                ldns_rr_free(rr);
            } else {
                ldns_rr_list_push_rr(new_list, rr);
            }
        }
        ldns_rr_list_free(old_list);
        if (section == LDNS_SECTION_ANSWER) {
            ldns_pkt_set_answer(pkt, new_list);
        } else {
            ldns_pkt_set_authority(pkt, new_list);
        }
        ldns_pkt_set_section_count(pkt, section, ldns_rr_list_rr_count(new_list));
    }
}

static void prepend_answer(ldns_pkt *pkt, ldns_rr *rr) {
    ldns_rr_list *answer = ldns_rr_list_new();
    ldns_rr_list_push_rr(answer, rr);
    ldns_rr_list_push_rr_list(answer, ldns_pkt_answer(pkt));
    ldns_rr_list_free(ldns_pkt_answer(pkt));
    ldns_pkt_set_answer(pkt, answer);
    ldns_pkt_set_ancount(pkt, ldns_rr_list_rr_count(answer));
}

static std::optional<std::string_view> get_stats_counter(const filter_result &result) {
    using counter = std::optional<std::string_view>;
    return std::visit(overloaded{
            [] (const verdict::not_filtered &) -> counter { return std::nullopt; },
            [] (const verdict::whitelisted &) -> counter { return std::nullopt; },
            [] (const verdict::blocked_by_list &) -> counter { return stats_names::QUERIES_FILTERED; },
            [] (const verdict::blocked_by_safebrowsing &) -> counter { return stats_names::QUERIES_SAFEBROWSING; },
            [] (const verdict::blocked_by_parental &) -> counter { return stats_names::QUERIES_PARENTAL; },
            [] (const verdict::blocked_by_safesearch &) -> counter { return stats_names::QUERIES_SAFESEARCH; },
            [] (const verdict::blocked_invalid &) -> counter { return stats_names::QUERIES_FILTERED; },
            [] (const verdict::blocked_service &) -> counter { return stats_names::QUERIES_FILTERED; },
            [] (const verdict::rewritten &) -> counter { return std::nullopt; },
    }, result);
}

std::string dns_forwarder_utils::rr_list_to_string(const ldns_rr_list *rr_list) {
    if (rr_list == nullptr) {
        return {};
    }
    allocated_ptr<char> answer(ldns_rr_list2str(rr_list));
    if (answer == nullptr) {
        return {};
    }
    std::string_view answer_view = answer.get();
    std::string out;
    out.reserve(answer_view.size());
    for (std::string_view record : utils::split_by(answer_view, '\n')) {
        std::vector<std::string_view> record_parts = utils::split_by(record, '\t');
        auto it = record_parts.begin();
        if (record_parts.size() >= 4) {
            it++; // Skip owner
            it++; // Skip ttl
            it++; // Skip class
            out += *it++; // Add type
            out += ',';
            // Add serialized RDFs
            while (it != record_parts.end()) {
                out += ' ';
                out += *it++;
            }
            out += '\n';
        }
    }
    return out;
}

dns_forwarder::dns_forwarder(std::shared_mutex &config_mtx)
        : m_log(create_logger("DNS forwarder"))
        , m_config_mtx(config_mtx) {
}

dns_forwarder::~dns_forwarder() = default;

std::pair<upstream_list, err_string> dns_forwarder::create_upstreams(
        const std::vector<upstream_options> &options) const {
    upstream_factory us_factory({m_settings.ipv6_available});
    upstream_list upstreams;
    upstreams.reserve(options.size());
    std::string errors;
    for (const upstream_options &opts : options) {
        infolog(m_log, "Initializing upstream {}...", opts.address);
        auto [created, err] = us_factory.create_upstream(opts);
        if (err.has_value()) {
            errlog(m_log, "Failed to create upstream: {}", err.value());
            errors += DG_FMT("{}: {}\n", opts.address, err.value());
        } else {
            upstreams.emplace_back(std::move(created));
            infolog(m_log, "Upstream created successfully");
        }
    }
    if (upstreams.empty()) {
        return {std::move(upstreams), DG_FMT("Failed to initialize any upstream:\n{}", errors)};
    }
    return {std::move(upstreams), std::nullopt};
}

std::pair<bool, err_string> dns_forwarder::init(const dnsproxy_settings &settings, const dnsproxy_events &events) {
    infolog(m_log, "Initializing forwarder...");

    m_settings = settings;
    m_events = events;

    if (m_settings.blocking_mode == dnsproxy_blocking_mode::CUSTOM_IP) {
        if (m_settings.custom_blocking_ipv4.empty()) {
            warnlog(m_log, "Custom blocking IPv4 not set: blocking responses to A queries will be empty");
        } else if (!utils::is_valid_ip4(m_settings.custom_blocking_ipv4)) {
            auto err = DG_FMT("Invalid custom blocking IPv4 address: {}", m_settings.custom_blocking_ipv4);
            errlog(m_log, "{}", err);
            deinit();
            return {false, std::move(err)};
        }
        if (m_settings.custom_blocking_ipv6.empty()) {
            warnlog(m_log, "Custom blocking IPv6 not set: blocking responses to AAAA queries will be empty");
        } else if (!utils::is_valid_ip6(m_settings.custom_blocking_ipv6)) {
            auto err = DG_FMT("Invalid custom blocking IPv6 address: {}", m_settings.custom_blocking_ipv6);
            errlog(m_log, "{}", err);
            deinit();
            return {false, std::move(err)};
        }
    }

    if (m_settings.upstreams.empty()) {
        infolog(m_log, "No upstreams configured, using the default ones");
        m_settings.upstreams = dnsproxy_settings::get_default().upstreams;
    }

    infolog(m_log, "Initializing upstreams...");
    auto [upstreams, upstreams_err] = create_upstreams(m_settings.upstreams);
    if (upstreams_err.has_value()) {
        errlog(m_log, "{}", upstreams_err.value());
        deinit();
        return {false, std::move(upstreams_err)};
    }
    m_upstreams = std::move(upstreams);
    infolog(m_log, "Upstreams initialized");

    for (const std::string &entry : m_settings.bogus_nxdomain) {
        cidr_range range(entry);
        if (!range.valid()) {
            auto err = DG_FMT("Invalid bogus NXDOMAIN address: {}", entry);
            errlog(m_log, "{}", err);
            deinit();
            return {false, std::move(err)};
        }
        m_bogus_nxdomain.emplace_back(std::move(range));
    }

    infolog(m_log, "Initializing access control...");
    auto [access, access_err] = access_control::create(
            m_settings.allowed_clients, m_settings.disallowed_clients, m_settings.blocked_hosts);
    if (access == nullptr) {
        errlog(m_log, "Failed to initialize access control: {}", access_err.value());
        deinit();
        return {false, std::move(access_err)};
    }
    m_access = std::move(access);

    infolog(m_log, "Initializing the filtering module...");
    auto [filter, err_or_warn] = dnsfilter::create(m_settings.filter_params);
    if (filter == nullptr) {
        errlog(m_log, "Failed to initialize the filtering module");
        deinit();
        return {false, std::move(err_or_warn)};
    }
    m_filter = std::move(filter);
    if (err_or_warn) {
        warnlog(m_log, "Filtering module initialized with warnings:\n{}", *err_or_warn);
    } else {
        infolog(m_log, "Filtering module initialized");
    }

    m_cache = std::make_shared<response_cache>(
            m_settings.dns_cache_size, m_settings.cache_min_ttl, m_settings.cache_max_ttl);

    infolog(m_log, "Forwarder initialized");
    return {true, std::move(err_or_warn)};
}

void dns_forwarder::deinit() {
    infolog(m_log, "Deinitializing...");

    infolog(m_log, "Destroying upstreams...");
    m_upstreams.clear();
    infolog(m_log, "Done");

    infolog(m_log, "Destroying DNS filter...");
    m_filter.reset();
    m_access.reset();
    infolog(m_log, "Done");

    m_bogus_nxdomain.clear();

    infolog(m_log, "Clearing cache...");
    m_cache.reset();
    infolog(m_log, "Done");

    infolog(m_log, "Deinitialized");
}

void dns_forwarder::set_protection_enabled(bool enabled) {
    infolog(m_log, "Protection {}", enabled ? "enabled" : "disabled");
    m_settings.protection_enabled = enabled;
}

err_string dns_forwarder::set_upstreams(const std::vector<upstream_options> &options) {
    const std::vector<upstream_options> &effective = options.empty()
            ? dnsproxy_settings::get_default().upstreams : options;
    auto [upstreams, err] = create_upstreams(effective);
    if (err.has_value()) {
        return err;
    }
    m_settings.upstreams = effective;
    m_upstreams = std::move(upstreams);
    if (m_cache != nullptr) {
        m_cache->clear();
    }
    return std::nullopt;
}

void dns_forwarder::set_filtering_engine(std::shared_ptr<filtering_engine> engine) {
    m_filter = std::move(engine);
}

void dns_forwarder::set_leases(const std::vector<dhcp_lease> &leases) {
    m_leases.update(leases);
}

std::pair<bool, std::string> dns_forwarder::is_blocked_ip(const socket_address &ip) const {
    std::shared_ptr<access_control> access;
    {
        std::shared_lock l(m_config_mtx);
        access = m_access;
    }
    if (access == nullptr) {
        return {false, ""};
    }
    return access->is_blocked_ip(ip);
}

uint8_vector dns_forwarder::handle_message(uint8_view message, const dns_message_info *info) {
    ldns_pkt *request;
    ldns_status status = ldns_wire2pkt(&request, message.data(), message.length());
    if (status != LDNS_STATUS_OK) {
        // There is no ID to reply with
        dbglog(m_log, "{} Failed to parse payload: {} ({})", __func__, ldns_get_errorstr_by_id(status), (int) status);
        return {};
    }
    ldns_pkt_ptr req_holder(request);
    log_packet(m_log, request, "Client dns request");

    if (ldns_rr_list_rr_count(ldns_pkt_question(request)) != 1) {
        dbglog_fid(m_log, request, "Message must have exactly one question, got {}",
                ldns_rr_list_rr_count(ldns_pkt_question(request)));
        ldns_pkt_ptr response(response_helpers::create_servfail_response(request));
        log_packet(m_log, response.get(), "Server failure response");
        return transform_response_to_raw_data(response.get());
    }

    std::shared_ptr<access_control> access;
    {
        std::shared_lock l(m_config_mtx);
        access = m_access;
    }
    if (access != nullptr) {
        if (info != nullptr) {
            if (auto [blocked, rule] = access->is_blocked_ip(info->peername); blocked) {
                dbglog_id(m_log, request, "Client {} is blocked by rule '{}'", info->peername.host_str(), rule);
                return {};
            }
        }
        if (std::string host = get_normalized_host(request); access->is_blocked_domain(host)) {
            dbglog_id(m_log, request, "Domain {} is blocked by access settings", host);
            return {};
        }
    }

    // The limit the client advertised, before the request is altered
    uint16_t max_udp_size = ldns_pkt_edns(request) ? ldns_pkt_edns_udp_size(request) : DNS_MIN_UDP_PAYLOAD;

    processing_context ctx;
    ctx.request = std::move(req_holder);
    if (info != nullptr) {
        ctx.info = *info;
    }
    process(ctx);

    if (info != nullptr && info->proto == utils::TP_UDP
            && ldns_pkt_truncate(ctx.response.get(), max_udp_size)) {
        dbglog_id(m_log, ctx.response.get(), "Truncated response to {} bytes", max_udp_size);
    }
    log_packet(m_log, ctx.response.get(), "Response");
    return transform_response_to_raw_data(ctx.response.get());
}

dns_forwarder::stage_result dns_forwarder::process(processing_context &ctx) {
    ctx.start_time = duration_cast<milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    ctx.timer.reset();

    // Failed requests are logged too
    utils::scope_exit log_request([this, &ctx] { process_query_logs_and_stats(ctx); });

    for (stage_fn stage : STAGES) {
        switch ((this->*stage)(ctx)) {
        case stage_result::CONTINUE:
            break;
        case stage_result::FINISH:
            return stage_result::FINISH;
        case stage_result::ERROR:
            dbglog_id(m_log, ctx.request.get(), "Processing failed: {}", ctx.error.value_or("unknown error"));
            if (ctx.original_question != nullptr) {
                replace_question(ctx.request.get(), ctx.original_question.get());
            }
            ctx.response.reset(response_helpers::create_servfail_response(ctx.request.get()));
            return stage_result::ERROR;
        }
    }

    if (ctx.response == nullptr) {
        ctx.response.reset(response_helpers::create_servfail_response(ctx.request.get()));
    }
    return stage_result::CONTINUE;
}

dns_forwarder::stage_result dns_forwarder::process_initial(processing_context &ctx) {
    const ldns_pkt *request = ctx.request.get();
    const ldns_rr *question = get_question(request);
    if (question == nullptr) {
        ctx.error = "Request has no question";
        return stage_result::ERROR;
    }
    ldns_rr_type type = ldns_rr_get_type(question);

    if (m_settings.aaaa_disabled && type == LDNS_RR_TYPE_AAAA) {
        dbglog_id(m_log, request, "AAAA query is suppressed");
        ctx.response.reset(response_helpers::create_soa_response(
                request, m_settings, response_helpers::SOA_RETRY_IPV6_BLOCK));
        return stage_result::FINISH;
    }

    if (m_settings.refuse_any && type == LDNS_RR_TYPE_ANY) {
        dbglog_id(m_log, request, "Refusing ANY query");
        ctx.response.reset(response_helpers::create_notimpl_response(request));
        return stage_result::FINISH;
    }

    if (m_events.on_request != nullptr && ctx.info.has_value()) {
        m_events.on_request(request, ctx.info.value());
    }

    // disable Mozilla DoH
    if (type == LDNS_RR_TYPE_A || type == LDNS_RR_TYPE_AAAA) {
        allocated_ptr<char> name(ldns_rdf2str(ldns_rr_owner(question)));
        if (name != nullptr && utils::to_lower(name.get()) == MOZILLA_DOH_HOST) {
            ctx.response.reset(response_helpers::create_nxdomain_response(request, m_settings));
            log_packet(m_log, ctx.response.get(), "Mozilla DOH blocking response");
            return stage_result::FINISH;
        }
    }

    return stage_result::CONTINUE;
}

dns_forwarder::stage_result dns_forwarder::process_internal_hosts(processing_context &ctx) {
    const ldns_pkt *request = ctx.request.get();
    ldns_rr_type type = ldns_rr_get_type(get_question(request));
    if (type != LDNS_RR_TYPE_A && type != LDNS_RR_TYPE_AAAA) {
        return stage_result::CONTINUE;
    }

    std::string host = get_normalized_host(request) + ".";
    if (!utils::ends_with(host, LAN_SUFFIX)) {
        return stage_result::CONTINUE;
    }
    host.resize(host.size() - LAN_SUFFIX.size());

    std::optional<std::string> ip = m_leases.find_ip(host);
    if (!ip.has_value()) {
        return stage_result::CONTINUE;
    }

    dbglog_id(m_log, request, "Internal record: {} -> {}", host, ip.value());
    // An AAAA query gets an empty answer
    ctx.response.reset(response_helpers::create_response_with_ip(request, m_settings, ip.value()));
    return stage_result::CONTINUE;
}

dns_forwarder::stage_result dns_forwarder::process_internal_ip_addrs(processing_context &ctx) {
    const ldns_pkt *request = ctx.request.get();
    if (ctx.response != nullptr || ldns_rr_get_type(get_question(request)) != LDNS_RR_TYPE_PTR) {
        return stage_result::CONTINUE;
    }

    std::string arpa = get_normalized_host(request);
    socket_address ip = lease_table::unreverse_addr(arpa);
    if (!ip.valid()) {
        return stage_result::CONTINUE;
    }

    std::optional<std::string> host = m_leases.find_host(ip);
    if (!host.has_value()) {
        return stage_result::CONTINUE;
    }

    dbglog_id(m_log, request, "Reverse lookup: {} -> {}", arpa, host.value());
    ctx.response.reset(response_helpers::create_ptr_response(request, m_settings, host.value()));
    return stage_result::CONTINUE;
}

dns_forwarder::stage_result dns_forwarder::process_filtering_before_request(processing_context &ctx) {
    if (ctx.response != nullptr) {
        return stage_result::CONTINUE;
    }

    ldns_pkt *request = ctx.request.get();
    std::string host = get_normalized_host(request);
    ldns_rr_type type = ldns_rr_get_type(get_question(request));

    std::shared_ptr<filtering_engine> filter;
    {
        std::shared_lock l(m_config_mtx);
        ctx.protection_enabled = m_settings.protection_enabled && m_filter != nullptr;
        filter = m_filter;
    }
    if (!ctx.protection_enabled) {
        return stage_result::CONTINUE;
    }
    // No lock is held here, the callback may call back into the proxy
    if (m_events.on_client_settings != nullptr && ctx.info.has_value()) {
        m_events.on_client_settings(ctx.info->peername.host_str(), ctx.client);
    }
    filtering_engine::check_result check = filter->check_host(host, type, ctx.client);

    if (check.error.has_value()) {
        ctx.error = DG_FMT("Failed to check {}: {}", host, check.error.value());
        return stage_result::ERROR;
    }
    ctx.result = std::move(check.result);
    tracelog_id(m_log, request, "Verdict for {}: {} {}", host, verdict_name(ctx.result), verdict_rule(ctx.result));

    if (const auto *rewrite = std::get_if<verdict::rewritten>(&ctx.result)) {
        if (!rewrite->ips.empty()) {
            ctx.response.reset(response_helpers::create_rewrite_response(request, m_settings, *rewrite));
        } else if (!rewrite->canonical_name.empty()) {
            // Resolve the canonical name instead, the question is restored after the response is received
            ldns_rdf *name = ldns_dname_new_frm_str(rewrite->canonical_name.c_str());
            if (name == nullptr) {
                ctx.error = DG_FMT("Invalid canonical name for {}: {}", host, rewrite->canonical_name);
                return stage_result::ERROR;
            }
            ctx.original_question.reset(ldns_rr_clone(get_question(request)));
            ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(request), 0);
            ldns_rdf_deep_free(ldns_rr_owner(question));
            ldns_rr_set_owner(question, name);
            dbglog_id(m_log, request, "Rewriting {} to {}", host, rewrite->canonical_name);
        }
    } else if (is_filtered(ctx.result)) {
        ctx.response = create_blocking_response(ctx);
        log_packet(m_log, ctx.response.get(), "Rule blocked response");
    }

    return stage_result::CONTINUE;
}

dns_forwarder::stage_result dns_forwarder::process_upstream(processing_context &ctx) {
    if (ctx.response != nullptr) {
        return stage_result::CONTINUE;
    }

    ldns_pkt *request = ctx.request.get();

    std::optional<upstream_list> custom_upstreams;
    if (m_events.get_custom_upstreams != nullptr && ctx.info.has_value()) {
        std::string client_ip = ctx.info->peername.host_str();
        custom_upstreams = m_events.get_custom_upstreams(client_ip);
        if (custom_upstreams.has_value()) {
            dbglog_id(m_log, request, "Using custom upstreams for {}", client_ip);
        }
    }

    if (m_settings.enable_dnssec) {
        if (!ldns_pkt_edns(request)) {
            tracelog_id(m_log, request, "Adding OPT record with DNSSEC flag");
            ldns_pkt_set_edns_udp_size(request, UDP_RECV_BUF_SIZE);
            ldns_pkt_set_edns_do(request, true);
        } else if (!ldns_pkt_edns_do(request)) {
            ldns_pkt_set_edns_do(request, true);
        } else {
            ctx.orig_req_dnssec = true;
        }
    }

    resolve_result result = do_upstream_exchange(request, custom_upstreams ? &custom_upstreams.value() : nullptr);
    ctx.upstream_address = std::move(result.upstream_address);
    ctx.cache_hit = result.cache_hit;
    if (result.error.has_value()) {
        ctx.error = DG_FMT("Failed to resolve {}: {}", get_normalized_host(request), result.error.value());
        return stage_result::ERROR;
    }

    if (result.response == nullptr) {
        warnlog_id(m_log, request, "Upstream {} returned no response and no error", ctx.upstream_address);
        result.response.reset(response_helpers::create_servfail_response(request));
    }
    ldns_pkt_set_id(result.response.get(), ldns_pkt_id(request));
    ctx.response = std::move(result.response);
    ctx.response_from_upstream = true;
    return stage_result::CONTINUE;
}

dns_forwarder::stage_result dns_forwarder::process_dnssec_after_response(processing_context &ctx) {
    if (!ctx.response_from_upstream || !m_settings.enable_dnssec || ctx.orig_req_dnssec) {
        return stage_result::CONTINUE;
    }

    ldns_pkt *response = ctx.response.get();
    if (ldns_pkt_edns(response) && !ldns_pkt_edns_do(response)) {
        return stage_result::CONTINUE;
    }

    // The DO bit was set by us, so the client did not ask for the signatures
    remove_rrsigs(response, m_log);
    return stage_result::CONTINUE;
}

dns_forwarder::stage_result dns_forwarder::process_filtering_after_response(processing_context &ctx) {
    if (const auto *rewrite = std::get_if<verdict::rewritten>(&ctx.result)) {
        // Only set if the rewrite replaced the question
        if (ctx.original_question == nullptr) {
            return stage_result::CONTINUE;
        }
        replace_question(ctx.request.get(), ctx.original_question.get());
        replace_question(ctx.response.get(), ctx.original_question.get());
        if (ldns_pkt_ancount(ctx.response.get()) != 0) {
            ldns_rr *cname = response_helpers::create_cname_rr(ctx.request.get(), m_settings, rewrite->canonical_name);
            if (cname != nullptr) {
                prepend_answer(ctx.response.get(), cname);
            }
        }
        return stage_result::CONTINUE;
    }

    if (std::holds_alternative<verdict::whitelisted>(ctx.result)) {
        return stage_result::CONTINUE;
    }

    if (!ctx.protection_enabled || !ctx.response_from_upstream) {
        return stage_result::CONTINUE;
    }

    std::shared_ptr<filtering_engine> filter;
    {
        std::shared_lock l(m_config_mtx);
        filter = m_filter;
    }
    if (filter == nullptr) {
        return stage_result::CONTINUE;
    }
    filtering_engine::check_result check = filter->check_response(ctx.response.get(), ctx.client);

    if (check.error.has_value()) {
        ctx.error = DG_FMT("Failed to check response: {}", check.error.value());
        return stage_result::ERROR;
    }

    if (!is_filtered(check.result)) {
        ctx.result = verdict::not_filtered{};
        return stage_result::CONTINUE;
    }

    dbglog_id(m_log, ctx.request.get(), "Response blocked by rule: {}", verdict_rule(check.result));
    ctx.result = std::move(check.result);
    ctx.original_response = std::move(ctx.response);
    ctx.response = create_blocking_response(ctx);
    return stage_result::CONTINUE;
}

void dns_forwarder::process_query_logs_and_stats(const processing_context &ctx) {
    const ldns_pkt *request = ctx.request.get();
    const ldns_rr *question = get_question(request);
    if (question == nullptr) {
        return;
    }
    ldns_rr_type type = ldns_rr_get_type(question);
    if (m_settings.refuse_any && type == LDNS_RR_TYPE_ANY) {
        return;
    }

    dns_request_processed_event event{};
    event.start_time = ctx.start_time;
    event.elapsed = (int32_t) ctx.timer.elapsed<milliseconds>().count();

    allocated_ptr<char> domain(ldns_rdf2str(ldns_rr_owner(question)));
    event.domain = (domain != nullptr) ? domain.get() : "";
    allocated_ptr<char> type_str(ldns_rr_type2str(type));
    event.type = (type_str != nullptr) ? type_str.get() : "";

    if (ctx.response != nullptr) {
        allocated_ptr<char> status(ldns_pkt_rcode2str(ldns_pkt_get_rcode(ctx.response.get())));
        event.status = (status != nullptr) ? status.get() : "";
        event.answer = dns_forwarder_utils::rr_list_to_string(ldns_pkt_answer(ctx.response.get()));
    }
    if (ctx.original_response != nullptr) {
        event.original_answer = dns_forwarder_utils::rr_list_to_string(ldns_pkt_answer(ctx.original_response.get()));
    }
    event.upstream = ctx.upstream_address;
    event.client = ctx.info.has_value() ? ctx.info->peername.host_str() : "";
    event.result = ctx.result;
    event.error = ctx.error.value_or("");
    event.cache_hit = ctx.cache_hit;

    if (m_events.on_request_processed != nullptr) {
        m_events.on_request_processed(event);
    }

    int64_t now = event.start_time + event.elapsed;
    if (m_events.on_stats_increment != nullptr) {
        m_events.on_stats_increment(stats_names::QUERIES_TOTAL, now);
        if (ctx.error.has_value()) {
            m_events.on_stats_increment(stats_names::QUERIES_ERROR, now);
        } else if (std::optional<std::string_view> counter = get_stats_counter(ctx.result)) {
            m_events.on_stats_increment(counter.value(), now);
        }
    }
    if (m_events.on_stats_observe != nullptr) {
        m_events.on_stats_observe(stats_names::PROCESSING_TIME_MS, event.elapsed, now);
    }
}

bool dns_forwarder::is_bogus_nxdomain(const ldns_pkt *response) const {
    if (m_bogus_nxdomain.empty()) {
        return false;
    }
    const ldns_rr_list *answer = ldns_pkt_answer(response);
    for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
        const ldns_rr *rr = ldns_rr_list_rr(answer, i);
        ldns_rr_type type = ldns_rr_get_type(rr);
        if ((type != LDNS_RR_TYPE_A && type != LDNS_RR_TYPE_AAAA) || ldns_rr_rd_count(rr) == 0) {
            continue;
        }
        const ldns_rdf *rdf = ldns_rr_rdf(rr, 0);
        socket_address addr({ldns_rdf_data(rdf), ldns_rdf_size(rdf)}, 0);
        if (std::any_of(m_bogus_nxdomain.begin(), m_bogus_nxdomain.end(),
                [&addr](const cidr_range &range) { return range.contains(addr); })) {
            return true;
        }
    }
    return false;
}

dns_forwarder::resolve_result dns_forwarder::do_upstream_exchange(ldns_pkt *request,
        const upstream_list *custom_upstreams) {
    upstream_list upstreams;
    std::shared_ptr<response_cache> cache;
    {
        std::shared_lock l(m_config_mtx);
        upstreams = m_upstreams;
        cache = m_cache;
    }

    if (cache != nullptr) {
        if (response_cache::result cached = cache->get(request); cached.response != nullptr) {
            log_packet(m_log, cached.response.get(), "Cached response");
            return {std::move(cached.response), "", true, std::nullopt};
        }
    }

    std::shared_ptr<upstream> selected = upstream_selector::choose(upstreams, custom_upstreams);
    if (selected == nullptr) {
        return {nullptr, "", false, "No upstreams to resolve with"};
    }

    utils::timer timer;
    auto [response, err] = selected->exchange(request);
    if (err.has_value()) {
        return {nullptr, selected->address(), false, DG_FMT("Upstream ({}) failed: {}", selected->address(), *err)};
    }
    selected->adjust_rtt(timer.elapsed<milliseconds>());

    if (response == nullptr) {
        return {nullptr, selected->address(), false, std::nullopt};
    }
    log_packet(m_log, response.get(), DG_FMT("Upstream ({}) dns response", selected->address()));

    if (is_bogus_nxdomain(response.get())) {
        dbglog_id(m_log, request, "Replacing bogus response with NXDOMAIN");
        response.reset(response_helpers::create_nxdomain_response(request, m_settings));
    }

    if (cache != nullptr) {
        cache->set(response.get());
    }
    return {std::move(response), selected->address(), false, std::nullopt};
}

ldns_pkt_ptr dns_forwarder::create_mode_response(const ldns_pkt *request,
        const std::optional<std::string> &rule_ip) const {
    switch (m_settings.blocking_mode) {
    case dnsproxy_blocking_mode::NULL_IP:
        return ldns_pkt_ptr(response_helpers::create_null_ip_response(request, m_settings));
    case dnsproxy_blocking_mode::CUSTOM_IP:
        return ldns_pkt_ptr(response_helpers::create_custom_ip_response(request, m_settings));
    case dnsproxy_blocking_mode::NXDOMAIN:
        return ldns_pkt_ptr(response_helpers::create_nxdomain_response(request, m_settings));
    case dnsproxy_blocking_mode::REFUSED:
        return ldns_pkt_ptr(response_helpers::create_refused_response(request));
    case dnsproxy_blocking_mode::DEFAULT:
        break;
    }
    // The address from a hosts-style rule, otherwise the unspecified one
    if (rule_ip.has_value()) {
        return ldns_pkt_ptr(response_helpers::create_response_with_ip(request, m_settings, rule_ip.value()));
    }
    return ldns_pkt_ptr(response_helpers::create_null_ip_response(request, m_settings));
}

ldns_pkt_ptr dns_forwarder::create_blocked_host_response(const processing_context &ctx, std::string_view block_host) {
    const ldns_pkt *request = ctx.request.get();
    if (block_host.empty()) {
        return create_mode_response(request, std::nullopt);
    }
    if (utils::is_valid_ip4(block_host) || utils::is_valid_ip6(block_host)) {
        return ldns_pkt_ptr(response_helpers::create_response_with_ip(request, m_settings, block_host));
    }

    std::string fqdn(block_host);
    if (fqdn.back() != '.') {
        fqdn.push_back('.');
    }
    ldns_rdf *name = ldns_dname_new_frm_str(fqdn.c_str());
    if (name == nullptr) {
        warnlog_id(m_log, request, "Invalid replacement host: {}", block_host);
        return ldns_pkt_ptr(response_helpers::create_servfail_response(request));
    }
    ldns_pkt_ptr redirect_request(
            ldns_pkt_query_new(name, ldns_rr_get_type(get_question(request)), LDNS_RR_CLASS_IN, LDNS_RD));
    ldns_pkt_set_random_id(redirect_request.get());

    const upstream_list *custom_upstreams = nullptr;
    std::optional<upstream_list> custom;
    if (m_events.get_custom_upstreams != nullptr && ctx.info.has_value()) {
        custom = m_events.get_custom_upstreams(ctx.info->peername.host_str());
        custom_upstreams = custom ? &custom.value() : nullptr;
    }

    resolve_result result = do_upstream_exchange(redirect_request.get(), custom_upstreams);
    if (result.error.has_value()) {
        warnlog_id(m_log, request, "Couldn't look up replacement host {}: {}", block_host, result.error.value());
        return ldns_pkt_ptr(response_helpers::create_servfail_response(request));
    }
    return ldns_pkt_ptr(response_helpers::create_redirect_response(request, result.response.get()));
}

ldns_pkt_ptr dns_forwarder::create_blocking_response(const processing_context &ctx) {
    const ldns_pkt *request = ctx.request.get();
    ldns_rr_type type = ldns_rr_get_type(get_question(request));
    if (type != LDNS_RR_TYPE_A && type != LDNS_RR_TYPE_AAAA) {
        if (m_settings.blocking_mode == dnsproxy_blocking_mode::NULL_IP) {
            return ldns_pkt_ptr(response_helpers::create_response_by_request(request));
        }
        return ldns_pkt_ptr(response_helpers::create_nxdomain_response(request, m_settings));
    }

    return std::visit(overloaded{
            [&] (const verdict::not_filtered &) -> ldns_pkt_ptr { return nullptr; },
            [&] (const verdict::whitelisted &) -> ldns_pkt_ptr { return nullptr; },
            [&] (const verdict::rewritten &) -> ldns_pkt_ptr { return nullptr; },
            [&] (const verdict::blocked_by_list &v) -> ldns_pkt_ptr {
                return create_mode_response(request, v.ip);
            },
            [&] (const verdict::blocked_invalid &) -> ldns_pkt_ptr {
                return create_mode_response(request, std::nullopt);
            },
            [&] (const verdict::blocked_service &) -> ldns_pkt_ptr {
                return create_mode_response(request, std::nullopt);
            },
            [&] (const verdict::blocked_by_safebrowsing &) -> ldns_pkt_ptr {
                return create_blocked_host_response(ctx, m_settings.safebrowsing_block_host);
            },
            [&] (const verdict::blocked_by_parental &) -> ldns_pkt_ptr {
                return create_blocked_host_response(ctx, m_settings.parental_block_host);
            },
            [&] (const verdict::blocked_by_safesearch &v) -> ldns_pkt_ptr {
                // The safe search replacement is used regardless of the blocking mode
                if (v.replacement.empty()) {
                    return create_mode_response(request, std::nullopt);
                }
                return create_blocked_host_response(ctx, v.replacement);
            },
    }, ctx.result);
}

upstream::exchange_result dns_forwarder::exchange(const ldns_pkt *request) {
    ldns_pkt_ptr copy(ldns_pkt_clone(request));
    resolve_result result = do_upstream_exchange(copy.get(), nullptr);
    if (result.error.has_value()) {
        return {nullptr, std::move(result.error)};
    }
    if (result.response == nullptr) {
        return {nullptr, "Upstream returned no response"};
    }
    return {std::move(result.response), std::nullopt};
}

std::pair<std::vector<socket_address>, err_string> dns_forwarder::resolve(std::string_view host) {
    std::string fqdn(host);
    if (fqdn.empty() || fqdn.back() != '.') {
        fqdn.push_back('.');
    }

    std::vector<ldns_rr_type> types = {LDNS_RR_TYPE_A};
    if (m_settings.ipv6_available) {
        types.push_back(LDNS_RR_TYPE_AAAA);
    }

    std::vector<socket_address> addresses;
    std::string errors;
    for (ldns_rr_type type : types) {
        ldns_rdf *name = ldns_dname_new_frm_str(fqdn.c_str());
        if (name == nullptr) {
            return {{}, DG_FMT("Invalid host name: {}", host)};
        }
        ldns_pkt_ptr request(ldns_pkt_query_new(name, type, LDNS_RR_CLASS_IN, LDNS_RD));
        ldns_pkt_set_random_id(request.get());

        resolve_result result = do_upstream_exchange(request.get(), nullptr);
        if (result.error.has_value()) {
            errors += result.error.value();
            errors += '\n';
            continue;
        }
        if (result.response == nullptr) {
            continue;
        }

        const ldns_rr_list *answer = ldns_pkt_answer(result.response.get());
        for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
            const ldns_rr *rr = ldns_rr_list_rr(answer, i);
            if (ldns_rr_get_type(rr) != type || ldns_rr_rd_count(rr) == 0) {
                continue;
            }
            const ldns_rdf *rdf = ldns_rr_rdf(rr, 0);
            if (socket_address addr({ldns_rdf_data(rdf), ldns_rdf_size(rdf)}, 0); addr.valid()) {
                addresses.emplace_back(addr);
            }
        }
    }

    if (addresses.empty() && !errors.empty()) {
        return {{}, DG_FMT("Failed to resolve {}:\n{}", host, errors)};
    }
    return {std::move(addresses), std::nullopt};
}

} // namespace dg
