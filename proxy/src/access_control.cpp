#include <dg_utils.h>
#include "access_control.h"

namespace dg {

err_string access_control::parse_client_list(const std::vector<std::string> &src, client_list &dst) {
    for (const std::string &s : src) {
        std::string_view entry = s;
        utils::trim(entry);
        cidr_range range(entry);
        if (!range.valid()) {
            return DG_FMT("Invalid IP address or CIDR: {}", s);
        }
        dst.entries.emplace_back(std::string(entry), std::move(range));
    }
    return std::nullopt;
}

const std::string *access_control::client_list::find(const socket_address &ip) const {
    for (const auto &[text, range] : entries) {
        if (range.contains(ip)) {
            return &text;
        }
    }
    return nullptr;
}

access_control::create_result access_control::create(const std::vector<std::string> &allowed_clients,
        const std::vector<std::string> &disallowed_clients,
        const std::vector<std::string> &blocked_hosts) {
    static constexpr utils::make_error<create_result> make_error;

    std::unique_ptr<access_control> ac(new access_control);
    if (err_string err = parse_client_list(allowed_clients, ac->m_allowed); err.has_value()) {
        return make_error(DG_FMT("Processing allowed clients: {}", err.value()));
    }
    if (err_string err = parse_client_list(disallowed_clients, ac->m_disallowed); err.has_value()) {
        return make_error(DG_FMT("Processing disallowed clients: {}", err.value()));
    }

    std::string rules;
    for (const std::string &rule : blocked_hosts) {
        rules += rule;
        rules += '\n';
    }
    dnsfilter::engine_params params;
    params.filters.push_back({0, std::move(rules), true});
    auto [filter, err] = dnsfilter::create(params);
    if (filter == nullptr) {
        return make_error(DG_FMT("Creating blocked hosts engine: {}", err.value_or("unknown error")));
    }
    if (err.has_value()) {
        warnlog(ac->m_log, "Blocked hosts: {}", err.value());
    }
    ac->m_blocked_hosts = std::move(filter);

    return {std::move(ac), std::nullopt};
}

std::pair<bool, std::string> access_control::is_blocked_ip(const socket_address &ip) const {
    std::scoped_lock l(m_mtx);

    if (!m_allowed.empty()) {
        return {m_allowed.find(ip) == nullptr, ""};
    }

    if (const std::string *entry = m_disallowed.find(ip); entry != nullptr) {
        return {true, *entry};
    }

    return {false, ""};
}

bool access_control::is_blocked_domain(std::string_view host) const {
    std::scoped_lock l(m_mtx);
    std::vector<filter_rule> rules = m_blocked_hosts->match(utils::to_lower(host));
    std::vector<const filter_rule *> effective = dnsfilter::get_effective_rules(rules);
    return !effective.empty() && !effective[0]->props.test(RP_EXCEPTION);
}

} // namespace dg
