#include <algorithm>
#include <cctype>
#include <dnsfilter.h>
#include <dg_logger.h>
#include <dg_utils.h>
#include <dg_socket_address.h>
#include "blocked_services.h"
#include "filter.h"
#include "rule_utils.h"

namespace dg {

static constexpr size_t MAX_HOSTNAME_LENGTH = 253;
static constexpr size_t MAX_LABEL_LENGTH = 63;
// Rules of the blocked services are not from any user filter list
static constexpr int32_t SERVICES_FILTER_ID = -1;

struct dnsfilter::impl {
    logger log = create_logger("dnsfilter");
    std::vector<filter> filters;
    std::vector<rewrite_entry> rewrites;
    hash_set<std::string> safebrowsing_domains;
    hash_set<std::string> parental_domains;
    hash_map<std::string, std::string> safesearch;
    hash_map<std::string, filter> services;
    std::vector<std::string> blocked_services;

    filter_result process_rewrites(const std::string &host, ldns_rr_type qtype) const;
    filter_result match_host_rules(std::string_view host, ldns_rr_type qtype) const;
    filter_result check_safebrowsing(const filter::match_context &ctx) const;
    filter_result check_parental(const filter::match_context &ctx) const;
    filter_result check_safesearch(const std::string &host) const;
    filter_result match_blocked_services(std::string_view host, const std::vector<std::string> &ids) const;
};

bool is_filtered(const filter_result &result) {
    return std::visit(overloaded{
            [] (const verdict::not_filtered &) { return false; },
            [] (const verdict::whitelisted &) { return false; },
            [] (const verdict::blocked_by_list &) { return true; },
            [] (const verdict::blocked_by_safebrowsing &) { return true; },
            [] (const verdict::blocked_by_parental &) { return true; },
            [] (const verdict::blocked_by_safesearch &) { return true; },
            [] (const verdict::blocked_invalid &) { return true; },
            [] (const verdict::blocked_service &) { return true; },
            [] (const verdict::rewritten &) { return false; },
    }, result);
}

std::string_view verdict_name(const filter_result &result) {
    return std::visit(overloaded{
            [] (const verdict::not_filtered &) { return std::string_view("not_filtered"); },
            [] (const verdict::whitelisted &) { return std::string_view("whitelisted"); },
            [] (const verdict::blocked_by_list &) { return std::string_view("blocked_by_list"); },
            [] (const verdict::blocked_by_safebrowsing &) { return std::string_view("blocked_by_safebrowsing"); },
            [] (const verdict::blocked_by_parental &) { return std::string_view("blocked_by_parental"); },
            [] (const verdict::blocked_by_safesearch &) { return std::string_view("blocked_by_safesearch"); },
            [] (const verdict::blocked_invalid &) { return std::string_view("blocked_invalid"); },
            [] (const verdict::blocked_service &) { return std::string_view("blocked_service"); },
            [] (const verdict::rewritten &) { return std::string_view("rewritten"); },
    }, result);
}

std::string_view verdict_rule(const filter_result &result) {
    return std::visit(overloaded{
            [] (const verdict::not_filtered &) { return std::string_view{}; },
            [] (const verdict::whitelisted &v) { return std::string_view(v.rule); },
            [] (const verdict::blocked_by_list &v) { return std::string_view(v.rule); },
            [] (const verdict::blocked_by_safebrowsing &v) { return std::string_view(v.rule); },
            [] (const verdict::blocked_by_parental &v) { return std::string_view(v.rule); },
            [] (const verdict::blocked_by_safesearch &v) { return std::string_view(v.rule); },
            [] (const verdict::blocked_invalid &) { return std::string_view{}; },
            [] (const verdict::blocked_service &v) { return std::string_view(v.rule); },
            [] (const verdict::rewritten &) { return std::string_view{}; },
    }, result);
}

dnsfilter::dnsfilter()
    : m_impl(new impl{})
{}

dnsfilter::~dnsfilter() = default;

dnsfilter::create_result dnsfilter::create(const engine_params &p) {
    std::unique_ptr<dnsfilter> f(new dnsfilter);
    impl *e = f->m_impl.get();
    std::string warnings;
    hash_set<int32_t> ids;

    e->filters.reserve(p.filters.size());
    for (const filter_params &fp : p.filters) {
        filter flt;
        if (err_string err = flt.load(fp); err.has_value()) {
            auto msg = DG_FMT("Filter {} was not added because of an error: {}", fp.id, err.value());
            errlog(e->log, "{}", msg);
            return {nullptr, std::move(msg)};
        }
        infolog(e->log, "Filter {} added successfully ({} rules)", fp.id, flt.rules_count());
        if (!ids.insert(fp.id).second) {
            warnings += DG_FMT("Non unique filter id: {}\n", fp.id);
        }
        e->filters.emplace_back(std::move(flt));
    }

    for (const rewrite_entry &r : p.rewrites) {
        if (r.domain.empty() || r.answer.empty()) {
            warnings += DG_FMT("Incomplete rewrite entry: '{}' -> '{}'\n", r.domain, r.answer);
            continue;
        }
        e->rewrites.push_back({utils::to_lower(r.domain), utils::to_lower(r.answer)});
    }
    for (const std::string &d : p.safebrowsing_domains) {
        e->safebrowsing_domains.insert(utils::to_lower(d));
    }
    for (const std::string &d : p.parental_domains) {
        e->parental_domains.insert(utils::to_lower(d));
    }
    for (const rewrite_entry &s : p.safesearch) {
        e->safesearch[utils::to_lower(s.domain)] = s.answer;
    }

    for (const blocked_services::service &s : blocked_services::all()) {
        std::string rules;
        for (std::string_view rule : s.rules) {
            rules.append(rule).push_back('\n');
        }
        filter flt;
        if (err_string err = flt.load({SERVICES_FILTER_ID, std::move(rules), true}); err.has_value()) {
            warnings += DG_FMT("Rules of service {} were not loaded: {}\n", s.id, err.value());
            continue;
        }
        e->services.emplace(std::string(s.id), std::move(flt));
    }
    for (const std::string &id : p.blocked_services) {
        if (!is_known_service(id)) {
            warnings += DG_FMT("Unknown blocked service: {}\n", id);
            continue;
        }
        e->blocked_services.push_back(id);
    }

    if (!warnings.empty()) {
        warnlog(e->log, "Filters loaded with warnings:\n{}", warnings);
        return {std::move(f), std::move(warnings)};
    }
    return {std::move(f), std::nullopt};
}

std::vector<filter_rule> dnsfilter::match(std::string_view host) const {
    tracelog(m_impl->log, "Matching {}", host);

    filter::match_context context;
    filter::init_match_context(context, host);
    for (const filter &f : m_impl->filters) {
        f.match(context);
    }

    tracelog(m_impl->log, "Matched {} rules", context.matched_rules.size());
    return std::move(context.matched_rules);
}

// Return true if the left rule prevails over the right one
static bool has_higher_priority(const filter_rule *l, const filter_rule *r) {
    using props_set = std::bitset<RP_NUM>;

    // in ascending order (the higher index, the higher priority)
    static const props_set PRIORITY_TABLE[] = {
        {},
        { (1 << RP_EXCEPTION) },
        { (1 << RP_IMPORTANT) },
        { (1 << RP_IMPORTANT) | (1 << RP_EXCEPTION) },
    };

    if (l->props != r->props) {
        size_t lpriority = 0;
        size_t rpriority = 0;
        for (size_t i = 1; i < std::size(PRIORITY_TABLE); ++i) {
            const props_set &props = PRIORITY_TABLE[i];
            if ((l->props & props) == props) {
                lpriority = i;
            }
            if ((r->props & props) == props) {
                rpriority = i;
            }
        }
        if (lpriority != rpriority) {
            return lpriority > rpriority;
        }
    }

    // a rule with hosts file syntax has higher priority
    return l->ip.has_value() && !r->ip.has_value();
}

static std::vector<const filter_rule *> filter_out_by_badfilter(const std::vector<filter_rule> &rules) {
    std::vector<std::string> badfilter_texts;
    for (const filter_rule &r : rules) {
        if (r.props.test(RP_BADFILTER)) {
            badfilter_texts.emplace_back(rule_utils::get_text_without_badfilter(r));
        }
    }

    std::vector<const filter_rule *> result;
    result.reserve(rules.size());
    for (const filter_rule &r : rules) {
        if (r.props.test(RP_BADFILTER)) {
            continue;
        }
        if (badfilter_texts.end() == std::find(badfilter_texts.begin(), badfilter_texts.end(), r.text)) {
            result.push_back(&r);
        }
    }
    return result;
}

std::vector<const filter_rule *> dnsfilter::get_effective_rules(const std::vector<filter_rule> &rules) {
    std::vector<const filter_rule *> effective_rules = filter_out_by_badfilter(rules);
    if (effective_rules.empty()) {
        return effective_rules;
    }

    std::stable_sort(effective_rules.begin(), effective_rules.end(), has_higher_priority);

    const filter_rule *first = effective_rules[0];
    if (!first->ip.has_value() && !first->props.test(RP_EXCEPTION)) {
        // return only the first blocking adblock-style rule
        effective_rules.resize(1);
    } else {
        // return all exceptions or hosts-file-syntax rules
        auto last = std::adjacent_find(effective_rules.begin(), effective_rules.end(), has_higher_priority);
        if (last != effective_rules.end()) {
            last = std::next(last);
        }
        effective_rules.resize(std::distance(effective_rules.begin(), last));
    }

    return effective_rules;
}

bool dnsfilter::is_valid_rule(std::string_view str) {
    return rule_utils::parse(str).has_value();
}

bool dnsfilter::is_valid_hostname(std::string_view host) {
    if (host.empty() || host.length() > MAX_HOSTNAME_LENGTH) {
        return false;
    }
    bool valid_charset = host.cend() == std::find_if_not(host.cbegin(), host.cend(), [] (unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.';
    });
    if (!valid_charset) {
        return false;
    }
    std::vector<std::string_view> labels = utils::split_by(host, '.');
    // split_by skips empty parts, so `a..b` gives fewer labels than dots + 1
    if (labels.size() != (size_t) std::count(host.begin(), host.end(), '.') + 1) {
        return false;
    }
    return labels.cend() == std::find_if(labels.cbegin(), labels.cend(),
            [] (std::string_view l) { return l.length() > MAX_LABEL_LENGTH; });
}

static bool rewrite_matches(std::string_view domain, std::string_view host) {
    if (utils::starts_with(domain, "*.")) {
        std::string_view base = domain.substr(1);
        return host.length() > base.length() && utils::ends_with(host, base);
    }
    return domain == host;
}

// Entries of the exact domain win over wildcard ones
static std::vector<const dnsfilter::rewrite_entry *> find_rewrites(
        const std::vector<dnsfilter::rewrite_entry> &rewrites, std::string_view host) {
    std::vector<const dnsfilter::rewrite_entry *> exact;
    std::vector<const dnsfilter::rewrite_entry *> wildcard;
    for (const dnsfilter::rewrite_entry &r : rewrites) {
        if (r.domain == host) {
            exact.push_back(&r);
        } else if (rewrite_matches(r.domain, host)) {
            wildcard.push_back(&r);
        }
    }
    return !exact.empty() ? exact : wildcard;
}

filter_result dnsfilter::impl::process_rewrites(const std::string &host, ldns_rr_type qtype) const {
    std::string name = host;
    std::string canonical_name;

    std::vector<const rewrite_entry *> entries = find_rewrites(this->rewrites, name);
    for (const rewrite_entry *r : entries) {
        if (socket_address(r->answer, 0).valid()) {
            continue;
        }
        if (r->answer == r->domain) {
            // `sub.example.org -> sub.example.org` is an exception from wildcard rewrites
            return verdict::not_filtered{};
        }
        dbglog(log, "Rewrite: CNAME for {} is {}", name, r->answer);
        canonical_name = r->answer;
        name = r->answer;
        entries = find_rewrites(this->rewrites, name);
        break;
    }

    std::vector<std::string> ips;
    for (const rewrite_entry *r : entries) {
        socket_address addr(r->answer, 0);
        if (!addr.valid()) {
            continue;
        }
        if (qtype == LDNS_RR_TYPE_A && !addr.is_ipv6()) {
            dbglog(log, "Rewrite: A for {} is {}", name, r->answer);
            ips.emplace_back(addr.host_str());
        } else if (qtype == LDNS_RR_TYPE_AAAA && addr.is_ipv6()) {
            dbglog(log, "Rewrite: AAAA for {} is {}", name, r->answer);
            ips.emplace_back(addr.host_str());
        }
    }

    if (canonical_name.empty() && ips.empty()) {
        return verdict::not_filtered{};
    }
    return verdict::rewritten{std::move(canonical_name), std::move(ips)};
}

filter_result dnsfilter::impl::match_host_rules(std::string_view host, ldns_rr_type qtype) const {
    filter::match_context context;
    filter::init_match_context(context, host);
    for (const filter &f : this->filters) {
        f.match(context);
    }
    if (context.matched_rules.empty()) {
        return verdict::not_filtered{};
    }

    tracelog(log, "{} rules matched for host '{}'", context.matched_rules.size(), host);

    for (const filter_rule *rule : get_effective_rules(context.matched_rules)) {
        tracelog(log, "Found rule for host '{}': '{}' list_id: {}", host, rule->text, rule->filter_id);

        if (!rule->ip.has_value()) {
            if (rule->props.test(RP_EXCEPTION)) {
                return verdict::whitelisted{rule->text, rule->filter_id};
            }
            return verdict::blocked_by_list{rule->text, rule->filter_id, std::nullopt};
        }

        socket_address addr(rule->ip.value(), 0);
        if (qtype == LDNS_RR_TYPE_A && addr.is_ipv4()) {
            // either IPv4 or IPv4-mapped IPv6 address
            uint8_view v4 = addr.addr_unmapped();
            return verdict::blocked_by_list{rule->text, rule->filter_id,
                    socket_address(v4, 0).host_str()};
        }
        if (qtype == LDNS_RR_TYPE_AAAA) {
            if (!addr.is_ipv4()) {
                return verdict::blocked_by_list{rule->text, rule->filter_id, addr.host_str()};
            }
            uint8_view v4 = addr.addr_unmapped();
            if (std::all_of(v4.begin(), v4.end(), [] (uint8_t b) { return b == 0; })) {
                // send `::` for a rule `0.0.0.0 blockdomain`
                return verdict::blocked_by_list{rule->text, rule->filter_id, std::string("::")};
            }
        }
    }

    return verdict::not_filtered{};
}

static std::optional<std::string> find_in_domain_set(const hash_set<std::string> &set,
        const filter::match_context &ctx) {
    for (std::string_view d : ctx.subdomains) {
        if (auto it = set.find(std::string(d)); it != set.end()) {
            return *it;
        }
    }
    return std::nullopt;
}

filter_result dnsfilter::impl::check_safebrowsing(const filter::match_context &ctx) const {
    if (auto d = find_in_domain_set(this->safebrowsing_domains, ctx); d.has_value()) {
        dbglog(log, "SafeBrowsing: {} is blocked by {}", ctx.host, d.value());
        return verdict::blocked_by_safebrowsing{std::move(d.value())};
    }
    return verdict::not_filtered{};
}

filter_result dnsfilter::impl::check_parental(const filter::match_context &ctx) const {
    if (auto d = find_in_domain_set(this->parental_domains, ctx); d.has_value()) {
        dbglog(log, "Parental: {} is blocked by {}", ctx.host, d.value());
        return verdict::blocked_by_parental{std::move(d.value())};
    }
    return verdict::not_filtered{};
}

filter_result dnsfilter::impl::check_safesearch(const std::string &host) const {
    auto it = this->safesearch.find(host);
    if (it == this->safesearch.end()) {
        return verdict::not_filtered{};
    }
    dbglog(log, "SafeSearch: {} -> {}", host, it->second);
    return verdict::blocked_by_safesearch{it->first, it->second};
}

filter_result dnsfilter::impl::match_blocked_services(std::string_view host,
        const std::vector<std::string> &ids) const {
    filter::match_context ctx;
    filter::init_match_context(ctx, host);
    for (const std::string &id : ids) {
        auto it = this->services.find(id);
        if (it == this->services.end()) {
            continue;
        }
        it->second.match(ctx);
        if (!ctx.matched_rules.empty()) {
            dbglog(log, "Blocked services: {} matched rule '{}' of {}", host, ctx.matched_rules.front().text, id);
            return verdict::blocked_service{ctx.matched_rules.front().text, id};
        }
    }
    return verdict::not_filtered{};
}

bool dnsfilter::is_known_service(std::string_view id) {
    return blocked_services::find(id) != nullptr;
}

dnsfilter::check_result dnsfilter::check_host(std::string_view host_view, ldns_rr_type qtype,
        const client_settings &settings) {
    // sometimes DNS clients will try to resolve ".", which is a request to get root servers
    if (host_view.empty()) {
        return {verdict::not_filtered{}, std::nullopt};
    }
    std::string host = utils::to_lower(host_view);

    if (filter_result r = m_impl->process_rewrites(host, qtype); !std::holds_alternative<verdict::not_filtered>(r)) {
        return {std::move(r), std::nullopt};
    }

    if (settings.filtering_enabled) {
        if (!is_valid_hostname(host)) {
            dbglog(m_impl->log, "Invalid host name: {}", host);
            return {verdict::blocked_invalid{}, std::nullopt};
        }
        if (filter_result r = m_impl->match_host_rules(host, qtype);
                !std::holds_alternative<verdict::not_filtered>(r)) {
            return {std::move(r), std::nullopt};
        }
    }

    const std::vector<std::string> &services = settings.blocked_services.has_value()
            ? settings.blocked_services.value() : m_impl->blocked_services;
    if (!services.empty()) {
        if (filter_result r = m_impl->match_blocked_services(host, services);
                !std::holds_alternative<verdict::not_filtered>(r)) {
            return {std::move(r), std::nullopt};
        }
    }

    if (settings.safesearch_enabled) {
        if (filter_result r = m_impl->check_safesearch(host); !std::holds_alternative<verdict::not_filtered>(r)) {
            return {std::move(r), std::nullopt};
        }
    }

    filter::match_context ctx;
    filter::init_match_context(ctx, host);
    if (settings.safebrowsing_enabled) {
        if (filter_result r = m_impl->check_safebrowsing(ctx); !std::holds_alternative<verdict::not_filtered>(r)) {
            return {std::move(r), std::nullopt};
        }
    }
    if (settings.parental_enabled) {
        if (filter_result r = m_impl->check_parental(ctx); !std::holds_alternative<verdict::not_filtered>(r)) {
            return {std::move(r), std::nullopt};
        }
    }

    return {verdict::not_filtered{}, std::nullopt};
}

dnsfilter::check_result dnsfilter::check_response(const ldns_pkt *response, const client_settings &settings) {
    if (!settings.filtering_enabled || ldns_pkt_qdcount(response) == 0) {
        return {verdict::not_filtered{}, std::nullopt};
    }
    ldns_rr_type qtype = ldns_rr_get_type(ldns_rr_list_rr(ldns_pkt_question(response), 0));

    ldns_rr_list *answer = ldns_pkt_answer(response);
    for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
        const ldns_rr *rr = ldns_rr_list_rr(answer, i);
        ldns_rr_type type = ldns_rr_get_type(rr);
        if (type != LDNS_RR_TYPE_CNAME && type != LDNS_RR_TYPE_A && type != LDNS_RR_TYPE_AAAA) {
            continue;
        }
        if (ldns_rr_rd_count(rr) == 0) {
            continue;
        }
        allocated_ptr<char> str(ldns_rdf2str(ldns_rr_rdf(rr, 0)));
        if (str == nullptr) {
            continue;
        }
        std::string_view host = str.get();
        if (type == LDNS_RR_TYPE_CNAME && utils::ends_with(host, ".")) {
            host.remove_suffix(1);
        }
        dbglog(m_impl->log, "Checking record {} ({})",
                (type == LDNS_RR_TYPE_CNAME) ? "CNAME" : ((type == LDNS_RR_TYPE_A) ? "A" : "AAAA"), host);

        filter_result r = m_impl->match_host_rules(host, qtype);
        if (is_filtered(r)) {
            dbglog(m_impl->log, "Matched by response: {}", host);
            return {std::move(r), std::nullopt};
        }
    }

    return {verdict::not_filtered{}, std::nullopt};
}

} // namespace dg
