#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <dg_defs.h>
#include <dg_file.h>
#include <dg_logger.h>
#include <dg_regex.h>
#include <dg_utils.h>
#include "filter.h"

namespace dg {

static constexpr size_t SHORTCUT_LENGTH = 5;

class filter::impl {
public:
    void put_in_domains_table(std::string_view domain, uint32_t idx) {
        domains_table[std::string(domain)].push_back(idx);
    }

    void process_string(std::string_view str);

    static bool load_line(uint32_t, std::string_view line, void *arg) {
        auto *f = (filter::impl *) arg;
        f->process_string(line);
        return true;
    }

    bool match_rule(const match_context &ctx, uint32_t idx) const;
    void add_matched(match_context &ctx, uint32_t idx) const;

    void search_by_domains(match_context &ctx, hash_set<uint32_t> &checked) const;
    void search_by_shortcuts(match_context &ctx, hash_set<uint32_t> &checked) const;
    void search_in_leftovers(match_context &ctx, hash_set<uint32_t> &checked) const;
    void search_badfilter_rules(match_context &ctx, size_t matched_start) const;

    logger log;

    struct rule_entry {
        rule_utils::rule rule;
        std::optional<dg::regex> regex; // compiled regex for regex-based rules
    };
    std::vector<rule_entry> rules;

    // domain -> indexes of the rules that match exact domains (and their subdomains)
    // (e.g. `example.org`, but for example not `example.org|` or `example.org^` as they
    // match `eeexample.org` as well)
    hash_map<std::string, std::vector<uint32_t>> domains_table;

    // shortcut -> indexes of the rules that can be filtered out by checking
    // if matching domain contains the shortcut
    hash_map<std::string, std::vector<uint32_t>> shortcuts_table;

    // Indexes of the rules that are not fitting to place in domains and shortcuts tables
    // due to they are any of:
    // - a regex rule for which the shortcut at least with length `SHORTCUT_LENGTH` was not found
    //   (e.g. `/ex.*\.com/`)
    // - a rule with special symbol for which the shortcut at least with length `SHORTCUT_LENGTH`
    //   was not found (e.g. `ex*.com`)
    std::vector<uint32_t> leftovers_table;

    // rule text without `badfilter` modifier -> badfilter rule index
    hash_map<std::string, uint32_t> badfilter_table;
};

filter::filter()
    : m_pimpl(new impl{})
{}

filter::~filter() = default;

filter::filter(filter &&other) noexcept = default;

filter &filter::operator=(filter &&other) noexcept = default;

size_t filter::rules_count() const {
    return m_pimpl->rules.size();
}

void filter::impl::process_string(std::string_view str) {
    std::optional<rule_utils::rule> rule = rule_utils::parse(str, &log);
    if (!rule.has_value()) {
        if (!str.empty() && !rule_utils::is_comment(str)) {
            dbglog(log, "Failed to parse rule: {}", str);
        }
        return;
    }

    auto idx = (uint32_t) this->rules.size();

    if (rule->public_part.props.test(RP_BADFILTER)) {
        this->badfilter_table[rule_utils::get_text_without_badfilter(rule->public_part)] = idx;
        tracelog(log, "Rule placed in badfilter table: {}", str);
        this->rules.push_back({std::move(rule.value()), std::nullopt});
        return;
    }

    std::optional<dg::regex> re;
    if (rule->match_method == rule_utils::rule::MMID_REGEX
            || rule->match_method == rule_utils::rule::MMID_SHORTCUTS_AND_REGEX) {
        re.emplace(rule_utils::get_regex(rule.value()));
    }

    switch (rule->match_method) {
    case rule_utils::rule::MMID_EXACT:
    case rule_utils::rule::MMID_SUBDOMAINS:
        tracelog(log, "Placing a rule in domains table: {}", str);
        for (const std::string &d : rule->matching_parts) {
            put_in_domains_table(d, idx);
        }
        break;
    case rule_utils::rule::MMID_SHORTCUTS:
    case rule_utils::rule::MMID_SHORTCUTS_AND_REGEX: {
        auto sc = std::find_if(rule->matching_parts.begin(), rule->matching_parts.end(),
                [] (const std::string &part) { return part.length() >= SHORTCUT_LENGTH; });
        if (sc != rule->matching_parts.end()) {
            tracelog(log, "Placing a rule in shortcuts table: {}", str);
            this->shortcuts_table[sc->substr(0, SHORTCUT_LENGTH)].push_back(idx);
            break;
        }
        [[fallthrough]];
    }
    case rule_utils::rule::MMID_REGEX:
        tracelog(log, "Rule placed in leftovers table: {}", str);
        this->leftovers_table.push_back(idx);
        break;
    }

    this->rules.push_back({std::move(rule.value()), std::move(re)});
}

err_string filter::load(const dnsfilter::filter_params &p) {
    std::string logger_name = p.in_memory
            ? DG_FMT("filter::{}", p.id)
            : DG_FMT("filter::{}::{}", p.id, utils::rsplit2_by(p.data, '/')[1].empty()
                                            ? std::string_view(p.data)
                                            : utils::rsplit2_by(p.data, '/')[1]);
    m_pimpl->log = create_logger(logger_name);

    if (p.in_memory) {
        for (std::string_view line : utils::split_by_any_of(p.data, "\r\n")) {
            m_pimpl->process_string(line);
        }
    } else {
        file::handle fd = file::open(p.data, file::RDONLY);
        if (!file::is_valid(fd)) {
            return DG_FMT("Failed to read file: {} ({})", p.data, std::strerror(errno));
        }
        int rc = file::for_each_line(fd, &filter::impl::load_line, m_pimpl.get());
        file::close(fd);
        if (rc != 0) {
            return DG_FMT("Failed to read file: {} ({})", p.data, std::strerror(errno));
        }
    }

    this->params = p;

    dbglog(m_pimpl->log, "Rules loaded: {}", m_pimpl->rules.size());
    dbglog(m_pimpl->log, "Domains table size: {}", m_pimpl->domains_table.size());
    dbglog(m_pimpl->log, "Shortcuts table size: {}", m_pimpl->shortcuts_table.size());
    dbglog(m_pimpl->log, "Leftovers table size: {}", m_pimpl->leftovers_table.size());
    dbglog(m_pimpl->log, "Badfilter table size: {}", m_pimpl->badfilter_table.size());

    return std::nullopt;
}

static inline bool match_shortcuts(const std::vector<std::string> &shortcuts, std::string_view domain) {
    size_t seek = 0;
    for (const std::string &sc : shortcuts) {
        size_t pos = domain.find(sc, seek);
        if (pos == domain.npos) {
            return false;
        }
        seek = pos + sc.length();
    }
    return true;
}

bool filter::impl::match_rule(const match_context &ctx, uint32_t idx) const {
    const rule_entry &entry = this->rules[idx];
    const rule_utils::rule &rule = entry.rule;

    if (rule.public_part.props.test(RP_BADFILTER)) {
        return true;
    }

    switch (rule.match_method) {
    case rule_utils::rule::MMID_EXACT:
        return rule.matching_parts.cend() != std::find(rule.matching_parts.cbegin(), rule.matching_parts.cend(),
                ctx.host);
    case rule_utils::rule::MMID_SUBDOMAINS:
        for (const std::string &part : rule.matching_parts) {
            // `subdomains` also contains the full host
            for (std::string_view subdomain : ctx.subdomains) {
                if (subdomain == part) {
                    return true;
                }
            }
        }
        return false;
    case rule_utils::rule::MMID_SHORTCUTS:
        return match_shortcuts(rule.matching_parts, ctx.host);
    case rule_utils::rule::MMID_SHORTCUTS_AND_REGEX:
        return match_shortcuts(rule.matching_parts, ctx.host)
                && entry.regex.has_value() && entry.regex->match(ctx.host);
    case rule_utils::rule::MMID_REGEX:
        if (!entry.regex.has_value()) {
            return false;
        }
        return ctx.subdomains.cend() != std::find_if(ctx.subdomains.cbegin(), ctx.subdomains.cend(),
                [&entry] (std::string_view subdomain) { return entry.regex->match(subdomain); });
    }

    return false;
}

void filter::impl::add_matched(match_context &ctx, uint32_t idx) const {
    if (match_rule(ctx, idx)) {
        const filter_rule &r = this->rules[idx].rule.public_part;
        dbglog(log, "Domain '{}' matched against rule '{}'", ctx.host, r.text);
        ctx.matched_rules.push_back(r);
    }
}

void filter::impl::search_by_domains(match_context &ctx, hash_set<uint32_t> &checked) const {
    for (std::string_view domain : ctx.subdomains) {
        auto iter = this->domains_table.find(std::string(domain));
        if (iter == this->domains_table.end()) {
            continue;
        }
        for (uint32_t idx : iter->second) {
            if (checked.insert(idx).second) {
                add_matched(ctx, idx);
            }
        }
    }
}

void filter::impl::search_by_shortcuts(match_context &ctx, hash_set<uint32_t> &checked) const {
    if (ctx.host.length() < SHORTCUT_LENGTH) {
        return;
    }

    for (size_t i = 0; i <= ctx.host.length() - SHORTCUT_LENGTH; ++i) {
        auto iter = this->shortcuts_table.find(ctx.host.substr(i, SHORTCUT_LENGTH));
        if (iter == this->shortcuts_table.end()) {
            continue;
        }
        for (uint32_t idx : iter->second) {
            if (checked.insert(idx).second) {
                add_matched(ctx, idx);
            }
        }
    }
}

void filter::impl::search_in_leftovers(match_context &ctx, hash_set<uint32_t> &checked) const {
    for (uint32_t idx : this->leftovers_table) {
        if (checked.insert(idx).second) {
            add_matched(ctx, idx);
        }
    }
}

void filter::impl::search_badfilter_rules(match_context &ctx, size_t matched_start) const {
    size_t matched_end = ctx.matched_rules.size();
    for (size_t i = matched_start; i < matched_end; ++i) {
        auto iter = this->badfilter_table.find(ctx.matched_rules[i].text);
        if (iter != this->badfilter_table.end()) {
            ctx.matched_rules.push_back(this->rules[iter->second].rule.public_part);
        }
    }
}

void filter::match(match_context &ctx) const {
    size_t matched_rule_pos = ctx.matched_rules.size();
    hash_set<uint32_t> checked;

    m_pimpl->search_by_domains(ctx, checked);
    m_pimpl->search_by_shortcuts(ctx, checked);
    m_pimpl->search_in_leftovers(ctx, checked);
    m_pimpl->search_badfilter_rules(ctx, matched_rule_pos);

    for (; matched_rule_pos < ctx.matched_rules.size(); ++matched_rule_pos) {
        ctx.matched_rules[matched_rule_pos].filter_id = this->params.id;
    }
}

void filter::init_match_context(match_context &ctx, std::string_view host) {
    ctx.host = utils::to_lower(host);
    ctx.subdomains.clear();

    size_t n = std::count(ctx.host.begin(), ctx.host.end(), '.');
    if (n > 0) {
        // all except tld
        --n;
    }

    ctx.subdomains.reserve(n + 1);
    ctx.subdomains.emplace_back(ctx.host);
    for (size_t i = 0; i < n; ++i) {
        std::array<std::string_view, 2> parts = utils::split2_by(ctx.subdomains[i], '.');
        ctx.subdomains.emplace_back(parts[1]);
    }
}

} // namespace dg
