#include <cstdio>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <ldns/ldns.h>
#include <dg_dns_utils.h>
#include <dg_logger.h>
#include <dnsfilter.h>
#include "rule_utils.h"

using namespace dg;

static struct init {
    init() {
        dg::set_default_log_level(dg::TRACE);
    }
} _;

static std::unique_ptr<dnsfilter> create_filter(const std::vector<std::string> &rules,
        dnsfilter::engine_params params = {}) {
    std::string data;
    for (const std::string &r : rules) {
        data += r;
        data += "\r\n";
    }
    params.filters.push_back({10, std::move(data), true});
    auto [filter, err_or_warn] = dnsfilter::create(params);
    EXPECT_TRUE(filter != nullptr) << err_or_warn.value_or("");
    return std::move(filter);
}

static filter_result check(dnsfilter &filter, std::string_view host, ldns_rr_type qtype = LDNS_RR_TYPE_A,
        client_settings settings = {}) {
    auto [result, error] = filter.check_host(host, qtype, settings);
    EXPECT_FALSE(error.has_value()) << error.value();
    return std::move(result);
}

TEST(rule_parsing, successful) {
    struct test_data {
        std::string text;
        rule_utils::rule::match_method_id method;
        std::bitset<RP_NUM> props;
    };

    const test_data TEST_DATA[] = {
            {"example.org", rule_utils::rule::MMID_SUBDOMAINS, {}},
            {"||example.org^", rule_utils::rule::MMID_SUBDOMAINS, {}},
            {"|example.org^", rule_utils::rule::MMID_EXACT, {}},
            {"ads*.example.org", rule_utils::rule::MMID_SHORTCUTS, {}},
            {"/ex.*\\.com/", rule_utils::rule::MMID_SHORTCUTS_AND_REGEX, {}},
            {"||example.org", rule_utils::rule::MMID_SHORTCUTS_AND_REGEX, {}},
            {"1.2.3.4", rule_utils::rule::MMID_EXACT, {}},
            {"@@example.org", rule_utils::rule::MMID_SUBDOMAINS, {1 << RP_EXCEPTION}},
            {"example.org$important", rule_utils::rule::MMID_SUBDOMAINS, {1 << RP_IMPORTANT}},
            {"@@||example.org^$important", rule_utils::rule::MMID_SUBDOMAINS,
                    {(1 << RP_EXCEPTION) | (1 << RP_IMPORTANT)}},
    };

    for (const test_data &entry : TEST_DATA) {
        std::optional<rule_utils::rule> rule = rule_utils::parse(entry.text);
        ASSERT_TRUE(rule.has_value()) << entry.text;
        ASSERT_EQ(rule->match_method, entry.method) << entry.text;
        ASSERT_EQ(rule->public_part.props, entry.props) << entry.text;
        ASSERT_EQ(rule->public_part.text, entry.text);
        ASSERT_FALSE(rule->public_part.ip.has_value());
    }
}

TEST(rule_parsing, hosts_syntax) {
    std::optional<rule_utils::rule> rule = rule_utils::parse("0.0.0.0 ads.example  WWW.ads.example # trackers");
    ASSERT_TRUE(rule.has_value());
    ASSERT_EQ(rule->match_method, rule_utils::rule::MMID_EXACT);
    ASSERT_EQ(rule->public_part.ip, "0.0.0.0");
    ASSERT_EQ(rule->matching_parts, (std::vector<std::string>{"ads.example", "www.ads.example"}));

    rule = rule_utils::parse("::1 localhost");
    ASSERT_TRUE(rule.has_value());
    ASSERT_EQ(rule->public_part.ip, "::1");
}

TEST(rule_parsing, wrong) {
    const std::string TEST_DATA[] = {
            "",
            "! comment",
            "# comment",
            "*",
            "||*^",
            "example.org$unknown",
            "example.org$important,important",
            "exa mple.org",
            "/[/",
            "0.0.0.0 bad!host.example",
    };

    for (const std::string &text : TEST_DATA) {
        ASSERT_FALSE(rule_utils::parse(text).has_value()) << text;
        ASSERT_FALSE(dnsfilter::is_valid_rule(text)) << text;
    }
}

TEST(rule_parsing, badfilter_text) {
    filter_rule r = {0, "||example.org^$important,badfilter", {}, std::nullopt};
    ASSERT_EQ(rule_utils::get_text_without_badfilter(r), "||example.org^$important");
    r.text = "||example.org^$badfilter";
    ASSERT_EQ(rule_utils::get_text_without_badfilter(r), "||example.org^");
}

TEST(dnsfilter_test, blocks_domain_and_subdomains) {
    auto filter = create_filter({"||ads.example^"});
    ASSERT_NE(filter, nullptr);

    auto result = check(*filter, "ads.example");
    const auto *blocked = std::get_if<verdict::blocked_by_list>(&result);
    ASSERT_NE(blocked, nullptr);
    ASSERT_EQ(blocked->rule, "||ads.example^");
    ASSERT_EQ(blocked->filter_id, 10);
    ASSERT_FALSE(blocked->ip.has_value());

    ASSERT_TRUE(is_filtered(check(*filter, "sub.ads.example")));
    ASSERT_TRUE(is_filtered(check(*filter, "ADS.Example")));
    ASSERT_FALSE(is_filtered(check(*filter, "notads.example")));
    ASSERT_FALSE(is_filtered(check(*filter, "example")));
}

TEST(dnsfilter_test, exact_rule_skips_subdomains) {
    auto filter = create_filter({"|exact.example^"});
    ASSERT_NE(filter, nullptr);
    ASSERT_TRUE(is_filtered(check(*filter, "exact.example")));
    ASSERT_FALSE(is_filtered(check(*filter, "sub.exact.example")));
}

TEST(dnsfilter_test, exception_wins_over_blocking_rule) {
    auto filter = create_filter({"||example.org^", "@@||safe.example.org^"});
    ASSERT_NE(filter, nullptr);

    auto result = check(*filter, "safe.example.org");
    const auto *white = std::get_if<verdict::whitelisted>(&result);
    ASSERT_NE(white, nullptr);
    ASSERT_EQ(white->rule, "@@||safe.example.org^");
    ASSERT_EQ(verdict_name(result), "whitelisted");
    ASSERT_EQ(verdict_rule(result), "@@||safe.example.org^");

    ASSERT_TRUE(is_filtered(check(*filter, "other.example.org")));
}

TEST(dnsfilter_test, important_wins_over_exception) {
    auto filter = create_filter({"||example.org^$important", "@@||example.org^"});
    ASSERT_NE(filter, nullptr);
    ASSERT_TRUE(std::holds_alternative<verdict::blocked_by_list>(check(*filter, "example.org")));
}

TEST(dnsfilter_test, badfilter_disables_rule) {
    auto filter = create_filter({"||example.org^", "||example.org^$badfilter", "||other.org^"});
    ASSERT_NE(filter, nullptr);
    ASSERT_FALSE(is_filtered(check(*filter, "example.org")));
    ASSERT_TRUE(is_filtered(check(*filter, "other.org")));
}

TEST(dnsfilter_test, wildcard_and_regex_rules) {
    auto filter = create_filter({"ads*.example.org", "/^ad[0-9]+\\.example\\.com$/"});
    ASSERT_NE(filter, nullptr);

    ASSERT_TRUE(is_filtered(check(*filter, "ads1.example.org")));
    ASSERT_FALSE(is_filtered(check(*filter, "news.example.net")));
    ASSERT_TRUE(is_filtered(check(*filter, "ad12.example.com")));
    ASSERT_FALSE(is_filtered(check(*filter, "ad.example.com")));
}

TEST(dnsfilter_test, hosts_rules_answer_by_query_type) {
    auto filter = create_filter({
            "1.2.3.4 hosts.example",
            "0.0.0.0 zero.example",
            "::1 six.example",
    });
    ASSERT_NE(filter, nullptr);

    auto result = check(*filter, "hosts.example", LDNS_RR_TYPE_A);
    const auto *blocked = std::get_if<verdict::blocked_by_list>(&result);
    ASSERT_NE(blocked, nullptr);
    ASSERT_EQ(blocked->ip, "1.2.3.4");

    // no IPv6 address for this host
    ASSERT_FALSE(is_filtered(check(*filter, "hosts.example", LDNS_RR_TYPE_AAAA)));
    // hosts rules match exact names only
    ASSERT_FALSE(is_filtered(check(*filter, "sub.hosts.example", LDNS_RR_TYPE_A)));

    result = check(*filter, "zero.example", LDNS_RR_TYPE_AAAA);
    blocked = std::get_if<verdict::blocked_by_list>(&result);
    ASSERT_NE(blocked, nullptr);
    ASSERT_EQ(blocked->ip, "::");

    result = check(*filter, "six.example", LDNS_RR_TYPE_AAAA);
    blocked = std::get_if<verdict::blocked_by_list>(&result);
    ASSERT_NE(blocked, nullptr);
    ASSERT_EQ(blocked->ip, "::1");

    ASSERT_FALSE(is_filtered(check(*filter, "hosts.example", LDNS_RR_TYPE_TXT)));
}

TEST(dnsfilter_test, effective_rules_keep_all_hosts_rules) {
    auto filter = create_filter({"1.2.3.4 multi.example", "::2 multi.example", "multi.example"});
    ASSERT_NE(filter, nullptr);

    std::vector<filter_rule> rules = filter->match("multi.example");
    ASSERT_EQ(rules.size(), 3u);
    std::vector<const filter_rule *> effective = dnsfilter::get_effective_rules(rules);
    ASSERT_EQ(effective.size(), 2u);
    for (const filter_rule *r : effective) {
        ASSERT_TRUE(r->ip.has_value());
    }
}

TEST(dnsfilter_test, invalid_hostname_is_blocked) {
    auto filter = create_filter({});
    ASSERT_NE(filter, nullptr);

    ASSERT_TRUE(std::holds_alternative<verdict::blocked_invalid>(check(*filter, "bad host.example")));
    ASSERT_TRUE(std::holds_alternative<verdict::blocked_invalid>(check(*filter, "a..b")));
    ASSERT_TRUE(std::holds_alternative<verdict::not_filtered>(check(*filter, "_dmarc.example.org")));
    ASSERT_TRUE(std::holds_alternative<verdict::not_filtered>(check(*filter, "")));
}

TEST(dnsfilter_test, disabled_filtering_skips_rules) {
    auto filter = create_filter({"||ads.example^"});
    ASSERT_NE(filter, nullptr);

    client_settings settings;
    settings.filtering_enabled = false;
    ASSERT_FALSE(is_filtered(check(*filter, "ads.example", LDNS_RR_TYPE_A, settings)));
}

TEST(dnsfilter_test, rewrites) {
    dnsfilter::engine_params params;
    params.rewrites = {
            {"rewrite.example", "1.2.3.4"},
            {"rewrite.example", "::1"},
            {"alias.example", "rewrite.example"},
            {"cname.example", "real.example"},
            {"*.wild.example", "10.0.0.1"},
            {"sub.wild.example", "sub.wild.example"},
    };
    auto filter = create_filter({"||rewrite.example^"}, std::move(params));
    ASSERT_NE(filter, nullptr);

    auto result = check(*filter, "rewrite.example", LDNS_RR_TYPE_A);
    const auto *rw = std::get_if<verdict::rewritten>(&result);
    ASSERT_NE(rw, nullptr);
    ASSERT_TRUE(rw->canonical_name.empty());
    ASSERT_EQ(rw->ips, (std::vector<std::string>{"1.2.3.4"}));

    result = check(*filter, "rewrite.example", LDNS_RR_TYPE_AAAA);
    rw = std::get_if<verdict::rewritten>(&result);
    ASSERT_NE(rw, nullptr);
    ASSERT_EQ(rw->ips, (std::vector<std::string>{"::1"}));

    result = check(*filter, "alias.example", LDNS_RR_TYPE_A);
    rw = std::get_if<verdict::rewritten>(&result);
    ASSERT_NE(rw, nullptr);
    ASSERT_EQ(rw->canonical_name, "rewrite.example");
    ASSERT_EQ(rw->ips, (std::vector<std::string>{"1.2.3.4"}));

    result = check(*filter, "cname.example", LDNS_RR_TYPE_A);
    rw = std::get_if<verdict::rewritten>(&result);
    ASSERT_NE(rw, nullptr);
    ASSERT_EQ(rw->canonical_name, "real.example");
    ASSERT_TRUE(rw->ips.empty());

    result = check(*filter, "a.wild.example", LDNS_RR_TYPE_A);
    rw = std::get_if<verdict::rewritten>(&result);
    ASSERT_NE(rw, nullptr);
    ASSERT_EQ(rw->ips, (std::vector<std::string>{"10.0.0.1"}));

    ASSERT_TRUE(std::holds_alternative<verdict::not_filtered>(check(*filter, "sub.wild.example")));
    ASSERT_TRUE(std::holds_alternative<verdict::not_filtered>(check(*filter, "wild.example")));
    // no address of the requested family, so filter lists take over
    ASSERT_TRUE(is_filtered(check(*filter, "rewrite.example", LDNS_RR_TYPE_TXT)));
}

TEST(dnsfilter_test, safety_checks_follow_client_settings) {
    dnsfilter::engine_params params;
    params.safebrowsing_domains = {"malware.example"};
    params.parental_domains = {"adult.example"};
    params.safesearch = {{"www.search.example", "safe.search.example"}, {"search.example", "10.1.1.1"}};
    auto filter = create_filter({}, std::move(params));
    ASSERT_NE(filter, nullptr);

    ASSERT_FALSE(is_filtered(check(*filter, "sub.malware.example")));
    ASSERT_FALSE(is_filtered(check(*filter, "adult.example")));
    ASSERT_FALSE(is_filtered(check(*filter, "search.example")));

    client_settings settings;
    settings.safebrowsing_enabled = true;
    settings.parental_enabled = true;
    settings.safesearch_enabled = true;

    auto result = check(*filter, "sub.malware.example", LDNS_RR_TYPE_A, settings);
    ASSERT_TRUE(std::holds_alternative<verdict::blocked_by_safebrowsing>(result));
    ASSERT_EQ(verdict_rule(result), "malware.example");

    ASSERT_TRUE(std::holds_alternative<verdict::blocked_by_parental>(
            check(*filter, "adult.example", LDNS_RR_TYPE_A, settings)));

    result = check(*filter, "www.search.example", LDNS_RR_TYPE_A, settings);
    const auto *ss = std::get_if<verdict::blocked_by_safesearch>(&result);
    ASSERT_NE(ss, nullptr);
    ASSERT_EQ(ss->replacement, "safe.search.example");

    result = check(*filter, "search.example", LDNS_RR_TYPE_A, settings);
    ss = std::get_if<verdict::blocked_by_safesearch>(&result);
    ASSERT_NE(ss, nullptr);
    ASSERT_EQ(ss->replacement, "10.1.1.1");
}

static ldns_pkt_ptr make_response(const std::vector<std::string> &answers) {
    ldns_pkt_ptr pkt{ldns_pkt_query_new(ldns_dname_new_frm_str("www.example.org."), LDNS_RR_TYPE_A,
            LDNS_RR_CLASS_IN, LDNS_RD)};
    ldns_pkt_set_qr(pkt.get(), true);
    for (const std::string &a : answers) {
        ldns_rr *rr = nullptr;
        EXPECT_EQ(LDNS_STATUS_OK, ldns_rr_new_frm_str(&rr, a.c_str(), 0, nullptr, nullptr)) << a;
        ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_ANSWER, rr);
    }
    return pkt;
}

TEST(dnsfilter_test, response_check_covers_cnames_and_addresses) {
    auto filter = create_filter({"||tracker.example^", "5.6.7.8"});
    ASSERT_NE(filter, nullptr);

    auto response = make_response({
            "www.example.org. 60 IN CNAME tracker.example.",
            "tracker.example. 60 IN A 10.0.0.1",
    });
    auto [result, error] = filter->check_response(response.get(), {});
    ASSERT_FALSE(error.has_value());
    const auto *blocked = std::get_if<verdict::blocked_by_list>(&result);
    ASSERT_NE(blocked, nullptr);
    ASSERT_EQ(blocked->rule, "||tracker.example^");

    response = make_response({"www.example.org. 60 IN A 5.6.7.8"});
    std::tie(result, error) = filter->check_response(response.get(), {});
    ASSERT_TRUE(is_filtered(result));

    response = make_response({"www.example.org. 60 IN A 10.0.0.2"});
    std::tie(result, error) = filter->check_response(response.get(), {});
    ASSERT_TRUE(std::holds_alternative<verdict::not_filtered>(result));

    client_settings settings;
    settings.filtering_enabled = false;
    response = make_response({"www.example.org. 60 IN A 5.6.7.8"});
    std::tie(result, error) = filter->check_response(response.get(), settings);
    ASSERT_FALSE(is_filtered(result));
}

TEST(dnsfilter_test, file_based_filter) {
    const std::string file_name = "dnsfilter_test.txt";
    {
        std::ofstream out(file_name);
        out << "! title\n||file.example^\r\n@@||ok.file.example^\n0.0.0.0 hosts.file.example";
    }

    dnsfilter::engine_params params;
    params.filters.push_back({7, file_name, false});
    auto [filter, err_or_warn] = dnsfilter::create(params);
    std::remove(file_name.c_str());
    ASSERT_NE(filter, nullptr) << err_or_warn.value_or("");

    auto result = check(*filter, "a.file.example");
    const auto *blocked = std::get_if<verdict::blocked_by_list>(&result);
    ASSERT_NE(blocked, nullptr);
    ASSERT_EQ(blocked->filter_id, 7);
    ASSERT_TRUE(std::holds_alternative<verdict::whitelisted>(check(*filter, "ok.file.example")));
    // the last line has no line break
    result = check(*filter, "hosts.file.example");
    blocked = std::get_if<verdict::blocked_by_list>(&result);
    ASSERT_NE(blocked, nullptr);
    ASSERT_EQ(blocked->ip, "0.0.0.0");
}

TEST(dnsfilter_test, missing_file_fails_creation) {
    dnsfilter::engine_params params;
    params.filters.push_back({1, "/nonexistent/dnsfilter.txt", false});
    auto [filter, err] = dnsfilter::create(params);
    ASSERT_EQ(filter, nullptr);
    ASSERT_TRUE(err.has_value());
}

TEST(dnsfilter_test, duplicate_filter_ids_give_warning) {
    dnsfilter::engine_params params;
    params.filters.push_back({1, "||a.example^", true});
    params.filters.push_back({1, "||b.example^", true});
    auto [filter, warn] = dnsfilter::create(params);
    ASSERT_NE(filter, nullptr);
    ASSERT_TRUE(warn.has_value());
}

TEST(dnsfilter_test, client_blocked_services) {
    auto filter = create_filter({"||ads.example^"});
    ASSERT_NE(filter, nullptr);

    client_settings settings;
    settings.blocked_services = {"youtube", "tiktok"};
    auto result = check(*filter, "www.youtube.com", LDNS_RR_TYPE_A, settings);
    const auto *service = std::get_if<verdict::blocked_service>(&result);
    ASSERT_NE(service, nullptr);
    ASSERT_EQ(service->service, "youtube");
    ASSERT_EQ(service->rule, "||youtube.com^");
    ASSERT_TRUE(is_filtered(result));
    ASSERT_EQ(verdict_name(result), "blocked_service");
    ASSERT_EQ(verdict_rule(result), "||youtube.com^");

    result = check(*filter, "v16.tiktokcdn.com", LDNS_RR_TYPE_AAAA, settings);
    service = std::get_if<verdict::blocked_service>(&result);
    ASSERT_NE(service, nullptr);
    ASSERT_EQ(service->service, "tiktok");

    ASSERT_FALSE(is_filtered(check(*filter, "netflix.com", LDNS_RR_TYPE_A, settings)));
    ASSERT_FALSE(is_filtered(check(*filter, "notyoutube.com", LDNS_RR_TYPE_A, settings)));
    // without the list, the service is not blocked
    ASSERT_FALSE(is_filtered(check(*filter, "www.youtube.com")));
}

TEST(dnsfilter_test, global_blocked_services) {
    dnsfilter::engine_params params;
    params.blocked_services = {"netflix"};
    auto filter = create_filter({}, params);
    ASSERT_NE(filter, nullptr);

    ASSERT_TRUE(std::holds_alternative<verdict::blocked_service>(check(*filter, "api.netflix.com")));

    // the client list replaces the global one
    client_settings settings;
    settings.blocked_services = {"youtube"};
    ASSERT_FALSE(is_filtered(check(*filter, "api.netflix.com", LDNS_RR_TYPE_A, settings)));
    settings.blocked_services = std::vector<std::string>{};
    ASSERT_FALSE(is_filtered(check(*filter, "api.netflix.com", LDNS_RR_TYPE_A, settings)));

    // services are blocked even when rule filtering is off
    settings = {};
    settings.filtering_enabled = false;
    ASSERT_TRUE(is_filtered(check(*filter, "api.netflix.com", LDNS_RR_TYPE_A, settings)));
}

TEST(dnsfilter_test, exception_rule_unblocks_service) {
    auto filter = create_filter({"@@||music.youtube.com^"});
    ASSERT_NE(filter, nullptr);

    client_settings settings;
    settings.blocked_services = {"youtube"};
    ASSERT_TRUE(std::holds_alternative<verdict::whitelisted>(
            check(*filter, "music.youtube.com", LDNS_RR_TYPE_A, settings)));
    ASSERT_TRUE(std::holds_alternative<verdict::blocked_service>(
            check(*filter, "youtube.com", LDNS_RR_TYPE_A, settings)));
}

TEST(dnsfilter_test, unknown_blocked_service_gives_warning) {
    ASSERT_TRUE(dnsfilter::is_known_service("youtube"));
    ASSERT_FALSE(dnsfilter::is_known_service("myspace"));

    dnsfilter::engine_params params;
    params.blocked_services = {"myspace", "reddit"};
    auto [filter, warn] = dnsfilter::create(params);
    ASSERT_NE(filter, nullptr);
    ASSERT_TRUE(warn.has_value());
    ASSERT_NE(warn->find("myspace"), std::string::npos);
    ASSERT_TRUE(is_filtered(check(*filter, "old.reddit.com")));
}
