#include <gtest/gtest.h>
#include "../config.h"

using namespace dg;

TEST(config, empty_document_gives_defaults) {
    auto [conf, err] = app::config::load("");
    ASSERT_TRUE(conf.has_value()) << err.value_or("");
    const dnsproxy_settings &defaults = dnsproxy_settings::get_default();
    ASSERT_EQ(defaults.upstreams.size(), conf->proxy.upstreams.size());
    ASSERT_EQ(defaults.dns_cache_size, conf->proxy.dns_cache_size);
    ASSERT_EQ(dnsproxy_blocking_mode::DEFAULT, conf->proxy.blocking_mode);
    ASSERT_EQ(2u, conf->proxy.listeners.size());
    ASSERT_EQ(53, conf->proxy.listeners[0].port);
    ASSERT_FALSE(conf->querylog.enabled);
    ASSERT_EQ(INFO, conf->verbosity);
}

TEST(config, full_document) {
    auto [conf, err] = app::config::load(R"(
log_level: debug
dns:
  listeners:
    - address: 0.0.0.0
      port: 5353
      protocol: tcp
      persistent: true
      idle_timeout_ms: 10000
  upstream_dns: [tls://1.1.1.1, 8.8.8.8:53]
  bootstrap_dns: [9.9.9.9]
  upstream_timeout_ms: 2000
  blocking_mode: custom_ip
  blocking_ipv4: 1.2.3.4
  blocking_ipv6: "::1"
  blocked_response_ttl: 30
  refuse_any: false
  disallowed_clients: [10.0.0.0/8]
  cache_size: 0
  bogus_nxdomain: [127.0.0.2]
  aaaa_disabled: true
  enable_dnssec: true
filtering:
  filters:
    - {id: 1, path: /var/lib/dnsguard/1.txt}
    - {id: 2, path: /var/lib/dnsguard/2.txt, enabled: false}
  user_rules: ["||ads.example^", "@@||good.example^"]
  rewrites:
    - {domain: "*.home.example", answer: 192.168.1.1}
  safebrowsing_domains: [malware.example]
  safesearch:
    - {domain: www.search.example, answer: safe.search.example}
  blocked_services: [tiktok]
clients:
  - name: kid
    ids: [192.168.1.10]
    upstreams: [1.1.1.3]
    parental_enabled: true
    blocked_services: [youtube, twitch]
  - name: admin
    ids: [192.168.1.2]
dhcp:
  leases:
    - {hostname: printer, ip: 192.168.1.5}
querylog:
  enabled: true
  file: /tmp/querylog.txt
)");
    ASSERT_TRUE(conf.has_value()) << err.value_or("");
    ASSERT_EQ(DEBUG, conf->verbosity);

    const dnsproxy_settings &s = conf->proxy;
    ASSERT_EQ(1u, s.listeners.size());
    ASSERT_EQ("0.0.0.0", s.listeners[0].address);
    ASSERT_EQ(5353, s.listeners[0].port);
    ASSERT_EQ(utils::TP_TCP, s.listeners[0].protocol);
    ASSERT_TRUE(s.listeners[0].persistent);
    ASSERT_EQ(std::chrono::milliseconds(10000), s.listeners[0].idle_timeout);

    ASSERT_EQ(2u, s.upstreams.size());
    ASSERT_EQ("tls://1.1.1.1", s.upstreams[0].address);
    ASSERT_EQ(std::vector<std::string>{"9.9.9.9"}, s.upstreams[1].bootstrap);
    ASSERT_EQ(std::chrono::milliseconds(2000), s.upstreams[1].timeout);
    ASSERT_EQ(2, s.upstreams[1].id);

    ASSERT_EQ(dnsproxy_blocking_mode::CUSTOM_IP, s.blocking_mode);
    ASSERT_EQ("1.2.3.4", s.custom_blocking_ipv4);
    ASSERT_EQ("::1", s.custom_blocking_ipv6);
    ASSERT_EQ(30u, s.blocked_response_ttl_secs);
    ASSERT_FALSE(s.refuse_any);
    ASSERT_EQ(0u, s.dns_cache_size);
    ASSERT_TRUE(s.aaaa_disabled);
    ASSERT_TRUE(s.enable_dnssec);

    ASSERT_EQ(2u, s.filter_params.filters.size());
    ASSERT_EQ(1, s.filter_params.filters[0].id);
    ASSERT_FALSE(s.filter_params.filters[0].in_memory);
    ASSERT_EQ(0, s.filter_params.filters[1].id);
    ASSERT_TRUE(s.filter_params.filters[1].in_memory);
    ASSERT_EQ("||ads.example^\n@@||good.example^\n", s.filter_params.filters[1].data);
    ASSERT_EQ(1u, s.filter_params.rewrites.size());
    ASSERT_EQ("192.168.1.1", s.filter_params.rewrites[0].answer);
    ASSERT_EQ(1u, s.filter_params.safesearch.size());
    ASSERT_EQ(std::vector<std::string>{"tiktok"}, s.filter_params.blocked_services);

    const app::client_config *kid = conf->find_client("192.168.1.10");
    ASSERT_NE(nullptr, kid);
    ASSERT_EQ("kid", kid->name);
    ASSERT_TRUE(kid->filtering.filtering_enabled);
    ASSERT_TRUE(kid->filtering.parental_enabled);
    ASSERT_FALSE(kid->filtering.safebrowsing_enabled);
    ASSERT_TRUE(kid->filtering.blocked_services.has_value());
    ASSERT_EQ((std::vector<std::string>{"youtube", "twitch"}), kid->filtering.blocked_services.value());
    const app::client_config *admin = conf->find_client("192.168.1.2");
    ASSERT_NE(nullptr, admin);
    ASSERT_FALSE(admin->filtering.blocked_services.has_value());
    ASSERT_EQ(nullptr, conf->find_client("192.168.1.11"));

    ASSERT_EQ(1u, conf->leases.size());
    ASSERT_EQ("printer", conf->leases[0].hostname);
    ASSERT_TRUE(conf->querylog.enabled);
    ASSERT_EQ("/tmp/querylog.txt", conf->querylog.file);
}

TEST(config, errors) {
    ASSERT_FALSE(app::config::load("dns: [unclosed").conf.has_value());
    ASSERT_FALSE(app::config::load("dns:\n  blocking_mode: sometimes\n").conf.has_value());
    ASSERT_FALSE(app::config::load("dns:\n  cache_size: lots\n").conf.has_value());
    ASSERT_FALSE(app::config::load("dns:\n  listeners:\n    - {address: localhost}\n").conf.has_value());
    ASSERT_FALSE(app::config::load("dns:\n  listeners:\n    - {address: 127.0.0.1, protocol: sctp}\n").conf.has_value());
    ASSERT_FALSE(app::config::load("clients:\n  - {name: nobody}\n").conf.has_value());
    ASSERT_FALSE(app::config::load("clients:\n  - {name: bad, ids: [host.example]}\n").conf.has_value());
    ASSERT_FALSE(app::config::load("querylog:\n  enabled: true\n").conf.has_value());
    ASSERT_FALSE(app::config::load("filtering:\n  blocked_services: [myspace]\n").conf.has_value());
    ASSERT_FALSE(app::config::load("clients:\n  - {name: a, ids: [10.0.0.1], blocked_services: [myspace]}\n")
                         .conf.has_value());

    auto [conf, err] = app::config::load_file("/nonexistent/dnsguard.yaml");
    ASSERT_FALSE(conf.has_value());
    ASSERT_NE(std::string::npos, err.value_or("").find("/nonexistent/dnsguard.yaml"));
}
