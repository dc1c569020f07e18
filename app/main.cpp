#include <algorithm>
#include <csignal>
#include <cstring>
#include <iostream>
#include <map>
#include <mutex>
#include <pthread.h>
#include <boost/program_options.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <dg_logger.h>
#include <dg_utils.h>
#include <dnsproxy.h>
#include <upstream.h>
#include "config.h"

namespace po = boost::program_options;
using namespace dg;

static constexpr const char *DEFAULT_CONFIG_PATH = "/etc/dnsguard/dnsguard.yaml";

namespace {

/**
 * Holds what the proxy callbacks read: client settings, their upstreams and the counters.
 * Replaced as a whole on reload.
 */
class app_state {
public:
    app_state() : m_log(create_logger("dnsguard")) {}

    err_string apply(const app::config &conf) {
        upstream_factory factory(upstream_factory_config{conf.proxy.ipv6_available});
        std::map<std::string, upstream_list, std::less<>> client_upstreams;
        for (const app::client_config &client : conf.clients) {
            if (client.upstreams.empty()) {
                continue;
            }
            upstream_list list;
            int32_t id = 0;
            for (const std::string &address : client.upstreams) {
                upstream_options opts{};
                opts.address = address;
                opts.timeout = std::chrono::seconds(5);
                opts.id = ++id;
                auto [created, err] = factory.create_upstream(opts);
                if (err.has_value()) {
                    return DG_FMT("Failed to create upstream {} of client '{}': {}", address, client.name, err.value());
                }
                list.emplace_back(std::move(created));
            }
            for (const std::string &ip : client.ids) {
                client_upstreams[ip] = list;
            }
        }

        std::scoped_lock l(m_mtx);
        m_config = conf;
        m_client_upstreams = std::move(client_upstreams);
        return std::nullopt;
    }

    err_string open_querylog(const app::querylog_config &conf) {
        std::scoped_lock l(m_mtx);
        m_querylog = nullptr;
        if (!conf.enabled) {
            return std::nullopt;
        }
        try {
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    conf.file, conf.max_file_size, conf.max_files);
            m_querylog = std::make_shared<spdlog::logger>("querylog", std::move(sink));
            m_querylog->set_pattern("%v");
            m_querylog->flush_on(spdlog::level::info);
        } catch (const spdlog::spdlog_ex &e) {
            return DG_FMT("Failed to open query log {}: {}", conf.file, e.what());
        }
        return std::nullopt;
    }

    dnsproxy_events make_events() {
        dnsproxy_events events;
        events.on_request_processed = [this](const dns_request_processed_event &event) {
            on_request_processed(event);
        };
        events.on_stats_increment = [this](std::string_view counter, int64_t) {
            std::scoped_lock l(m_mtx);
            ++m_counters[std::string(counter)];
        };
        events.get_custom_upstreams = [this](std::string_view client) -> std::optional<upstream_list> {
            std::scoped_lock l(m_mtx);
            auto it = m_client_upstreams.find(client);
            if (it == m_client_upstreams.end()) {
                return std::nullopt;
            }
            return it->second;
        };
        events.on_client_settings = [this](std::string_view client, client_settings &settings) {
            std::scoped_lock l(m_mtx);
            if (const app::client_config *known = m_config.find_client(client)) {
                settings = known->filtering;
            }
        };
        return events;
    }

    void log_counters() {
        std::scoped_lock l(m_mtx);
        for (const auto &[name, value] : m_counters) {
            infolog(m_log, "{}: {}", name, value);
        }
    }

private:
    logger m_log;
    std::mutex m_mtx;
    app::config m_config;
    std::map<std::string, upstream_list, std::less<>> m_client_upstreams;
    std::map<std::string, int64_t> m_counters;
    std::shared_ptr<spdlog::logger> m_querylog;

    void on_request_processed(const dns_request_processed_event &event) {
        std::shared_ptr<spdlog::logger> querylog;
        {
            std::scoped_lock l(m_mtx);
            querylog = m_querylog;
        }
        if (querylog == nullptr) {
            return;
        }
        std::string answer = event.answer;
        std::replace(answer.begin(), answer.end(), '\n', ';');
        querylog->info("{} {} {} {} {} {}ms {} upstream={} cached={} rule=\"{}\"{}",
                event.start_time, event.client, event.domain, event.type, event.status, event.elapsed, answer,
                event.upstream.empty() ? "-" : event.upstream, event.cache_hit, verdict_rule(event.result),
                event.error.empty() ? "" : fmt::format(" error=\"{}\"", event.error));
    }
};

} // namespace

static std::optional<app::config> load_config(const std::string &path, const logger &log) {
    auto [conf, err] = app::config::load_file(path);
    if (!conf.has_value()) {
        errlog(log, "{}", err.value_or("Unknown error"));
    }
    return std::move(conf);
}

int main(int argc, char **argv) {
    logger log = create_logger("dnsguard");

    po::variables_map vm;
    po::options_description desc("Filtering DNS proxy");
    desc.add_options()
            ("help", "produce help message")
            ("version", "display the version")
            ("verbose", "log debug messages")
            ("trace", "log everything")
            ("check", "only check the configuration")
            ("config", po::value<std::string>()->default_value(DEFAULT_CONFIG_PATH), "configuration file to use");
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << e.what() << ". See `dnsguard --help` for valid options" << std::endl;
        return 1;
    }

    if (vm.count("help") > 0) {
        std::cerr << "Usage: dnsguard [OPTION]..." << std::endl << desc << std::endl;
        return 0;
    }
    if (vm.count("version") > 0) {
        std::cout << "dnsguard " << dnsproxy::version() << std::endl;
        return 0;
    }

    std::string config_path = vm["config"].as<std::string>();
    std::optional<app::config> conf = load_config(config_path, log);
    if (!conf.has_value()) {
        return 1;
    }
    if (vm.count("check") > 0) {
        infolog(log, "Configuration {} is valid", config_path);
        return 0;
    }

    auto verbosity = [&vm](log_level configured) {
        if (vm.count("trace") > 0) {
            return TRACE;
        }
        return (vm.count("verbose") > 0) ? DEBUG : configured;
    };
    set_default_log_level(verbosity(conf->verbosity));
    infolog(log, "dnsguard {} starting with {}", dnsproxy::version(), config_path);

    // Signals are received synchronously by the main thread
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    app_state state;
    if (err_string err = state.apply(conf.value()); err.has_value()) {
        errlog(log, "{}", err.value());
        return 1;
    }
    if (err_string err = state.open_querylog(conf->querylog); err.has_value()) {
        errlog(log, "{}", err.value());
        return 1;
    }

    dnsproxy proxy;
    auto [ok, err_or_warn] = proxy.start(conf->proxy, state.make_events());
    if (!ok) {
        errlog(log, "Failed to start: {}", err_or_warn.value_or("Unknown error"));
        return 1;
    }
    if (err_or_warn.has_value()) {
        warnlog(log, "Started with warnings: {}", err_or_warn.value());
    }
    proxy.set_leases(conf->leases);
    for (const auto &[proto, address] : proxy.get_listen_addresses()) {
        infolog(log, "Listening on {} ({})", address.str(), proto == utils::TP_UDP ? "udp" : "tcp");
    }

    for (;;) {
        int sig = 0;
        if (0 != sigwait(&signals, &sig)) {
            errlog(log, "Failed to wait for a signal: {}", strerror(errno));
            break;
        }
        if (sig != SIGHUP) {
            infolog(log, "Received signal {}, stopping", sig);
            break;
        }

        infolog(log, "Reloading configuration from {}", config_path);
        std::optional<app::config> reloaded = load_config(config_path, log);
        if (!reloaded.has_value()) {
            warnlog(log, "Keeping the current configuration");
            continue;
        }
        if (err_string err = state.apply(reloaded.value()); err.has_value()) {
            warnlog(log, "Keeping the current configuration: {}", err.value());
            continue;
        }
        if (err_string err = state.open_querylog(reloaded->querylog); err.has_value()) {
            errlog(log, "{}", err.value());
        }
        set_default_log_level(verbosity(reloaded->verbosity));
        auto [reconfigured, err] = proxy.reconfigure(reloaded->proxy);
        if (!reconfigured) {
            errlog(log, "Failed to apply the configuration: {}", err.value_or("Unknown error"));
            break;
        }
        proxy.set_leases(reloaded->leases);
        conf = std::move(reloaded);
    }

    proxy.stop();
    state.log_counters();
    infolog(log, "Stopped");
    return 0;
}
