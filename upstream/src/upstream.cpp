#include <algorithm>
#include <iterator>
#include <magic_enum.hpp>
#include <dg_logger.h>
#include <dg_net_utils.h>
#include <dg_utils.h>
#include <dns_stamp.h>
#include <upstream.h>
#include "upstream_dnscrypt.h"
#include "upstream_doh.h"
#include "upstream_dot.h"
#include "upstream_plain.h"

enum class scheme : size_t {
    SDNS,
    DNS,
    TCP,
    TLS,
    HTTPS,
    UNDEFINED,
    COUNT,
};

static constexpr std::string_view SCHEME_WITH_SUFFIX[]{
    "sdns://",
    "dns://",
    "tcp://",
    "tls://",
    "https://",
};

static_assert(std::size(SCHEME_WITH_SUFFIX) + 1 == static_cast<size_t>(scheme::COUNT),
        "SCHEME_WITH_SUFFIX should contain all schemes defined in enum (except UNDEFINED)");

struct dg::upstream_factory::impl {
    logger log = create_logger("Upstream factory");
    upstream_factory_config config;

    explicit impl(upstream_factory_config cfg)
            : config(cfg) {
    }

    upstream_factory::create_result create_upstream(const upstream_options &opts) const;
};

static scheme get_address_scheme(std::string_view address) {
    auto i = std::find_if(std::begin(SCHEME_WITH_SUFFIX), std::end(SCHEME_WITH_SUFFIX),
            [address](std::string_view s) { return dg::utils::starts_with(address, s); });
    if (i != std::end(SCHEME_WITH_SUFFIX)) {
        return static_cast<scheme>(std::distance(std::begin(SCHEME_WITH_SUFFIX), i));
    }
    return scheme::UNDEFINED;
}

static dg::upstream_factory::create_result create_upstream_tls(const dg::upstream_options &opts,
        const dg::upstream_factory_config &config) {
    return {std::make_unique<dg::dns_over_tls>(opts, config), std::nullopt};
}

static dg::upstream_factory::create_result create_upstream_https(const dg::upstream_options &opts,
        const dg::upstream_factory_config &config) {
    return {std::make_unique<dg::dns_over_https>(opts, config), std::nullopt};
}

static dg::upstream_factory::create_result create_upstream_plain(const dg::upstream_options &opts,
        const dg::upstream_factory_config &config) {
    return {std::make_unique<dg::plain_dns>(opts, config), std::nullopt};
}

// `dns://host:port` is the same as plain `host:port`
static dg::upstream_factory::create_result create_upstream_dns(const dg::upstream_options &opts,
        const dg::upstream_factory_config &config) {
    dg::upstream_options plain_opts = opts;
    plain_opts.address.erase(0, SCHEME_WITH_SUFFIX[(size_t) scheme::DNS].length());
    return create_upstream_plain(plain_opts, config);
}

static dg::upstream_factory::create_result create_upstream_undefined(const dg::upstream_options &opts,
        const dg::upstream_factory_config &) {
    return {nullptr, DG_FMT("Unsupported scheme in upstream address: {}", opts.address)};
}

static dg::upstream_factory::create_result create_upstream_sdns(const dg::upstream_options &local_opts,
        const dg::upstream_factory_config &config) {
    static constexpr dg::utils::make_error<dg::upstream_factory::create_result> make_error;
    auto [stamp, stamp_err] = dg::server_stamp::from_string(local_opts.address);
    if (stamp_err) {
        return make_error(std::move(stamp_err));
    }
    auto opts = local_opts;
    std::string port; // With leading ':'
    if (!stamp.server_addr_str.empty()) {
        if (stamp.server_addr_str.front() == ':') {
            port = stamp.server_addr_str;
        } else {
            dg::socket_address address = dg::utils::str_to_socket_address(stamp.server_addr_str);
            opts.resolved_server_ip = address.addr_variant();
            if (address.port()) {
                port = DG_FMT(":{}", address.port());
            }
        }
    }

    switch (stamp.proto) {
    case dg::stamp_proto_type::DNSCRYPT:
        return {std::make_unique<dg::upstream_dnscrypt>(std::move(stamp), opts, config), std::nullopt};
    case dg::stamp_proto_type::PLAIN:
        opts.address = stamp.server_addr_str;
        return create_upstream_plain(opts, config);
    case dg::stamp_proto_type::DOH:
        opts.address = DG_FMT("{}{}{}{}", dg::dns_over_https::SCHEME, stamp.provider_name, port, stamp.path);
        return create_upstream_https(opts, config);
    case dg::stamp_proto_type::TLS:
        opts.address = DG_FMT("{}{}{}", dg::dns_over_tls::SCHEME, stamp.provider_name, port);
        return create_upstream_tls(opts, config);
    }
    return make_error(DG_FMT("Unknown stamp protocol: {}", magic_enum::enum_name(stamp.proto)));
}

dg::upstream_factory::create_result dg::upstream_factory::impl::create_upstream(
        const upstream_options &opts) const {
    using create_function = upstream_factory::create_result (*)(const upstream_options &,
            const upstream_factory_config &);
    static constexpr create_function create_functions[]{
        &create_upstream_sdns,
        &create_upstream_dns,
        &create_upstream_plain,
        &create_upstream_tls,
        &create_upstream_https,
        &create_upstream_undefined,
    };
    static_assert(std::size(create_functions) == static_cast<size_t>(scheme::COUNT),
            "create_functions should contain all create functions for schemes defined in enum");
    auto index = (size_t) get_address_scheme(opts.address);
    return create_functions[index](opts, this->config);
}

dg::upstream_factory::upstream_factory(upstream_factory_config cfg)
        : m_factory(std::make_unique<impl>(cfg)) {
}

dg::upstream_factory::~upstream_factory() = default;

dg::upstream_factory::create_result dg::upstream_factory::create_upstream(const upstream_options &opts) const {
    create_result result;
    if (opts.address.find("://") != std::string::npos) {
        result = m_factory->create_upstream(opts);
    } else {
        // No scheme in the url, so it's just a plain DNS host:port
        result = create_upstream_plain(opts, m_factory->config);
    }

    if (!result.error.has_value()) {
        result.error = result.upstream->init();
    }

    if (result.error.has_value()) {
        dbglog(m_factory->log, "Failed to create upstream {}: {}", opts.address, *result.error);
        result.upstream.reset();
    }

    return result;
}
