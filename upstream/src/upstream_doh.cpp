#include <algorithm>
#include <dg_utils.h>
#include "upstream_doh.h"

#define tracelog_id(l_, id_, fmt_, ...) tracelog((l_), "[{}] " fmt_, (id_), ##__VA_ARGS__)

using std::chrono::milliseconds;

static constexpr std::string_view USER_AGENT = "dnsguard";
static constexpr size_t MAX_IDLE_HANDLES = 8;

struct curl_initializer {
    curl_initializer() {
        curl_global_init(CURL_GLOBAL_ALL);
    }
    ~curl_initializer() {
        curl_global_cleanup();
    }
};

static size_t write_callback(void *contents, size_t size, size_t nmemb, void *arg) {
    auto *response = (dg::uint8_vector *) arg;
    size_t full_size = size * nmemb;
    response->insert(response->end(), (uint8_t *) contents, (uint8_t *) contents + full_size);
    return full_size;
}

static std::string_view get_host_port(std::string_view url) {
    url.remove_prefix(dg::dns_over_https::SCHEME.length());
    return url.substr(0, url.find('/'));
}

static std::string resolve_entry(std::string_view host, int port, const std::vector<dg::socket_address> &addrs) {
    std::string entry = DG_FMT("{}:{}:", host, port);
    for (size_t i = 0; i < addrs.size(); ++i) {
        const dg::socket_address &a = addrs[i];
        entry += (i == 0) ? "" : ",";
        entry += a.is_ipv6() ? DG_FMT("[{}]", a.host_str()) : a.host_str();
    }
    return entry;
}

dg::dns_over_https::dns_over_https(const upstream_options &opts, const upstream_factory_config &config)
        : upstream(opts, config)
        , m_log(create_logger(DG_FMT("DoH upstream ({})", opts.address)))
        , m_port(DEFAULT_PORT) {
    static const curl_initializer ensure_initialized;
}

dg::dns_over_https::~dns_over_https() = default;

dg::err_string dg::dns_over_https::init() {
    auto [host, port_str] = utils::split_host_port(get_host_port(m_options.address));
    m_host = std::string(host);
    if (m_host.empty()) {
        return DG_FMT("Invalid DoH URL: {}", m_options.address);
    }
    if (!port_str.empty()) {
        m_port = std::strtol(std::string(port_str).c_str(), nullptr, 10);
        if (m_port <= 0 || m_port > 65535) {
            return DG_FMT("Invalid port in DoH URL: {}", m_options.address);
        }
    }

    curl_slist *headers = nullptr;
    if (nullptr == (headers = curl_slist_append(nullptr, "Content-Type: application/dns-message"))
            || nullptr == (headers = curl_slist_append(headers, "Accept: application/dns-message"))) {
        curl_slist_free_all(headers);
        std::string err = "Failed to create http headers for request";
        errlog(m_log, "{}", err);
        return err;
    }
    m_request_headers.reset(headers);

    if (const auto *ipv4 = std::get_if<ipv4_address_array>(&m_options.resolved_server_ip)) {
        socket_address addr({ipv4->data(), ipv4->size()}, m_port);
        m_static_resolved.reset(curl_slist_append(nullptr, resolve_entry(m_host, m_port, {addr}).c_str()));
        return std::nullopt;
    }
    if (const auto *ipv6 = std::get_if<ipv6_address_array>(&m_options.resolved_server_ip)) {
        socket_address addr({ipv6->data(), ipv6->size()}, m_port);
        m_static_resolved.reset(curl_slist_append(nullptr, resolve_entry(m_host, m_port, {addr}).c_str()));
        return std::nullopt;
    }
    if (socket_address(m_host, m_port).valid()) {
        return std::nullopt;
    }
    if (m_options.bootstrap.empty()) {
        return "At least one the following should be true: server address is specified, "
               "url contains valid server address as a host name, bootstrap server is specified";
    }

    m_bootstrapper = std::make_unique<bootstrapper>(bootstrapper::params{get_host_port(m_options.address),
            DEFAULT_PORT, m_options.bootstrap, m_options.timeout, m_config});
    if (err_string err = m_bootstrapper->init(); err.has_value()) {
        std::string err_message = DG_FMT("Failed to create bootstrapper: {}", *err);
        errlog(m_log, "{}", err_message);
        return err_message;
    }
    return std::nullopt;
}

dg::dns_over_https::resolved_hosts_result dg::dns_over_https::get_resolved_hosts() {
    if (m_bootstrapper == nullptr) {
        return {nullptr, {}, std::nullopt};
    }
    bootstrapper::resolve_result resolved = m_bootstrapper->get();
    if (resolved.error.has_value()) {
        return {nullptr, {}, DG_FMT("Failed to resolve {}: {}", m_host, *resolved.error)};
    }
    curl_slist_ptr hosts(curl_slist_append(nullptr, resolve_entry(m_host, m_port, resolved.addresses).c_str()));
    return {std::move(hosts), std::move(resolved.addresses), std::nullopt};
}

dg::curl_ptr dg::dns_over_https::get_handle() {
    {
        std::scoped_lock l(m_idle_handles.mtx);
        if (!m_idle_handles.val.empty()) {
            curl_ptr handle = std::move(m_idle_handles.val.back());
            m_idle_handles.val.pop_back();
            return handle;
        }
    }
    return curl_ptr(curl_easy_init());
}

void dg::dns_over_https::put_handle(curl_ptr handle) {
    std::scoped_lock l(m_idle_handles.mtx);
    if (m_idle_handles.val.size() < MAX_IDLE_HANDLES) {
        m_idle_handles.val.emplace_back(std::move(handle));
    }
}

dg::dns_over_https::exchange_result dg::dns_over_https::exchange(ldns_pkt *request_pkt, const dns_message_info *) {
    static constexpr utils::make_error<exchange_result> make_error;
    uint16_t request_id = ldns_pkt_id(request_pkt);
    utils::timer timer;

    // The ID is zeroed to make the request cacheable by HTTP caches
    ldns_pkt_set_id(request_pkt, 0);
    ldns_buffer_ptr request{ldns_buffer_new(REQUEST_BUFFER_INITIAL_CAPACITY)};
    ldns_status status = ldns_pkt2buffer_wire(request.get(), request_pkt);
    ldns_pkt_set_id(request_pkt, request_id);
    if (status != LDNS_STATUS_OK) {
        return make_error(DG_FMT("Failed to serialize packet: {}", ldns_get_errorstr_by_id(status)));
    }

    auto [resolved, resolved_addrs, resolve_err] = get_resolved_hosts();
    if (resolve_err.has_value()) {
        return make_error(std::move(resolve_err));
    }
    milliseconds timeout = m_options.timeout - timer.elapsed<milliseconds>();
    if (timeout.count() <= 0) {
        return make_error(std::string(utils::TIMEOUT_STR));
    }

    curl_ptr handle = get_handle();
    if (handle == nullptr) {
        return make_error("Failed to init curl handle");
    }
    CURL *curl = handle.get();
    curl_slist *resolve_list = (resolved != nullptr) ? resolved.get() : m_static_resolved.get();
    uint8_vector response;
    if (CURLcode e; CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_URL, m_options.address.c_str()))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long) timeout.count()))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long) timeout.count()))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT.data()))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_POSTFIELDS, ldns_buffer_begin(request.get())))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                    (long) ldns_buffer_position(request.get())))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_HTTPHEADER, m_request_headers.get()))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTPS))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L))
            || CURLE_OK != (e = curl_easy_setopt(curl, CURLOPT_RESOLVE, resolve_list))) {
        return make_error(DG_FMT("Failed to set options on curl handle: {} (id={})", curl_easy_strerror(e), e));
    }

    tracelog_id(m_log, request_id, "Sending request");
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        if (res == CURLE_COULDNT_CONNECT && m_bootstrapper != nullptr) {
            for (const socket_address &a : resolved_addrs) {
                m_bootstrapper->remove_resolved(a);
            }
        }
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_error(std::string(utils::TIMEOUT_STR));
        }
        return make_error(DG_FMT("Failed to perform request: {} ({})", curl_easy_strerror(res),
                m_options.address));
    }

    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    put_handle(std::move(handle));
    if (response_code != 200) {
        return make_error(DG_FMT("Got bad response status: {}", response_code));
    }
    if (response.empty()) {
        return make_error("Got empty response");
    }

    ldns_pkt *reply = nullptr;
    status = ldns_wire2pkt(&reply, response.data(), response.size());
    if (status != LDNS_STATUS_OK) {
        return make_error(DG_FMT("Failed to parse response: {}", ldns_get_errorstr_by_id(status)));
    }
    ldns_pkt_set_id(reply, request_id);
    tracelog_id(m_log, request_id, "Got response");
    return {ldns_pkt_ptr(reply), std::nullopt};
}
