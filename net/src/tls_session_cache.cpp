#include <dg_tls_session_cache.h>

struct session_storage {
    dg::logger log = dg::create_logger("TLS session cache");
    std::mutex mtx;
    std::unordered_map<std::string, std::list<dg::ssl_session_ptr>> caches_by_url;
    int ex_data_idx = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
};

static session_storage &storage() {
    static session_storage s;
    return s;
}

int dg::tls_session_cache::session_new_cb(SSL *ssl, SSL_SESSION *session) {
    session_storage &s = storage();
    auto *cache = (tls_session_cache *) SSL_get_ex_data(ssl, s.ex_data_idx);
    if (cache == nullptr) {
        dbglog(s.log, "SSL object is not associated with a cache");
        return 0;
    }

    std::scoped_lock l(s.mtx);
    auto &sessions = s.caches_by_url[cache->m_url];
    if (sessions.size() == MAX_SIZE_PER_URL) {
        sessions.pop_front();
    }
    sessions.emplace_back(session);
    dbglog(s.log, "Session saved, {} sessions available for {}", sessions.size(), cache->m_url);
    return 1; // we own the session now
}

dg::ssl_session_ptr dg::tls_session_cache::get_session() {
    session_storage &s = storage();
    std::scoped_lock l(s.mtx);
    auto it = s.caches_by_url.find(m_url);
    if (it == s.caches_by_url.end() || it->second.empty()) {
        return nullptr;
    }
    ssl_session_ptr session = std::move(it->second.back());
    it->second.pop_back();
    return session;
}

void dg::tls_session_cache::prepare_ssl_ctx(SSL_CTX *ctx) {
    SSL_CTX_set_session_cache_mode(ctx, SSL_SESS_CACHE_CLIENT | SSL_SESS_CACHE_NO_INTERNAL_STORE);
    SSL_CTX_sess_set_new_cb(ctx, session_new_cb);
}

void dg::tls_session_cache::prepare_ssl(SSL *ssl) {
    SSL_set_ex_data(ssl, storage().ex_data_idx, this);
}

dg::tls_session_cache::tls_session_cache(std::string url)
        : m_url{std::move(url)} {
}
