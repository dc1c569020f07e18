#pragma once

#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <openssl/ssl.h>
#include <dg_defs.h>
#include <dg_logger.h>

namespace dg {

using ssl_session_ptr = std::unique_ptr<SSL_SESSION, ftor<&SSL_SESSION_free>>;

/**
 * A cache of recently seen SSL_SESSIONs for the given URL.
 * The cache is static and thread safe. Different instances of this
 * class with the same URL are backed by the same cache.
 */
class tls_session_cache {
public:
    /** Set the session cache mode and the new session callback */
    static void prepare_ssl_ctx(SSL_CTX *ctx);

    explicit tls_session_cache(std::string url);

    /** Associate an SSL object with this cache to save established sessions */
    void prepare_ssl(SSL *ssl);

    /**
     * Get the most recently discovered session, or nullptr if there are no sessions.
     * Each session is returned only once, the caller gains ownership of it.
     */
    ssl_session_ptr get_session();

private:
    std::string m_url;

    static constexpr size_t MAX_SIZE_PER_URL = 5;

    static int session_new_cb(SSL *ssl, SSL_SESSION *session);
};

} // namespace dg
