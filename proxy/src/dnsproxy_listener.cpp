#include <algorithm>
#include <atomic>
#include <csignal>
#include <functional>
#include <thread>
#include <unistd.h>
#include <arpa/inet.h>
#include <uv.h>
#include <magic_enum.hpp>
#include <dg_logger.h>
#include <dg_socket_address.h>
#include <dg_tcp_dns_buffer.h>
#include "dnsproxy_listener.h"

#define log_listener(l_, lvl_, fmt_, ...) lvl_##log((l_)->m_log, "[{} {}] {}(): " fmt_, magic_enum::enum_name((l_)->m_settings.protocol), (l_)->m_address.str(), __func__, ##__VA_ARGS__)
#define log_id(l_, lvl_, id_, fmt_, ...) lvl_##log(l_, "[{}] {}(): " fmt_, id_, __func__, ##__VA_ARGS__)

namespace dg {

// Requests are processed on the libuv thread pool.
// Set its size before any libuv usage to have effect.
static const int THREAD_POOL_SIZE_RESULT [[maybe_unused]] = uv_os_setenv("UV_THREADPOOL_SIZE", "24");

// For TCP this could be arbitrarily small, but we would prefer to catch the whole request in one buffer.
static constexpr size_t TCP_RECV_BUF_SIZE = UDP_RECV_BUF_SIZE + 2; // + 2 for payload length

static void udp_alloc_cb(uv_handle_t *, size_t, uv_buf_t *buf) {
    buf->base = new char[UDP_RECV_BUF_SIZE];
    buf->len = UDP_RECV_BUF_SIZE;
}

static void dealloc_buf(const uv_buf_t *buf) {
    delete[] buf->base;
}

static void loop_delete(uv_loop_t *loop) {
    uv_loop_close(loop);
    delete loop;
}

// Abstract base for listeners, does uv initialization/stopping
class listener_base : public dnsproxy_listener {
protected:
    logger m_log = create_logger("listener");
    dnsproxy *m_proxy{nullptr};
    std::thread m_loop_thread;
    using uv_loop_ptr = std::unique_ptr<uv_loop_t, ftor<&loop_delete>>;
    uv_loop_ptr m_loop;
    uv_async_t m_escape_hatch{};
    socket_address m_address;
    listener_settings m_settings;

    // Subclass initializes its handles, callbacks, etc.
    // The loop is initialized, but isn't yet running at this point
    // Return nullopt if the loop should run (success)
    // Close any uv_*_init'ed handles before returning in case of an error!
    virtual err_string before_run() = 0;

    // Subclass cleans up to allow the event loop to exit
    // (close handles, cancel pending work, etc.)
    // Called on event loop's thread
    virtual void before_stop() = 0;

private:
    static void escape_hatch_cb(uv_async_t *handle) {
        auto *self = (listener_base *) handle->data;
        log_listener(self, dbg, "Received signal to stop");
        self->before_stop();
        uv_close((uv_handle_t *) &self->m_escape_hatch, nullptr);
    }

    static int run_loop(uv_loop_t *loop, uv_run_mode mode) {
        // Block SIGPIPE
        sigset_t sigset, oldset;
        sigemptyset(&sigset);
        sigaddset(&sigset, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &sigset, &oldset);

        int err = uv_run(loop, mode);

        // Restore SIGPIPE state
        pthread_sigmask(SIG_SETMASK, &oldset, nullptr);
        return err;
    }

public:
    /**
     * @return std::nullopt if ok, error string otherwise
     */
    err_string init(const listener_settings &settings, dnsproxy *proxy) {
        m_settings = settings;
        if (m_settings.fd != -1) {
            m_settings.fd = dup(m_settings.fd); // Take ownership
        }

        m_proxy = proxy;
        if (!m_proxy) {
            return "Proxy is not set";
        }

        if (m_settings.fd == -1) {
            m_address = socket_address{m_settings.address, m_settings.port};
            if (!m_address.valid()) {
                return DG_FMT("Invalid address: {}", settings.address);
            }
        }

        m_loop.reset(new uv_loop_t{});
        if (int err = uv_loop_init(m_loop.get()); err != 0) {
            m_loop.reset();
            return DG_FMT("Failed to create uv loop: {}", uv_strerror(err));
        }

        // Init the escape hatch
        if (int err = uv_async_init(m_loop.get(), &m_escape_hatch, escape_hatch_cb); err != 0) {
            return DG_FMT("uv_async_init failed: {}", uv_strerror(err));
        }
        m_escape_hatch.data = this;

        if (err_string err_str = before_run(); err_str.has_value()) {
            uv_close((uv_handle_t *) &m_escape_hatch, nullptr);
            m_escape_hatch.data = nullptr;

            // Run the loop once to let libuv close the handles cleanly
            if (int err = run_loop(m_loop.get(), UV_RUN_DEFAULT); err != 0) {
                log_listener(this, warn, "uv_run: ({}) {}", err, uv_strerror(err));
            }

            return err_str;
        }

        m_loop_thread = std::thread([this]() {
            int ret = run_loop(m_loop.get(), UV_RUN_DEFAULT);
            if (ret != 0) {
                log_listener(this, err, "uv_run: ({}) {}", ret, uv_strerror(ret));
            } else {
                log_listener(this, info, "Finished listening");
            }
        });

        return std::nullopt;
    }

    ~listener_base() override {
        await_shutdown();
        if (m_settings.fd != -1) {
            close(m_settings.fd);
        }
    }

    void shutdown() final {
        // The next invocation of escape_hatch_cb will close all handles, allowing the loop to exit
        if (this == m_escape_hatch.data && m_loop_thread.joinable()) { // Check async initialized
            if (int ret = uv_async_send(&m_escape_hatch); ret != 0) {
                log_listener(this, err, "uv_async_send: ({}) {}", ret, uv_strerror(ret));
            }
        }
    }

    void await_shutdown() final {
        if (m_loop_thread.joinable()) { // Allow await_shutdown() to be called more than once
            m_loop_thread.join();
            m_escape_hatch.data = nullptr;
        }
    }

    std::pair<utils::transport_protocol, socket_address> get_listen_address() const override {
        return {m_settings.protocol, m_address};
    }
};

class listener_udp : public listener_base {
private:
    struct task {
        uv_work_t work_req{};
        listener_udp *self;
        socket_address peer;
        uv_buf_t request;
        uint8_vector response; // Filled in work_cb

        // Takes ownership of request buffer
        task(listener_udp *self, const sockaddr *addr, uv_buf_t request)
                : self(self), peer(addr), request(request) {
            work_req.data = this;
        }

        ~task() {
            dealloc_buf(&request);
        }
    };

    uv_udp_t m_udp_handle{};
    hash_set<task *> m_pending; // Messages not yet processed by the proxy

    static void work_cb(uv_work_t *req) {
        auto *m = (task *) req->data;
        dns_message_info info{utils::TP_UDP, m->peer};
        m->response = m->self->m_proxy->handle_message({(uint8_t *) m->request.base, m->request.len}, &info);
    }

    static void send_cb(uv_udp_send_t *req, int status) {
        auto *m = (task *) req->data;
        if (status != 0) {
            log_listener(m->self, dbg, "Error: {}", uv_strerror(status));
        }
        delete req;
        delete m;
    }

    static void after_work_cb(uv_work_t *req, int status) {
        auto *m = (task *) req->data;

        m->self->m_pending.erase(m);

        if (status == UV_ECANCELED || m->response.empty()) {
            log_listener(m->self, dbg, "{}", status == UV_ECANCELED ? "Task cancelled" : "Response is empty");
            delete m;
            return;
        }

        uv_buf_t resp_buf = uv_buf_init((char *) m->response.data(), m->response.size());

        auto *send_req = new uv_udp_send_t;
        send_req->data = m;

        int err = uv_udp_send(send_req, &m->self->m_udp_handle, &resp_buf, 1, m->peer.c_sockaddr(), send_cb);
        if (err < 0) {
            log_listener(m->self, dbg, "uv_udp_send failed: {}", uv_strerror(err));
            delete send_req;
            delete m;
        }
    }

    static void recv_cb(uv_udp_t *handle, ssize_t nread, const uv_buf_t *buf,
            const struct sockaddr *addr, unsigned flags) {
        auto *self = (listener_udp *) handle->data;

        if (nread < 0) {
            log_listener(self, dbg, "Failed: {}", uv_strerror(nread));
            dealloc_buf(buf);
            return;
        }
        if (nread == 0) {
            // Nothing to read, or an empty datagram
            dealloc_buf(buf);
            return;
        }
        if (flags & UV_UDP_PARTIAL) {
            log_listener(self, dbg, "Failed: truncated");
            dealloc_buf(buf);
            return;
        }

        // The listener reads the next packet while this one is processed
        auto *m = new task(self, addr, uv_buf_init(buf->base, nread));
        if (int err = uv_queue_work(self->m_loop.get(), &m->work_req, work_cb, after_work_cb); err < 0) {
            log_listener(self, dbg, "uv_queue_work failed: {}", uv_strerror(err));
            delete m;
            return;
        }
        self->m_pending.insert(m);
    }

protected:
    err_string before_run() override {
        int err = 0;

        if ((err = uv_udp_init(m_loop.get(), &m_udp_handle)) < 0) {
            return DG_FMT("uv_udp_init failed: {}", uv_strerror(err));
        }
        m_udp_handle.data = this;

        if (m_settings.fd == -1) {
            if ((err = uv_udp_bind(&m_udp_handle, m_address.c_sockaddr(), UV_UDP_REUSEADDR)) < 0) {
                uv_close((uv_handle_t *) &m_udp_handle, nullptr);
                return DG_FMT("uv_udp_bind failed: {}", uv_strerror(err));
            }
        } else {
            if ((err = uv_udp_open(&m_udp_handle, m_settings.fd)) < 0) {
                uv_close((uv_handle_t *) &m_udp_handle, nullptr);
                return DG_FMT("uv_udp_open failed: {}", uv_strerror(err));
            }
            m_settings.fd = -1; // uv_udp_open took ownership
        }

        if ((err = uv_udp_recv_start(&m_udp_handle, udp_alloc_cb, recv_cb)) < 0) {
            uv_close((uv_handle_t *) &m_udp_handle, nullptr);
            return DG_FMT("uv_udp_recv_start failed: {}", uv_strerror(err));
        }

        if (!m_address.valid() || m_address.port() == 0) {
            sockaddr_storage name{};
            int namelen = sizeof(name);
            uv_udp_getsockname(&m_udp_handle, (sockaddr *) &name, &namelen);
            m_address = socket_address((sockaddr *) &name);
        }
        log_listener(this, info, "Listening on {} (UDP)", m_address.str());

        return std::nullopt;
    }

    void before_stop() override {
        uv_close((uv_handle_t *) &m_udp_handle, nullptr);
        log_listener(this, dbg, "Stopping with {} pending tasks", m_pending.size());
        for (task *m : m_pending) {
            uv_cancel((uv_req_t *) &m->work_req);
        }
    }
};

class tcp_dns_connection {
public:
    explicit tcp_dns_connection(uint64_t id)
            : m_id{id}
            , m_log(create_logger("tcp_dns_connection"))
            , m_tcp(new uv_tcp_t{}) // Deleted in close_cb
            , m_idle_timer(new uv_timer_t{}) // Deleted in close_cb
    {
        m_tcp->data = this;
        m_idle_timer->data = this;
    }

    // Call after *handle() is properly initialized
    void start(uv_loop_t *loop, dnsproxy *proxy, bool persistent, std::chrono::milliseconds idle_timeout,
            std::function<void(uint64_t)> close_callback) {
        log_id(m_log, trace, m_id, "...");

        uv_timer_init(loop, m_idle_timer);

        m_proxy = proxy;
        m_persistent = persistent;
        m_idle_timeout = (idle_timeout.count() != 0) ? idle_timeout : std::chrono::milliseconds{3000};
        m_close_callback = std::move(close_callback);
        do_read();
    }

    void close() {
        do_close();
    }

    uint64_t id() const {
        return m_id;
    }

    uv_tcp_t *handle() {
        return m_tcp;
    }

private:
    // Carries everything the pool thread needs, the connection may be closed while the work runs
    struct work {
        uv_work_t req{};
        tcp_dns_connection *connection;
        dnsproxy *proxy;
        socket_address peer;
        uint8_vector payload;
        std::atomic_bool cancelled{false};

        work(tcp_dns_connection *c, socket_address peer, uint8_vector &&payload)
                : connection{c}
                , proxy{c->m_proxy}
                , peer{std::move(peer)}
                , payload{std::move(payload)} {
            req.data = this;
        }
    };

    struct write {
        uv_write_t req{};
        uint8_vector payload;
        uint16_t size_be; // Big-endian size
        uv_buf_t bufs[2]{};

        explicit write(uint8_vector &&payload) : payload(std::move(payload)) {
            req.data = this;
            size_be = htons(this->payload.size());
            bufs[0] = uv_buf_init((char *) &size_be, sizeof(size_be));
            bufs[1] = uv_buf_init((char *) this->payload.data(), this->payload.size());
        }
    };

    const uint64_t m_id;
    logger m_log;
    dnsproxy *m_proxy{};
    bool m_persistent{false};
    uint8_t m_incoming_buf[TCP_RECV_BUF_SIZE]{};
    uv_tcp_t *m_tcp{};
    uv_timer_t *m_idle_timer{};
    std::chrono::milliseconds m_idle_timeout{0};
    std::function<void(uint64_t)> m_close_callback;
    bool m_closed{false};
    tcp_dns_buffer m_input;
    hash_set<work *> m_pending_works;

    static void alloc_cb(uv_handle_t *handle, size_t, uv_buf_t *buf) {
        auto *c = (tcp_dns_connection *) handle->data;
        buf->base = (char *) c->m_incoming_buf;
        buf->len = sizeof(c->m_incoming_buf);
    }

    static void read_cb(uv_stream_t *stream, ssize_t nread, const uv_buf_t *) {
        auto *c = (tcp_dns_connection *) stream->data;
        log_id(c->m_log, trace, c->m_id, "{}", nread);

        if (nread < 0) {
            c->do_close();
            return;
        }

        sockaddr_storage ss{};
        int namelen = sizeof(ss);
        uv_tcp_getpeername(c->m_tcp, (sockaddr *) &ss, &namelen);
        socket_address peer{(sockaddr *) &ss};

        uint8_view data{c->m_incoming_buf, (size_t) nread};
        while (!data.empty()) {
            data = c->m_input.store(data);
            std::optional<uint8_vector> payload = c->m_input.extract_packet();
            if (!payload.has_value()) {
                continue;
            }

            uv_timer_again(c->m_idle_timer);

            auto *w = new work(c, peer, std::move(payload.value()));
            if (uv_queue_work(stream->loop, &w->req, work_cb, after_work_cb) < 0) {
                delete w;
                c->do_close();
                return;
            }
            c->m_pending_works.insert(w);

            if (!c->m_persistent) { // Stop after the first request
                uv_read_stop(stream);
                break;
            }
        }
    }

    static void work_cb(uv_work_t *w_req) {
        auto *w = (work *) w_req->data;
        if (w->cancelled) {
            return;
        }
        dns_message_info info{utils::TP_TCP, w->peer};
        w->payload = w->proxy->handle_message({w->payload.data(), w->payload.size()}, &info);
    }

    static void after_work_cb(uv_work_t *w_req, int) {
        auto *w = (work *) w_req->data;
        if (w->cancelled) { // Connection already closed
            delete w;
            return;
        }
        tcp_dns_connection *conn = w->connection;
        conn->m_pending_works.erase(w);
        if (w->payload.empty()) {
            if (!conn->m_persistent) {
                conn->do_close();
            }
            delete w;
            return;
        }
        conn->do_write(std::move(w->payload));
        delete w;
    }

    static void write_cb(uv_write_t *w_req, int status) {
        auto *w = (write *) w_req->data;
        auto *h = (uv_handle_t *) w_req->handle;
        auto *c = (tcp_dns_connection *) h->data;
        // `c` might be nullptr at this point, e.g. the connection was closed,
        // but libuv still called the pending write callbacks.
        if (c) {
            log_id(c->m_log, trace, c->m_id, "{}", status);
            if (!c->m_persistent || status < 0) {
                c->do_close();
            }
        }
        delete w;
    }

    static void idle_timeout_cb(uv_timer_t *h) {
        auto *c = (tcp_dns_connection *) h->data;
        c->do_close();
    }

    void do_read() {
        if (uv_read_start((uv_stream_t *) m_tcp, alloc_cb, read_cb) < 0) {
            do_close();
            return;
        }
        uv_timer_start(m_idle_timer, idle_timeout_cb, m_idle_timeout.count(), m_idle_timeout.count());
    }

    void do_write(uint8_vector &&payload) {
        auto *w = new write(std::move(payload));
        if (uv_write(&w->req, (uv_stream_t *) m_tcp, w->bufs, 2, write_cb) < 0) {
            delete w;
            do_close();
        }
    }

    static void close_tcp_cb(uv_handle_t *h) {
        delete (uv_tcp_t *) h;
    }

    static void close_timer_cb(uv_handle_t *h) {
        delete (uv_timer_t *) h;
    }

    void do_close() {
        if (m_closed) {
            return;
        }
        m_closed = true;

        log_id(m_log, trace, m_id, "...");
        uv_timer_stop(m_idle_timer);

        m_idle_timer->data = nullptr;
        uv_close((uv_handle_t *) m_idle_timer, close_timer_cb);

        std::for_each(m_pending_works.begin(), m_pending_works.end(), [](work *w) {
            w->cancelled = true;
            uv_cancel((uv_req_t *) &w->req);
        });

        m_tcp->data = nullptr;
        uv_close((uv_handle_t *) m_tcp, close_tcp_cb);

        if (m_close_callback) {
            // Destroys this connection
            std::function<void(uint64_t)> callback = std::move(m_close_callback);
            callback(m_id);
        }
    }
};

class listener_tcp : public listener_base {
private:
    static constexpr int BACKLOG = 128;

    uv_tcp_t m_tcp_handle{};
    uint64_t m_id_counter{0};
    hash_map<uint64_t, std::unique_ptr<tcp_dns_connection>> m_connections;

    static void conn_cb(uv_stream_t *server, int status) {
        auto *self = (listener_tcp *) server->data;

        if (status < 0) {
            log_listener(self, dbg, "Connection failed: {}", uv_strerror(status));
            return;
        }

        auto conn = std::make_unique<tcp_dns_connection>(self->m_id_counter++);

        int err = uv_tcp_init(self->m_loop.get(), conn->handle());
        if (err < 0) {
            log_listener(self, dbg, "uv_tcp_init failed: {}", uv_strerror(err));
            return;
        }

        if ((err = uv_accept(server, (uv_stream_t *) conn->handle())) < 0) {
            log_listener(self, dbg, "uv_accept failed: {}", uv_strerror(err));
            return;
        }

        tcp_dns_connection *raw = conn.get();
        self->m_connections[raw->id()] = std::move(conn);
        raw->start(self->m_loop.get(), self->m_proxy, self->m_settings.persistent, self->m_settings.idle_timeout,
                [self](uint64_t id) {
                    self->m_connections.erase(id);
                });
    }

protected:
    err_string before_run() override {
        int err = 0;

        if ((err = uv_tcp_init(m_loop.get(), &m_tcp_handle)) < 0) {
            return DG_FMT("uv_tcp_init failed: {}", uv_strerror(err));
        }
        m_tcp_handle.data = this;

        if (m_settings.fd == -1) {
            if ((err = uv_tcp_bind(&m_tcp_handle, m_address.c_sockaddr(), 0)) < 0) {
                uv_close((uv_handle_t *) &m_tcp_handle, nullptr);
                return DG_FMT("uv_tcp_bind failed: {}", uv_strerror(err));
            }
        } else {
            if ((err = uv_tcp_open(&m_tcp_handle, m_settings.fd)) < 0) {
                uv_close((uv_handle_t *) &m_tcp_handle, nullptr);
                return DG_FMT("uv_tcp_open failed: {}", uv_strerror(err));
            }
            m_settings.fd = -1; // uv_tcp_open took ownership
        }

        if ((err = uv_listen((uv_stream_t *) &m_tcp_handle, BACKLOG, conn_cb)) < 0) {
            uv_close((uv_handle_t *) &m_tcp_handle, nullptr);
            return DG_FMT("uv_listen failed: {}", uv_strerror(err));
        }

        if (!m_address.valid() || m_address.port() == 0) {
            sockaddr_storage name{};
            int namelen = sizeof(name);
            uv_tcp_getsockname(&m_tcp_handle, (sockaddr *) &name, &namelen);
            m_address = socket_address((sockaddr *) &name);
        }
        log_listener(this, info, "Listening on {} (TCP)", m_address.str());

        return std::nullopt;
    }

    void before_stop() override {
        uv_close((uv_handle_t *) &m_tcp_handle, nullptr);
        for (auto i = m_connections.begin(); i != m_connections.end();) {
            // close removes current element from the list
            auto next = std::next(i);
            i->second->close();
            i = next;
        }
    }
};

dnsproxy_listener::create_result dnsproxy_listener::create_and_listen(const listener_settings &settings,
        dnsproxy *proxy) {
    if (!proxy) {
        return {nullptr, "proxy is nullptr"};
    }

    std::unique_ptr<listener_base> ptr;
    switch (settings.protocol) {
    case utils::TP_UDP:
        ptr = std::make_unique<listener_udp>();
        break;
    case utils::TP_TCP:
        ptr = std::make_unique<listener_tcp>();
        break;
    default:
        return {nullptr, DG_FMT("Protocol {} not implemented", magic_enum::enum_name(settings.protocol))};
    }

    if (err_string err = ptr->init(settings, proxy); err.has_value()) {
        return {nullptr, std::move(err)};
    }

    return {std::move(ptr), std::nullopt};
}

} // namespace dg
