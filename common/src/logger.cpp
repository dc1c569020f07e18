#include <atomic>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <memory>
#include <mutex>
#include <utility>
#include <unistd.h>
#include <sys/syscall.h>
#include <magic_enum.hpp>
#include <spdlog/sinks/base_sink.h>
#include <dg_logger.h>

static intmax_t current_tid() {
    return (intmax_t) syscall(SYS_gettid);
}

static void default_callback(dg::log_level lvl, const char *message, size_t length) {
    using namespace std::chrono;

    system_clock::time_point now = system_clock::now();
    std::time_t time = system_clock::to_time_t(now);

    tm tm = {};
    localtime_r(&time, &tm);

    char time_str[20];
    strftime(time_str, sizeof(time_str), "%d.%m.%Y %H:%M:%S", &tm);

    fprintf(stderr, "%s.%06d [%" PRIdMAX "] [%s] %.*s",
            time_str, (int) (duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000),
            current_tid(),
            magic_enum::enum_name(lvl).data(),
            (int) length, message);
}

struct global_info {
    std::atomic<dg::log_level> default_log_level = dg::INFO;
    std::shared_ptr<dg::logger_cb> callback = std::make_shared<dg::logger_cb>(default_callback);

    global_info() {
        spdlog::set_pattern("[%n] %v");
    }
};

static global_info *get_globals() {
    static global_info info;
    return &info;
}

// Routes every formatted record to the currently installed callback
struct callback_sink : spdlog::sinks::base_sink<std::mutex> {
    void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);

        std::shared_ptr<dg::logger_cb> callback = std::atomic_load(&get_globals()->callback);
        (*callback)((dg::log_level) msg.level, formatted.data(), formatted.size());
    }

    void flush_() override {
    }
};

dg::logger dg::create_logger(const std::string &name) {
    static std::mutex registry_mtx;
    std::scoped_lock l(registry_mtx);
    dg::logger logger = spdlog::get(name);
    if (logger == nullptr) {
        logger = spdlog::default_factory::create<callback_sink>(name);
        logger->set_level((spdlog::level::level_enum) get_globals()->default_log_level.load());
    }
    return logger;
}

void dg::set_default_log_level(dg::log_level lvl) {
    get_globals()->default_log_level.store(lvl);
    spdlog::set_level((spdlog::level::level_enum) lvl);
}

void dg::set_logger_callback(dg::logger_cb cb) {
    std::atomic_store(&get_globals()->callback, std::make_shared<dg::logger_cb>(
            cb ? std::move(cb) : default_callback));
}
