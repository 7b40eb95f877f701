#include "stumper/core/sink.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <string>
#include <utility>

namespace stumper::core {
namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(Severity level) noexcept {
    switch (level) {
    case Severity::trace:
        return spdlog::level::trace;
    case Severity::debug:
        return spdlog::level::debug;
    case Severity::info:
    case Severity::notice:
        return spdlog::level::info;
    case Severity::warning:
        return spdlog::level::warn;
    case Severity::error:
        return spdlog::level::err;
    case Severity::fault:
        return spdlog::level::critical;
    }
    return spdlog::level::critical;
}

class SpdlogSink final : public Sink {
public:
    explicit SpdlogSink(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {}

    void write(Severity level, std::string_view text) noexcept override {
        // spdlog::logger::log 内部捕获格式化/写入异常并交给其 error handler。
        logger_->log(to_spdlog_level(level),
                     spdlog::string_view_t{text.data(), text.size()});
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

std::mutex &registry_mutex() {
    static std::mutex m;
    return m;
}

std::mutex &default_sink_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<Sink> &default_sink_slot() {
    static std::shared_ptr<Sink> sink;
    return sink;
}

} // namespace

std::shared_ptr<Sink> make_spdlog_sink(std::string_view name) {
    const std::string logger_name{name};

    std::lock_guard<std::mutex> lk(registry_mutex());
    auto logger = spdlog::get(logger_name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(logger_name);
        logger->set_level(spdlog::level::trace);
        // 行内已带级别标记，这里只保留时间与分类。
        logger->set_pattern("[%H:%M:%S.%e] [%n] %v");
    }
    return std::make_shared<SpdlogSink>(std::move(logger));
}

std::shared_ptr<Sink> default_sink() {
    std::lock_guard<std::mutex> lk(default_sink_mutex());
    auto &slot = default_sink_slot();
    if (!slot) {
        slot = make_spdlog_sink(kDefaultCategory);
    }
    return slot;
}

void set_default_sink(std::shared_ptr<Sink> sink) {
    std::lock_guard<std::mutex> lk(default_sink_mutex());
    // 置空后下一次 default_sink() 会重新绑定到 spdlog 默认分类。
    default_sink_slot() = std::move(sink);
}

} // namespace stumper::core
