#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace kube::log {
    SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {
        if (!logger_) {
            throw std::invalid_argument("SpdlogLogger requires a logger");
        }
    }

    void SpdlogLogger::log(std::string_view line) { logger_->info("{}", line); }

    std::shared_ptr<spdlog::logger> category_logger(const std::string& name) {
        static std::mutex registry_mutex;
        const std::lock_guard<std::mutex> lock(registry_mutex);

        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        return spdlog::stdout_color_mt(name);
    }
}  // namespace kube::log
