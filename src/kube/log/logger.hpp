#ifndef KUBE_CLIENT_LOGGER_HPP
#define KUBE_CLIENT_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace kube::log {
    // Sink for the client's call log. One line per public call; never receives
    // credentials or secret payloads.
    class ILogger {
       public:
        ILogger() = default;
        virtual ~ILogger() = default;
        ILogger(const ILogger&) = delete;
        ILogger& operator=(const ILogger&) = delete;
        ILogger(ILogger&&) = delete;
        ILogger& operator=(ILogger&&) = delete;

        virtual void log(std::string_view line) = 0;
    };

    class SpdlogLogger : public ILogger {
       public:
        explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

        void log(std::string_view line) override;

       private:
        std::shared_ptr<spdlog::logger> logger_;
    };

    // Named stdout logger, created on first use and shared afterwards.
    std::shared_ptr<spdlog::logger> category_logger(const std::string& name);
}  // namespace kube::log

#endif
