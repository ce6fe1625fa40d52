#include "retry_executor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <thread>

#include "../error/kube_error.hpp"
#include "../log/logger.hpp"
#include "../model/model.hpp"
#include "../response/interpreter.hpp"

using namespace std::chrono;

namespace kube::retry {
    namespace {
        std::shared_ptr<spdlog::logger> retry_log() {
            static auto logger = kube::log::category_logger("kube.retry");
            return logger;
        }
    }  // namespace

    void sleep_for(milliseconds delay) { std::this_thread::sleep_for(delay); }

    RetryExecutor::RetryExecutor(std::shared_ptr<const kube::transport::ITransport> transport, RetryPolicy policy, Sleeper sleeper)
        : transport_(std::move(transport)), policy_(policy), sleeper_(std::move(sleeper)) {
        if (!transport_) {
            throw std::invalid_argument("RetryExecutor requires a transport");
        }
        if (policy_.max_attempts_ == 0) {
            throw std::invalid_argument("RetryPolicy max_attempts_ must be at least 1");
        }
        if (!sleeper_) {
            throw std::invalid_argument("RetryExecutor requires a sleeper");
        }
    }

    std::string RetryExecutor::execute(const kube::model::Request& req) const { return kube::response::interpret(invoke_with_retries(req)); }

    kube::model::Response RetryExecutor::invoke_with_retries(const kube::model::Request& req) const {
        milliseconds delay = policy_.initial_delay_;

        for (size_t attempt = 1;; ++attempt) {
            try {
                return transport_->invoke(req);
            } catch (const kube::error::TransportError& e) {
                if (attempt >= policy_.max_attempts_) {
                    retry_log()->debug("{} {} gave up after {} attempts: {}", req.method_, req.path_, attempt, e.what());
                    throw;
                }
                retry_log()->debug("{} {} attempt {}/{} failed, retrying in {}ms: {}", req.method_, req.path_, attempt, policy_.max_attempts_,
                                   delay.count(), e.what());
            }

            sleeper_(delay);
            delay *= 2;
        }
    }
}  // namespace kube::retry
