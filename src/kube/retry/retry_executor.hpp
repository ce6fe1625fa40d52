#ifndef KUBE_CLIENT_RETRY_EXECUTOR_HPP
#define KUBE_CLIENT_RETRY_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"
#include "../transport/interface.hpp"

namespace kube::retry {
    struct RetryPolicy {
        size_t max_attempts_ = constants::MAX_ATTEMPTS;
        std::chrono::milliseconds initial_delay_{constants::INITIAL_RETRY_DELAY_MS};
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    void sleep_for(std::chrono::milliseconds delay);

    class RetryExecutor {
       public:
        RetryExecutor(std::shared_ptr<const kube::transport::ITransport> transport, RetryPolicy policy = {}, Sleeper sleeper = &sleep_for);

        // Round trip plus status classification. Only transport failures are retried;
        // whatever status the first completed round trip returns is final.
        [[nodiscard]] std::string execute(const kube::model::Request& req) const;

        // Up to max_attempts_ invocations, sleeping initial_delay_ * 2^(n-1) after the
        // n-th failure. Rethrows the last error::TransportError unchanged.
        [[nodiscard]] kube::model::Response invoke_with_retries(const kube::model::Request& req) const;

        [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

       private:
        std::shared_ptr<const kube::transport::ITransport> transport_;
        RetryPolicy policy_;
        Sleeper sleeper_;
    };
}  // namespace kube::retry

#endif
