#ifndef KUBE_CLIENT_CLIENT_HPP
#define KUBE_CLIENT_CLIENT_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../log/logger.hpp"
#include "../model/json_codec.hpp"
#include "../model/model.hpp"
#include "../model/resources.hpp"
#include "../retry/retry_executor.hpp"
#include "../transport/interface.hpp"
#include "config.hpp"

namespace kube::client {

    // "k1 = v1,k2 = v2", in key order.
    std::string labels_to_selector(const kube::model::Labels& labels);

    // Talks to the API server on behalf of one namespace. Immutable after
    // construction; one instance may be shared by any number of threads.
    //
    // Every call either returns a value or throws exactly one of:
    //   error::TransportError  no HTTP status after all attempts
    //   error::ConflictError   409, re-fetch and reapply above this layer
    //   error::HttpError       any other non-2xx
    //   error::DecodeError     2xx with a body that does not match the result type
    class Client {
       public:
        Client(ClientConfig config, std::shared_ptr<const kube::transport::ITransport> transport, kube::retry::RetryPolicy policy = {},
               kube::retry::Sleeper sleeper = &kube::retry::sleep_for);

        ~Client() = default;
        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;
        Client(Client&&) = delete;
        Client& operator=(Client&&) = delete;

        // No network resources; every call answers "{}".
        static std::unique_ptr<Client> make_fake(std::shared_ptr<kube::log::ILogger> logger = nullptr);
        static std::unique_ptr<Client> make_in_cluster(const std::string& ns, std::shared_ptr<kube::log::ILogger> logger = nullptr,
                                                       const BootstrapPaths& paths = {});
        static std::unique_ptr<Client> make_for_endpoint(const std::string& base_url, const std::string& token, const std::string& ns,
                                                         std::shared_ptr<kube::log::ILogger> logger = nullptr);

        [[nodiscard]] kube::model::Pod get_pod(const std::string& name) const;
        [[nodiscard]] std::vector<kube::model::Pod> list_pods(const kube::model::Labels& labels) const;
        void delete_pod(const std::string& name) const;
        kube::model::Pod create_pod(const kube::model::Pod& pod) const;

        [[nodiscard]] kube::model::Job get_job(const std::string& name) const;
        [[nodiscard]] std::vector<kube::model::Job> list_jobs(const kube::model::Labels& labels) const;
        kube::model::Job create_job(const kube::model::Job& job) const;
        void delete_job(const std::string& name) const;
        kube::model::Job patch_job(const std::string& name, const kube::model::Job& job) const;
        kube::model::Job patch_job_status(const std::string& name, const kube::model::Job& job) const;

        void replace_secret(const std::string& name, const kube::model::Secret& secret) const;

        [[nodiscard]] std::string get_log(const std::string& pod) const;

        // The single chokepoint behind every method above.
        template <typename T>
        void request(const kube::model::Request& r, T* result) const;
        void request(const kube::model::Request& r) const;

        [[nodiscard]] std::string request_retry(const kube::model::Request& r) const;

        [[nodiscard]] const ClientConfig& config() const { return config_; }

       private:
        void log_call(std::string_view method_name, const std::vector<std::string>& args) const;
        [[nodiscard]] std::string pods_path() const;
        [[nodiscard]] std::string jobs_path() const;
        [[nodiscard]] std::string secrets_path() const;

        const ClientConfig config_;
        std::optional<kube::retry::RetryExecutor> executor_;
    };

    template <typename T>
    void Client::request(const kube::model::Request& r, T* result) const {
        const std::string out = request_retry(r);
        if (result != nullptr) {
            *result = kube::model::decode_document<T>(out);
        }
    }

}  // namespace kube::client

#endif
