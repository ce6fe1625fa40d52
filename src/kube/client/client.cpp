#include "client.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"
#include "../model/resources.hpp"
#include "../transport/curl_transport.hpp"

using kube::model::Job;
using kube::model::List;
using kube::model::Methods;
using kube::model::Pod;
using kube::model::Request;

namespace kube::client {

    std::string labels_to_selector(const kube::model::Labels &labels) {
        std::vector<std::string> sel;
        sel.reserve(labels.size());
        for (const auto &[key, value] : labels) {
            sel.push_back(key + " = " + value);
        }
        return string_utils::join(sel, ",");
    }

    Client::Client(ClientConfig config, std::shared_ptr<const kube::transport::ITransport> transport, kube::retry::RetryPolicy policy,
                   kube::retry::Sleeper sleeper)
        : config_(std::move(config)) {
        if (!config_.fake_) {
            executor_.emplace(std::move(transport), policy, std::move(sleeper));
        }
    }

    std::unique_ptr<Client> Client::make_fake(std::shared_ptr<kube::log::ILogger> logger) {
        ClientConfig config{
            .namespace_ = constants::DEFAULT_NAMESPACE,
            .logger_ = std::move(logger),
            .fake_ = true,
        };
        return std::make_unique<Client>(std::move(config), nullptr);
    }

    std::unique_ptr<Client> Client::make_in_cluster(const std::string &ns, std::shared_ptr<kube::log::ILogger> logger, const BootstrapPaths &paths) {
        InClusterCredentials creds = load_in_cluster_credentials(paths);

        auto transport = std::make_shared<kube::transport::CurlTransport>(kube::transport::TransportOptions{
            .base_url_ = constants::IN_CLUSTER_BASE_URL,
            .token_ = creds.token_,
            .tls_ = kube::transport::TlsOptions{.ca_pem_ = std::move(creds.ca_pem_)},
        });

        ClientConfig config{
            .base_url_ = constants::IN_CLUSTER_BASE_URL,
            .token_ = std::move(creds.token_),
            .namespace_ = ns,
            .logger_ = std::move(logger),
        };
        return std::make_unique<Client>(std::move(config), std::move(transport));
    }

    std::unique_ptr<Client> Client::make_for_endpoint(const std::string &base_url, const std::string &token, const std::string &ns,
                                                      std::shared_ptr<kube::log::ILogger> logger) {
        auto transport = std::make_shared<kube::transport::CurlTransport>(kube::transport::TransportOptions{
            .base_url_ = base_url,
            .token_ = token,
        });

        ClientConfig config{
            .base_url_ = base_url,
            .token_ = token,
            .namespace_ = ns,
            .logger_ = std::move(logger),
        };
        return std::make_unique<Client>(std::move(config), std::move(transport));
    }

    void Client::log_call(std::string_view method_name, const std::vector<std::string> &args) const {
        if (!config_.logger_) {
            return;
        }
        config_.logger_->log(std::string(method_name) + "(" + string_utils::join(args, ", ") + ")");
    }

    std::string Client::pods_path() const { return "/api/v1/namespaces/" + config_.namespace_ + "/pods"; }

    std::string Client::jobs_path() const { return "/apis/batch/v1/namespaces/" + config_.namespace_ + "/jobs"; }

    std::string Client::secrets_path() const { return "/api/v1/namespaces/" + config_.namespace_ + "/secrets"; }

    void Client::request(const Request &r) const { static_cast<void>(request_retry(r)); }

    std::string Client::request_retry(const Request &r) const {
        if (config_.fake_) {
            return constants::FAKE_RESPONSE_BODY;
        }
        return executor_->execute(r);
    }

    //
    // Pods
    //

    Pod Client::get_pod(const std::string &name) const {
        log_call("get_pod", {name});
        Pod ret;
        request(Request{.method_ = Methods::GET, .path_ = pods_path() + "/" + name}, &ret);
        return ret;
    }

    std::vector<Pod> Client::list_pods(const kube::model::Labels &labels) const {
        log_call("list_pods", {nlohmann::json(labels).dump()});
        List<Pod> pl;
        request(Request{.method_ = Methods::GET, .path_ = pods_path(), .query_ = {{"labelSelector", labels_to_selector(labels)}}}, &pl);
        return std::move(pl.items_);
    }

    void Client::delete_pod(const std::string &name) const {
        log_call("delete_pod", {name});
        request(Request{.method_ = Methods::DELETE, .path_ = pods_path() + "/" + name});
    }

    Pod Client::create_pod(const Pod &pod) const {
        log_call("create_pod", {nlohmann::json(pod).dump()});
        Pod ret;
        request(Request{.method_ = Methods::POST, .path_ = pods_path(), .body_ = nlohmann::json(pod)}, &ret);
        return ret;
    }

    //
    // Jobs
    //

    Job Client::get_job(const std::string &name) const {
        log_call("get_job", {name});
        Job ret;
        request(Request{.method_ = Methods::GET, .path_ = jobs_path() + "/" + name}, &ret);
        return ret;
    }

    std::vector<Job> Client::list_jobs(const kube::model::Labels &labels) const {
        log_call("list_jobs", {nlohmann::json(labels).dump()});
        List<Job> jl;
        request(Request{.method_ = Methods::GET, .path_ = jobs_path(), .query_ = {{"labelSelector", labels_to_selector(labels)}}}, &jl);
        return std::move(jl.items_);
    }

    Job Client::create_job(const Job &job) const {
        log_call("create_job", {nlohmann::json(job).dump()});
        Job ret;
        request(Request{.method_ = Methods::POST, .path_ = jobs_path(), .body_ = nlohmann::json(job)}, &ret);
        return ret;
    }

    void Client::delete_job(const std::string &name) const {
        log_call("delete_job", {name});
        request(Request{.method_ = Methods::DELETE, .path_ = jobs_path() + "/" + name});
    }

    Job Client::patch_job(const std::string &name, const Job &job) const {
        log_call("patch_job", {name, nlohmann::json(job).dump()});
        Job ret;
        request(Request{.method_ = Methods::PATCH, .path_ = jobs_path() + "/" + name, .body_ = nlohmann::json(job)}, &ret);
        return ret;
    }

    Job Client::patch_job_status(const std::string &name, const Job &job) const {
        log_call("patch_job_status", {name, nlohmann::json(job).dump()});
        Job ret;
        request(Request{.method_ = Methods::PATCH, .path_ = jobs_path() + "/" + name + "/status", .body_ = nlohmann::json(job)}, &ret);
        return ret;
    }

    //
    // Secrets and logs
    //

    void Client::replace_secret(const std::string &name, const kube::model::Secret &secret) const {
        // the payload stays out of the log
        log_call("replace_secret", {name});
        request(Request{.method_ = Methods::PUT, .path_ = secrets_path() + "/" + name, .body_ = nlohmann::json(secret)});
    }

    std::string Client::get_log(const std::string &pod) const {
        log_call("get_log", {pod});
        return request_retry(Request{.method_ = Methods::GET, .path_ = pods_path() + "/" + pod + "/log"});
    }

}  // namespace kube::client
