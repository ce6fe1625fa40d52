#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/kube/client/client.hpp"
#include "src/kube/error/kube_error.hpp"
#include "src/kube/log/logger.hpp"
#include "src/kube/model/model.hpp"
#include "src/kube/transport/curl_global.hpp"
#include "src/utils/constants.hpp"

namespace {
    std::string env_or(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return value != nullptr ? std::string(value) : fallback;
    }

    kube::model::Labels parse_labels(const std::vector<std::string>& args) {
        kube::model::Labels labels;
        for (const auto& arg : args) {
            const auto pos = arg.find('=');
            if (pos == std::string::npos || pos == 0) {
                throw std::invalid_argument("label must look like key=value: " + arg);
            }
            labels[arg.substr(0, pos)] = arg.substr(pos + 1);
        }
        return labels;
    }

    int usage() {
        std::cerr << "usage: kube_client_cli pods [key=value ...]\n"
                     "       kube_client_cli jobs [key=value ...]\n"
                     "       kube_client_cli log <pod>\n";
        return 1;
    }
}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        return usage();
    }

    try {
        //
        // Collect
        //

        const std::string ns = env_or("KUBE_NAMESPACE", constants::DEFAULT_NAMESPACE);
        const std::string api_url = env_or("KUBE_API_URL", "");
        const std::string token = env_or("KUBE_TOKEN", "");
        const bool is_fake = env_or("KUBE_FAKE", "") == "1";

        if (env_or("KUBE_DEBUG", "") == "1") {
            spdlog::set_level(spdlog::level::debug);
        }

        kube::transport::CurlGlobal curl_global;

        auto logger = std::make_shared<kube::log::SpdlogLogger>(kube::log::category_logger("kube.client"));

        std::unique_ptr<kube::client::Client> client;
        if (is_fake) {
            client = kube::client::Client::make_fake(logger);
        } else if (!api_url.empty()) {
            client = kube::client::Client::make_for_endpoint(api_url, token, ns, logger);
        } else {
            client = kube::client::Client::make_in_cluster(ns, logger);
        }

        //
        // Run
        //

        const std::string& command = args[0];
        const std::vector<std::string> rest(args.begin() + 1, args.end());

        if (command == "pods") {
            for (const auto& pod : client->list_pods(parse_labels(rest))) {
                std::cout << pod.metadata_.name_ << "\t" << pod.status_.phase_ << "\n";
            }
        } else if (command == "jobs") {
            for (const auto& job : client->list_jobs(parse_labels(rest))) {
                std::cout << job.metadata_.name_ << "\tactive=" << job.status_.active_ << " succeeded=" << job.status_.succeeded_
                          << " failed=" << job.status_.failed_ << "\n";
            }
        } else if (command == "log" && rest.size() == 1) {
            std::cout << client->get_log(rest[0]);
        } else {
            return usage();
        }
    } catch (const kube::error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (status: " << e.status_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
