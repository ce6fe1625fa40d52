#ifndef KUBE_CLIENT_CONFIG_HPP
#define KUBE_CLIENT_CONFIG_HPP

#include <filesystem>
#include <memory>
#include <string>

#include "../../utils/constants.hpp"
#include "../log/logger.hpp"

namespace kube::client {
    struct ClientConfig {
        std::string base_url_;
        std::string token_;
        std::string namespace_ = constants::DEFAULT_NAMESPACE;
        // Optional. Shared by every call, so it must tolerate concurrent use.
        std::shared_ptr<kube::log::ILogger> logger_;
        bool fake_ = false;
    };

    struct BootstrapPaths {
        std::filesystem::path token_path_{constants::SERVICE_ACCOUNT_TOKEN_PATH};
        std::filesystem::path ca_path_{constants::SERVICE_ACCOUNT_CA_PATH};
    };

    struct InClusterCredentials {
        std::string token_;
        std::string ca_pem_;
    };

    // Reads the service account token and CA bundle. Throws error::BootstrapError when
    // either file is unreadable or the bundle holds no PEM certificate.
    InClusterCredentials load_in_cluster_credentials(const BootstrapPaths& paths);
}  // namespace kube::client

#endif
