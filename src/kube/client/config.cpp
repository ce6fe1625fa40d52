#include "config.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/kube_error.hpp"

namespace kube::client {
    namespace {
        std::string read_file(const std::filesystem::path &p) {
            std::ifstream in(p, std::ios::binary);
            if (!in) {
                throw kube::error::BootstrapError(p.string(), "failed to open " + p.string());
            }

            in.seekg(0, std::ios::end);
            const std::streamoff size = in.tellg();
            if (size < 0) {
                throw kube::error::BootstrapError(p.string(), "failed to read " + p.string());
            }

            std::string s;
            s.resize(static_cast<size_t>(size));
            in.seekg(0, std::ios::beg);
            in.read(s.data(), static_cast<std::streamsize>(s.size()));
            if (!in) {
                throw kube::error::BootstrapError(p.string(), "failed to read " + p.string());
            }
            return s;
        }
    }  // namespace

    InClusterCredentials load_in_cluster_credentials(const BootstrapPaths &paths) {
        InClusterCredentials creds;

        creds.token_ = string_utils::trim(read_file(paths.token_path_));
        if (creds.token_.empty()) {
            throw kube::error::BootstrapError(paths.token_path_.string(), "service account token is empty: " + paths.token_path_.string());
        }

        creds.ca_pem_ = read_file(paths.ca_path_);
        const auto begin = creds.ca_pem_.find(constants::PEM_CERTIFICATE_BEGIN);
        if (begin == std::string::npos || creds.ca_pem_.find(constants::PEM_CERTIFICATE_END, begin) == std::string::npos) {
            throw kube::error::BootstrapError(paths.ca_path_.string(), "no PEM certificate found in " + paths.ca_path_.string());
        }

        return creds;
    }
}  // namespace kube::client
