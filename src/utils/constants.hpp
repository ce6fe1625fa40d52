#ifndef KUBE_CLIENT_CONSTANTS_HPP
#define KUBE_CLIENT_CONSTANTS_HPP

#include <cstddef>

namespace constants {
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;

    inline constexpr std::size_t MAX_ATTEMPTS = 8;
    inline constexpr long INITIAL_RETRY_DELAY_MS = 2'000L;

    inline constexpr long HTTP_OK = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
    inline constexpr long HTTP_CONFLICT = 409;

    inline constexpr const char* IN_CLUSTER_BASE_URL = "https://kubernetes";
    inline constexpr const char* SERVICE_ACCOUNT_TOKEN_PATH = "/var/run/secrets/kubernetes.io/serviceaccount/token";
    inline constexpr const char* SERVICE_ACCOUNT_CA_PATH = "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt";
    inline constexpr const char* PEM_CERTIFICATE_BEGIN = "-----BEGIN CERTIFICATE-----";
    inline constexpr const char* PEM_CERTIFICATE_END = "-----END CERTIFICATE-----";
    inline constexpr const char* DEFAULT_NAMESPACE = "default";
    inline constexpr const char* FAKE_RESPONSE_BODY = "{}";

    inline constexpr const char* JSON_CONTENT_TYPE = "application/json";
    inline constexpr const char* MERGE_PATCH_CONTENT_TYPE = "application/strategic-merge-patch+json";

    inline constexpr std::size_t ERROR_PREVIEW_LENGTH = 512;
}  // namespace constants

#endif
