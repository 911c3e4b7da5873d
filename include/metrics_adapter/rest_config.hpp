// === REST Client Configuration ==============================================
//
// Endpoint and credential bundle used to reach an API server, both for the
// caller-supplied external cluster and for the loopback connection the server
// uses to call itself.

#pragma once

#include <optional>
#include <string>

#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

/** @brief Transport security settings for a REST client. */
struct TlsClientConfig final {
    bool insecure{};          /**< Skip server certificate verification. */
    std::string server_name{}; /**< SNI/verification name overriding the URL host. */
    std::string ca_file{};
    std::string ca_data{};
    std::string cert_file{};
    std::string cert_data{};
    std::string key_file{};
    std::string key_data{};

    [[nodiscard]] bool has_ca() const noexcept;
    [[nodiscard]] bool has_cert_auth() const noexcept;
};

/**
 * @brief Immutable-by-convention description of how to reach an API server.
 */
struct RestConfig final {
    std::string host{};             /**< "[scheme://]host[:port][/prefix]". */
    std::string api_path{"/api"};   /**< Path of the legacy core group. */
    std::string bearer_token{};
    std::string bearer_token_file{};
    TlsClientConfig tls{};
    std::string user_agent{};
    float qps{};                    /**< Sustained requests per second; 0 selects the client default. */
    int burst{};                    /**< Request burst; 0 selects the client default. */
    Duration timeout{};             /**< Per-request timeout; 0 means none. */

    /** @brief True when no endpoint has been configured. */
    [[nodiscard]] bool empty() const noexcept;
    /** @brief Printable form with secrets masked, safe for logs. */
    [[nodiscard]] std::string redacted() const;
};

/**
 * @brief Build a configuration from the pod service-account environment.
 *
 * Returns std::nullopt unless KUBERNETES_SERVICE_HOST and
 * KUBERNETES_SERVICE_PORT are both set.
 */
std::optional<RestConfig> in_cluster_config();

}  // namespace metrics_adapter
