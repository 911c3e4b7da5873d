// === Server Config ===========================================================
//
// Mutable runtime configuration of the server-to-be-started. Option components
// write into their slots during application; the caller owns the object and
// hands it to the HTTP engine afterwards.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "metrics_adapter/authorizer.hpp"
#include "metrics_adapter/certificate.hpp"
#include "metrics_adapter/delegated_kubeconfig.hpp"
#include "metrics_adapter/openapi_config.hpp"
#include "metrics_adapter/rest_config.hpp"
#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

class AuditBackend;
class AuditPolicy;
class FlowController;

/** @brief Certificate served for a specific set of SNI names. */
struct NamedCertKey final {
    std::vector<std::string> names{};
    CertKeyPair cert_key{};
};

/** @brief Everything the TLS listener needs; populated by secure serving. */
struct SecureServingInfo final {
    std::string bind_address{};
    int port{};
    CertKeyPair serving_cert{};
    std::string serving_cert_origin{};             /**< File path, or "generated" for in-memory certs. */
    std::vector<NamedCertKey> sni_certs{};
    std::vector<CertificateBundle> client_ca{};    /**< Union of client CA bundles; empty disables client certs. */
    std::vector<std::string> cipher_suites{};      /**< IANA names; empty selects library defaults. */
    std::string min_tls_version{};
    int http2_max_streams_per_connection{};
    bool permit_port_sharing{};

    /** @brief "host:port", bracketing IPv6 hosts. */
    [[nodiscard]] std::string listen_address() const;
    /** @brief Add @p bundle to the accepted client CAs. */
    void add_client_ca(const CertificateBundle& bundle);
};

/** @brief Front-proxy request-header authentication settings. */
struct RequestHeaderConfig final {
    std::vector<std::string> username_headers{};
    std::vector<std::string> uid_headers{};
    std::vector<std::string> group_headers{};
    std::vector<std::string> extra_header_prefixes{};
    std::vector<std::string> allowed_names{};
    std::optional<CertificateBundle> client_ca{};
    bool discover_from_cluster{};   /**< Missing values are read from the cluster at startup. */
    bool tolerate_lookup_failure{}; /**< Keep serving when that discovery fails. */
};

/** @brief Remote TokenReview settings. */
struct TokenReviewConfig final {
    DelegateSource source{};
    Duration cache_ttl{};
    Duration request_timeout{};
    int retry_steps{};
};

/** @brief Inbound authentication chain. */
struct AuthenticationInfo final {
    bool configured{};
    bool anonymous_allowed{};
    std::optional<CertificateBundle> client_ca{};
    std::optional<RequestHeaderConfig> request_header{};
    std::optional<TokenReviewConfig> token_review{};
    std::vector<std::string> api_audiences{}; /**< Empty means no audience restriction. */
};

/** @brief Remote SubjectAccessReview settings. */
struct SubjectAccessReviewConfig final {
    DelegateSource source{};
    Duration allow_cache_ttl{};
    Duration deny_cache_ttl{};
    Duration client_timeout{};
    int retry_steps{};
};

/** @brief Authorization chain: local allow lists, then the remote authority. */
struct AuthorizationInfo final {
    bool configured{};
    LocalAuthorizerPtr local_authorizer{};
    std::optional<SubjectAccessReviewConfig> subject_access_review{};

    /**
     * @brief Evaluate the local chain. NoOpinion means the request needs a
     *        remote review, or is refused when no remote authority exists.
     */
    [[nodiscard]] AuthorizationResult authorize(const RequestAttributes& attributes) const;
};

/** @brief Runtime configuration assembled by the options pipeline. */
struct ServerConfig final {
    std::optional<SecureServingInfo> secure_serving{};
    RestConfig loopback_client_config{};
    AuthenticationInfo authentication{};
    AuthorizationInfo authorization{};
    std::shared_ptr<AuditPolicy> audit_policy{};
    std::shared_ptr<AuditBackend> audit_backend{};
    OpenApiConfigPtr openapi_config{};
    OpenApiV3ConfigPtr openapi_v3_config{};
    bool enable_metrics{};
    bool enable_profiling{};
    bool enable_contention_profiling{};
    std::string debug_socket_path{};
    std::shared_ptr<FlowController> flow_control{};
    int max_requests_in_flight{400};
    int max_mutating_requests_in_flight{200};
};

}  // namespace metrics_adapter
