// === Authentication Options ==================================================
//
// Delegated authentication: client certificates, front-proxy request headers,
// and bearer tokens reviewed by a remote TokenReview authority.

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "metrics_adapter/component_options.hpp"
#include "metrics_adapter/server_config.hpp"
#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

/** @brief Supplies accepted token audiences; an empty function means no restriction. */
using AudienceGetter = std::function<std::vector<std::string>()>;

/** @brief Request-header (front-proxy) authentication flags. */
struct RequestHeaderOptions final {
    std::string client_ca_file{};
    std::vector<std::string> username_headers{"X-Remote-User"};
    std::vector<std::string> uid_headers{"X-Remote-Uid"};
    std::vector<std::string> group_headers{"X-Remote-Group"};
    std::vector<std::string> extra_header_prefixes{"X-Remote-Extra-"};
    std::vector<std::string> allowed_names{};
};

class AuthenticationOptions final : public ComponentOptions {
  public:
    AuthenticationOptions() = default;

    [[nodiscard]] ValidationErrorList validate() const override;
    void add_flags(boost::program_options::options_description& flag_set) override;

    /**
     * @brief Build the authentication chain into @p authentication.
     *
     * A configured client CA is also attached to @p serving when it is not
     * null. Throws when a CA bundle cannot be loaded or the delegated
     * kubeconfig is required but unavailable.
     */
    void apply_to(AuthenticationInfo& authentication,
                  SecureServingInfo* serving,
                  const AudienceGetter& audiences) const;

    std::string remote_kubeconfig_file{};
    bool remote_kubeconfig_file_optional{};
    Duration cache_ttl{std::chrono::seconds{10}};
    Duration token_request_timeout{std::chrono::seconds{10}};
    int webhook_retry_steps{5};
    bool skip_in_cluster_lookup{};
    bool tolerate_in_cluster_lookup_failure{};
    bool anonymous{true};
    std::string client_ca_file{};
    RequestHeaderOptions request_header{};
};

}  // namespace metrics_adapter
