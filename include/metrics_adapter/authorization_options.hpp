// === Authorization Options ===================================================
//
// Delegated authorization: local allow lists for privileged groups and health
// endpoints, then SubjectAccessReview against a remote authority.

#pragma once

#include <string>
#include <vector>

#include "metrics_adapter/component_options.hpp"
#include "metrics_adapter/server_config.hpp"
#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

class AuthorizationOptions final : public ComponentOptions {
  public:
    AuthorizationOptions() = default;

    [[nodiscard]] ValidationErrorList validate() const override;
    void add_flags(boost::program_options::options_description& flag_set) override;

    /** @brief Build the authorizer chain into @p authorization; throws on bad paths or missing kubeconfig. */
    void apply_to(AuthorizationInfo& authorization) const;

    std::string remote_kubeconfig_file{};
    bool remote_kubeconfig_file_optional{};
    Duration allow_cache_ttl{std::chrono::seconds{10}};
    Duration deny_cache_ttl{std::chrono::seconds{10}};
    Duration client_timeout{std::chrono::seconds{10}};
    int webhook_retry_steps{5};
    std::vector<std::string> always_allow_paths{"/healthz", "/readyz", "/livez"};
    std::vector<std::string> always_allow_groups{"system:masters"};
};

}  // namespace metrics_adapter
