// === Local Authorizer ========================================================
//
// Decisions that never leave the process: privileged groups and
// always-allowed non-resource paths. Everything else yields NoOpinion and is
// deferred to the delegated authority.

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace metrics_adapter {

enum class Decision {
    Allow,     /**< Request is authorized. */
    NoOpinion  /**< This authorizer cannot decide; ask the next one. */
};

/** @brief Attributes of an authenticated request relevant to authorization. */
struct RequestAttributes final {
    std::string user{};
    std::vector<std::string> groups{};
    std::string verb{};
    std::string path{};
    bool resource_request{}; /**< False for non-resource URLs such as /healthz. */
    // Set only for resource requests.
    std::string api_group{};      /**< "" is the core group. */
    std::string namespace_name{}; /**< "" for cluster-scoped resources. */
    std::string resource{};
    std::string subresource{};
    std::string name{};
};

struct AuthorizationResult final {
    Decision decision{Decision::NoOpinion};
    std::string reason{};
};

/** @brief Union of the group authorizer and the non-resource path authorizer. */
class LocalAuthorizer final {
  public:
    /**
     * @brief Build from allow lists. A path may end in "*" to match a prefix;
     *        a "*" anywhere else throws std::invalid_argument.
     */
    LocalAuthorizer(std::vector<std::string> always_allow_groups, const std::vector<std::string>& always_allow_paths);

    [[nodiscard]] AuthorizationResult authorize(const RequestAttributes& attributes) const;

    [[nodiscard]] const std::vector<std::string>& always_allow_groups() const noexcept;
    [[nodiscard]] const std::vector<std::string>& exact_paths() const noexcept;
    [[nodiscard]] const std::vector<std::string>& prefix_paths() const noexcept;

  private:
    std::vector<std::string> list_groups_;
    std::vector<std::string> list_exact_paths_;
    std::vector<std::string> list_prefix_paths_;
};

using LocalAuthorizerPtr = std::shared_ptr<const LocalAuthorizer>;

}  // namespace metrics_adapter
