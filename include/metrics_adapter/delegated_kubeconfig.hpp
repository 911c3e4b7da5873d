// === Delegated Kubeconfig ====================================================
//
// Resolves where delegated authentication/authorization reviews are sent: an
// explicit kubeconfig file, or the in-cluster service account.

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace metrics_adapter {

enum class DelegateSourceKind {
    KubeconfigFile, /**< Operator-supplied kubeconfig path. */
    InCluster       /**< Pod service-account environment. */
};

/** @brief Resolved endpoint of the remote review authority. */
struct DelegateSource final {
    DelegateSourceKind kind{DelegateSourceKind::InCluster};
    std::string location{}; /**< Kubeconfig path or in-cluster server URL. */
};

/**
 * @brief Resolve the review authority for @p purpose ("authentication" or
 *        "authorization").
 *
 * An explicit @p kubeconfig_file must be readable. Without one the in-cluster
 * environment is used. When neither is available, std::nullopt is returned
 * if @p optional is set and std::runtime_error is thrown otherwise.
 */
std::optional<DelegateSource> resolve_delegated_kubeconfig(const std::string& kubeconfig_file,
                                                           bool optional,
                                                           std::string_view purpose);

}  // namespace metrics_adapter
