#include "metrics_adapter/delegated_kubeconfig.hpp"

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

#include "metrics_adapter/rest_config.hpp"

namespace metrics_adapter {

std::optional<DelegateSource> resolve_delegated_kubeconfig(const std::string& kubeconfig_file,
                                                           bool optional,
                                                           std::string_view purpose) {
    if (!kubeconfig_file.empty()) {
        const std::ifstream stream{kubeconfig_file};
        if (!stream.good()) {
            throw std::runtime_error(
                fmt::format("failed to read delegated {} kubeconfig {}", purpose, kubeconfig_file));
        }
        return DelegateSource{DelegateSourceKind::KubeconfigFile, kubeconfig_file};
    }

    if (const std::optional<RestConfig> cluster_config = in_cluster_config(); cluster_config.has_value()) {
        return DelegateSource{DelegateSourceKind::InCluster, cluster_config->host};
    }

    if (!optional) {
        throw std::runtime_error(fmt::format(
            "failed to get delegated {} kubeconfig: unable to load in-cluster configuration, "
            "KUBERNETES_SERVICE_HOST and KUBERNETES_SERVICE_PORT must be defined",
            purpose));
    }
    return std::nullopt;
}

}  // namespace metrics_adapter
