#include "metrics_adapter/feature_options.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>

#include "metrics_adapter/flow_control.hpp"
#include "metrics_adapter/logging.hpp"

namespace metrics_adapter {

namespace po = boost::program_options;

ValidationErrorList FeatureOptions::validate() const {
    ValidationErrorList errors;
    if (!debug_socket_path.empty() && !std::filesystem::path{debug_socket_path}.is_absolute()) {
        errors.push_back({"debug-socket-path", "must be an absolute path, got " + debug_socket_path});
    }
    return errors;
}

void FeatureOptions::add_flags(po::options_description& flag_set) {
    flag_set.add_options()
        ("profiling", switch_value(enable_profiling),
         "Enable profiling via web interface host:port/debug/pprof/")
        ("contention-profiling", switch_value(enable_contention_profiling),
         "Enable block profiling, if profiling is enabled")
        ("debug-socket-path", po::value<std::string>(&debug_socket_path)->default_value(debug_socket_path),
         "Use an unprotected (no authn/authz) unix-domain socket for profiling with the given path")
        ("enable-priority-and-fairness", switch_value(enable_priority_and_fairness),
         "If true, replace the max-in-flight handler with an enhanced one that queues and dispatches "
         "with priority and fairness");
}

void FeatureOptions::apply_to(ServerConfig& server_config,
                              const ApiClientPtr& client,
                              const SharedInformerFactoryPtr& informers) const {
    server_config.enable_profiling = enable_profiling;
    server_config.enable_contention_profiling = enable_contention_profiling;
    server_config.debug_socket_path = debug_socket_path;

    if (!enable_priority_and_fairness) {
        return;
    }

    const int concurrency_limit = server_config.max_requests_in_flight + server_config.max_mutating_requests_in_flight;
    if (concurrency_limit <= 0) {
        throw std::invalid_argument(
            "max-requests-in-flight and max-mutating-requests-in-flight must add up to a positive value "
            "when priority and fairness is enabled");
    }
    server_config.flow_control = std::make_shared<FlowController>(client, informers, concurrency_limit);
    get_logger()->info("Priority and fairness enabled with server concurrency limit {}", concurrency_limit);
}

}  // namespace metrics_adapter
