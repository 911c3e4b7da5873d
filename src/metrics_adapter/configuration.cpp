// === Configuration Loader ====================================================
//
// Reads the adapter's environment settings:
// - METRICS_ADAPTER_LOG_DIR and METRICS_ADAPTER_LOG_LEVEL for logging.
// - METRICS_ADAPTER_KUBE_API_HOST, METRICS_ADAPTER_KUBE_TOKEN_FILE,
//   METRICS_ADAPTER_KUBE_CA_FILE and METRICS_ADAPTER_KUBE_INSECURE for the
//   external cluster client. Without an explicit host the in-cluster service
//   account configuration is used when the pod environment provides one.
//
// Values that cannot be interpreted are logged and replaced by their default.

#include "metrics_adapter/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string_view>

#include "metrics_adapter/logging.hpp"

namespace metrics_adapter {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};

std::string read_env(const char* name) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return {};
    }
    return std::string{raw_value};
}

bool parse_bool(const std::string& raw_value, bool fallback) {
    if (raw_value.empty()) {
        return fallback;
    }
    std::string lowered = raw_value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (lowered == "1" || lowered == "true" || lowered == "yes") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no") {
        return false;
    }
    get_logger()->warn("Failed to parse boolean \"{}\" from environment; using fallback {}", raw_value, fallback);
    return fallback;
}

std::string parse_log_directory() {
    std::string directory = read_env("METRICS_ADAPTER_LOG_DIR");
    if (directory.empty()) {
        return std::string{k_default_log_directory};
    }
    return directory;
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    config.log_level = read_env("METRICS_ADAPTER_LOG_LEVEL");
    if (!config.log_level.empty()) {
        set_log_level(config.log_level);
    }
    logger->info("Loading configuration from environment");

    config.client_config = load_client_config();
    if (config.client_config.empty()) {
        logger->warn("No external cluster configured; set METRICS_ADAPTER_KUBE_API_HOST or run in-cluster");
    }

    logger->info("Configuration loaded: log_directory={} log_level={} cluster={}",
                 config.log_directory,
                 config.log_level.empty() ? "info" : config.log_level,
                 config.client_config.empty() ? "<none>" : config.client_config.host);
    return config;
}

RestConfig ConfigurationLoader::load_client_config() {
    const std::string host = read_env("METRICS_ADAPTER_KUBE_API_HOST");
    if (host.empty()) {
        std::optional<RestConfig> in_cluster = in_cluster_config();
        return in_cluster.value_or(RestConfig{});
    }

    RestConfig config{};
    config.host = host;
    config.bearer_token_file = read_env("METRICS_ADAPTER_KUBE_TOKEN_FILE");
    config.tls.ca_file = read_env("METRICS_ADAPTER_KUBE_CA_FILE");
    config.tls.insecure = parse_bool(read_env("METRICS_ADAPTER_KUBE_INSECURE"), false);
    return config;
}

}  // namespace metrics_adapter
