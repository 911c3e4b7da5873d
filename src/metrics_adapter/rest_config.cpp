#include "metrics_adapter/rest_config.hpp"

#include <cstdlib>
#include <string_view>

#include <fmt/format.h>

namespace metrics_adapter {

namespace {
constexpr char k_service_account_token_file[] = "/var/run/secrets/kubernetes.io/serviceaccount/token";
constexpr char k_service_account_ca_file[] = "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt";
constexpr std::string_view k_redacted{"--- REDACTED ---"};

std::string_view mask(const std::string& secret) {
    return secret.empty() ? std::string_view{} : k_redacted;
}
}  // namespace

bool TlsClientConfig::has_ca() const noexcept {
    return !ca_file.empty() || !ca_data.empty();
}

bool TlsClientConfig::has_cert_auth() const noexcept {
    return (!cert_file.empty() || !cert_data.empty()) && (!key_file.empty() || !key_data.empty());
}

bool RestConfig::empty() const noexcept {
    return host.empty();
}

std::string RestConfig::redacted() const {
    return fmt::format(
        "RestConfig{{host:\"{}\", api_path:\"{}\", bearer_token:\"{}\", bearer_token_file:\"{}\", "
        "tls:{{insecure:{}, server_name:\"{}\", ca_file:\"{}\", ca_data:{} bytes, cert_file:\"{}\", "
        "key_file:\"{}\", key_data:\"{}\"}}, user_agent:\"{}\", qps:{}, burst:{}, timeout:{}}}",
        host,
        api_path,
        mask(bearer_token),
        bearer_token_file,
        tls.insecure,
        tls.server_name,
        tls.ca_file,
        tls.ca_data.size(),
        tls.cert_file,
        tls.key_file,
        mask(tls.key_data),
        user_agent,
        qps,
        burst,
        format_duration(timeout)
    );
}

std::optional<RestConfig> in_cluster_config() {
    const char* service_host = std::getenv("KUBERNETES_SERVICE_HOST");
    const char* service_port = std::getenv("KUBERNETES_SERVICE_PORT");
    if (service_host == nullptr || service_port == nullptr
        || std::string_view{service_host}.empty() || std::string_view{service_port}.empty()) {
        return std::nullopt;
    }

    std::string host_part{service_host};
    if (const auto address = parse_ip(host_part); address.has_value() && address->family == IpFamily::V6) {
        host_part = "[" + host_part + "]";
    }

    RestConfig config{};
    config.host = fmt::format("https://{}:{}", host_part, service_port);
    config.bearer_token_file = k_service_account_token_file;
    config.tls.ca_file = k_service_account_ca_file;
    return config;
}

}  // namespace metrics_adapter
