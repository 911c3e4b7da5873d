#include "metrics_adapter/api_client.hpp"

#include <cctype>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "metrics_adapter/shared_informer_factory.hpp"
#include "metrics_adapter/version.hpp"

namespace metrics_adapter {

namespace {
constexpr float k_default_qps{5.0F};
constexpr int k_default_burst{10};

int default_port_for(const std::string& scheme) {
    return scheme == "http" ? 80 : 443;
}

int parse_port(std::string_view raw_port, const std::string& raw_host) {
    if (raw_port.empty()) {
        throw ClientConstructionError("host " + raw_host + " has an empty port");
    }
    int port = 0;
    for (const char digit : raw_port) {
        if (std::isdigit(static_cast<unsigned char>(digit)) == 0) {
            throw ClientConstructionError("host " + raw_host + " has a non-numeric port");
        }
        port = port * 10 + (digit - '0');
        if (port > 65535) {
            break;
        }
    }
    if (port < 1 || port > 65535) {
        throw ClientConstructionError("host " + raw_host + " has a port outside 1-65535");
    }
    return port;
}

void validate_tls(const TlsClientConfig& tls) {
    if (tls.insecure && tls.has_ca()) {
        throw ClientConstructionError("specifying a root certificates file with the insecure flag is not allowed");
    }
    if (!tls.ca_file.empty() && !tls.ca_data.empty()) {
        throw ClientConstructionError("ca file and ca data cannot both be specified");
    }
    if (!tls.cert_file.empty() && !tls.cert_data.empty()) {
        throw ClientConstructionError("client cert file and client cert data cannot both be specified");
    }
    if (!tls.key_file.empty() && !tls.key_data.empty()) {
        throw ClientConstructionError("client key file and client key data cannot both be specified");
    }
    const bool has_cert = !tls.cert_file.empty() || !tls.cert_data.empty();
    const bool has_key = !tls.key_file.empty() || !tls.key_data.empty();
    if (has_cert != has_key) {
        throw ClientConstructionError("client certificate and key must be supplied together");
    }
}
}  // namespace

ClientConstructionError::ClientConstructionError(const std::string& message)
    : std::runtime_error(message) {}

std::string ServerUrl::to_string() const {
    const bool is_ipv6 = host.find(':') != std::string::npos;
    return fmt::format("{}://{}{}{}:{}{}", scheme, is_ipv6 ? "[" : "", host, is_ipv6 ? "]" : "", port, path_prefix);
}

ServerUrl parse_server_url(const std::string& raw_host) {
    if (raw_host.empty()) {
        throw ClientConstructionError("host must be a URL or a host:port pair");
    }

    ServerUrl url{};
    std::string_view rest{raw_host};
    if (const std::size_t scheme_end = rest.find("://"); scheme_end != std::string_view::npos) {
        url.scheme = std::string{rest.substr(0, scheme_end)};
        rest.remove_prefix(scheme_end + 3);
    } else {
        url.scheme = "https";
    }
    if (url.scheme != "https" && url.scheme != "http") {
        throw ClientConstructionError("host " + raw_host + " uses unsupported scheme " + url.scheme);
    }

    const std::size_t path_start = rest.find('/');
    std::string_view authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        url.path_prefix = std::string{rest.substr(path_start)};
        while (!url.path_prefix.empty() && url.path_prefix.back() == '/') {
            url.path_prefix.pop_back();
        }
    }
    if (authority.empty()) {
        throw ClientConstructionError("host " + raw_host + " has no hostname");
    }

    if (authority.front() == '[') {
        const std::size_t bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            throw ClientConstructionError("host " + raw_host + " has an unterminated IPv6 literal");
        }
        url.host = std::string{authority.substr(1, bracket_end - 1)};
        std::string_view after = authority.substr(bracket_end + 1);
        if (after.empty()) {
            url.port = default_port_for(url.scheme);
        } else if (after.front() == ':') {
            url.port = parse_port(after.substr(1), raw_host);
        } else {
            throw ClientConstructionError("host " + raw_host + " has trailing data after the IPv6 literal");
        }
    } else {
        const std::size_t colon = authority.rfind(':');
        if (colon != std::string_view::npos && authority.find(':') != colon) {
            throw ClientConstructionError("host " + raw_host + " has an IPv6 literal that must be enclosed in brackets");
        }
        if (colon == std::string_view::npos) {
            url.host = std::string{authority};
            url.port = default_port_for(url.scheme);
        } else {
            url.host = std::string{authority.substr(0, colon)};
            url.port = parse_port(authority.substr(colon + 1), raw_host);
        }
    }
    if (url.host.empty()) {
        throw ClientConstructionError("host " + raw_host + " has no hostname");
    }
    return url;
}

ApiClient::ApiClient(RestConfig config, ServerUrl server_url)
    : config_(std::move(config)),
      server_url_(std::move(server_url)) {}

const RestConfig& ApiClient::config() const noexcept {
    return config_;
}

const ServerUrl& ApiClient::server_url() const noexcept {
    return server_url_;
}

float ApiClient::qps() const noexcept {
    return config_.qps;
}

int ApiClient::burst() const noexcept {
    return config_.burst;
}

const std::string& ApiClient::user_agent() const noexcept {
    return config_.user_agent;
}

std::string ApiClient::resource_path(const std::string& group,
                                     const std::string& version,
                                     const std::string& resource) const {
    if (group.empty()) {
        return fmt::format("{}{}/{}/{}", server_url_.path_prefix, config_.api_path, version, resource);
    }
    return fmt::format("{}/apis/{}/{}/{}", server_url_.path_prefix, group, version, resource);
}

ApiClientPtr DefaultClientFactory::new_for_config(const RestConfig& config) const {
    ServerUrl server_url = parse_server_url(config.host);
    validate_tls(config.tls);

    if (config.qps < 0.0F || config.burst < 0) {
        throw ClientConstructionError("qps and burst must not be negative");
    }
    if (config.qps > 0.0F && config.burst <= 0) {
        throw ClientConstructionError(
            "burst is required to be greater than 0 when RateLimiter is not set and QPS is set to greater than 0");
    }

    RestConfig effective = config;
    if (effective.qps == 0.0F) {
        effective.qps = k_default_qps;
    }
    if (effective.burst == 0) {
        effective.burst = k_default_burst;
    }
    if (effective.api_path.empty()) {
        effective.api_path = "/api";
    }
    if (effective.user_agent.empty()) {
        effective.user_agent = fmt::format("metrics-adapter/{}", k_version);
    }
    return std::make_shared<ApiClient>(std::move(effective), std::move(server_url));
}

SharedInformerFactoryPtr DefaultClientFactory::new_informer_factory(ApiClientPtr client, Duration resync_period) const {
    return std::make_shared<SharedInformerFactory>(std::move(client), resync_period);
}

}  // namespace metrics_adapter
