#include "metrics_adapter/secure_serving_options.hpp"

#include <array>
#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "metrics_adapter/logging.hpp"
#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

namespace po = boost::program_options;

namespace {

struct CipherSuiteName final {
    std::string_view iana;
    std::string_view openssl;
};

constexpr std::array<CipherSuiteName, 19> k_cipher_suites{{
    {"TLS_AES_128_GCM_SHA256", "TLS_AES_128_GCM_SHA256"},
    {"TLS_AES_256_GCM_SHA384", "TLS_AES_256_GCM_SHA384"},
    {"TLS_CHACHA20_POLY1305_SHA256", "TLS_CHACHA20_POLY1305_SHA256"},
    {"TLS_ECDHE_ECDSA_WITH_AES_128_CBC_SHA", "ECDHE-ECDSA-AES128-SHA"},
    {"TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256", "ECDHE-ECDSA-AES128-GCM-SHA256"},
    {"TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA", "ECDHE-ECDSA-AES256-SHA"},
    {"TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384", "ECDHE-ECDSA-AES256-GCM-SHA384"},
    {"TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305", "ECDHE-ECDSA-CHACHA20-POLY1305"},
    {"TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256", "ECDHE-ECDSA-CHACHA20-POLY1305"},
    {"TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA", "ECDHE-RSA-AES128-SHA"},
    {"TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256", "ECDHE-RSA-AES128-GCM-SHA256"},
    {"TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA", "ECDHE-RSA-AES256-SHA"},
    {"TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384", "ECDHE-RSA-AES256-GCM-SHA384"},
    {"TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305", "ECDHE-RSA-CHACHA20-POLY1305"},
    {"TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256", "ECDHE-RSA-CHACHA20-POLY1305"},
    {"TLS_RSA_WITH_AES_128_CBC_SHA", "AES128-SHA"},
    {"TLS_RSA_WITH_AES_128_GCM_SHA256", "AES128-GCM-SHA256"},
    {"TLS_RSA_WITH_AES_256_CBC_SHA", "AES256-SHA"},
    {"TLS_RSA_WITH_AES_256_GCM_SHA384", "AES256-GCM-SHA384"},
}};

struct TlsVersionName final {
    std::string_view flag_value;
    std::string_view openssl;
};

constexpr std::array<TlsVersionName, 4> k_tls_versions{{
    {"VersionTLS10", "TLSv1"},
    {"VersionTLS11", "TLSv1.1"},
    {"VersionTLS12", "TLSv1.2"},
    {"VersionTLS13", "TLSv1.3"},
}};

constexpr std::size_t k_loopback_token_bytes{16};
constexpr float k_loopback_qps{50.0F};
constexpr int k_loopback_burst{100};

/**
 * @brief Host:port the server can reach itself on, replacing wildcard binds
 *        with the matching loopback address.
 */
std::string loopback_host_port(const std::string& bind_address, int port) {
    const std::optional<IpAddress> address = parse_ip(bind_address);
    if (!address.has_value()) {
        return fmt::format("{}:{}", bind_address, port);
    }
    if (address->family == IpFamily::V6) {
        return fmt::format("[{}]:{}", address->unspecified ? "::1" : address->text, port);
    }
    return fmt::format("{}:{}", address->unspecified ? "127.0.0.1" : address->text, port);
}

}  // namespace

std::string openssl_cipher_name(const std::string& iana_name) {
    for (const CipherSuiteName& suite : k_cipher_suites) {
        if (suite.iana == iana_name) {
            return std::string{suite.openssl};
        }
    }
    throw std::invalid_argument("cipher suite " + iana_name + " not supported or doesn't exist");
}

std::string openssl_tls_version(const std::string& flag_value) {
    for (const TlsVersionName& version : k_tls_versions) {
        if (version.flag_value == flag_value) {
            return std::string{version.openssl};
        }
    }
    throw std::invalid_argument("unknown tls version " + flag_value);
}

ValidationErrorList SecureServingOptions::validate() const {
    ValidationErrorList errors;

    if (required && bind_port == 0) {
        errors.push_back({"secure-port", fmt::format(
            "{} must be between 1 and 65535, inclusive. It cannot be turned off with 0", bind_port)});
    } else if (bind_port < 0 || bind_port > 65535) {
        errors.push_back({"secure-port", fmt::format(
            "{} must be between 0 and 65535, inclusive. 0 for turning off secure port", bind_port)});
    }

    if (!parse_ip(bind_address).has_value()) {
        errors.push_back({"bind-address", fmt::format("\"{}\" is not a valid IP address", bind_address)});
    }

    if (tls_cert_file.empty() != tls_private_key_file.empty()) {
        errors.push_back({"tls-cert-file", "must be specified together with --tls-private-key-file"});
    }
    if (!cert_directory.empty() && pair_name.empty()) {
        errors.push_back({"cert-dir", "a certificate pair name is required when --cert-dir is set"});
    }

    if (!min_tls_version.empty()) {
        try {
            static_cast<void>(openssl_tls_version(min_tls_version));
        } catch (const std::invalid_argument& exc) {
            errors.push_back({"tls-min-version", exc.what()});
        }
    }

    if (http2_max_streams_per_connection < 0) {
        errors.push_back({"http2-max-streams-per-connection", "must not be negative"});
    }

    return errors;
}

void SecureServingOptions::add_flags(po::options_description& flag_set) {
    flag_set.add_options()
        ("bind-address", po::value<std::string>(&bind_address)->default_value(bind_address),
         "The IP address on which to listen for the --secure-port port.")
        ("secure-port", po::value<int>(&bind_port)->default_value(bind_port),
         "The port on which to serve HTTPS with authentication and authorization.")
        ("cert-dir", po::value<std::string>(&cert_directory)->default_value(cert_directory),
         "The directory where the TLS certs are located. Ignored if --tls-cert-file and --tls-private-key-file are provided.")
        ("tls-cert-file", po::value<std::string>(&tls_cert_file)->default_value(tls_cert_file),
         "File containing the default x509 certificate for HTTPS. If unset, a self-signed certificate is generated.")
        ("tls-private-key-file", po::value<std::string>(&tls_private_key_file)->default_value(tls_private_key_file),
         "File containing the default x509 private key matching --tls-cert-file.")
        ("tls-cipher-suites", list_value(cipher_suites),
         "Comma-separated list of cipher suites for the server. If omitted, the default cipher suites are used.")
        ("tls-min-version", po::value<std::string>(&min_tls_version)->default_value(min_tls_version),
         "Minimum TLS version supported. Possible values: VersionTLS10, VersionTLS11, VersionTLS12, VersionTLS13.")
        ("http2-max-streams-per-connection",
         po::value<int>(&http2_max_streams_per_connection)->default_value(http2_max_streams_per_connection),
         "The limit that the server gives to clients for the maximum number of streams in an HTTP/2 connection.")
        ("permit-port-sharing", switch_value(permit_port_sharing),
         "If true, SO_REUSEPORT will be used when binding the port.");
}

void SecureServingOptions::maybe_default_with_self_signed_certs(const std::string& public_address,
                                                                const std::vector<std::string>& alternate_dns,
                                                                const std::vector<std::string>& alternate_ips) {
    if (!tls_cert_file.empty() || !tls_private_key_file.empty()) {
        return;
    }

    auto logger = get_logger();
    std::filesystem::path cert_file;
    std::filesystem::path key_file;
    if (!cert_directory.empty()) {
        if (pair_name.empty()) {
            throw std::invalid_argument("a certificate pair name is required if the certificate directory is set");
        }
        cert_file = std::filesystem::path{cert_directory} / (pair_name + ".crt");
        key_file = std::filesystem::path{cert_directory} / (pair_name + ".key");
        tls_cert_file = cert_file.string();
        tls_private_key_file = key_file.string();

        if (can_read_cert_and_key(cert_file, key_file)) {
            logger->info("Reusing self-signed cert ({}, {})", tls_cert_file, tls_private_key_file);
            return;
        }
    }

    std::vector<std::string> dns_names = alternate_dns;
    std::vector<std::string> ip_addresses = alternate_ips;
    const std::optional<IpAddress> address = parse_ip(bind_address);
    if (!address.has_value() || address->unspecified) {
        dns_names.emplace_back("localhost");
    } else {
        ip_addresses.push_back(address->text);
    }

    CertKeyPair generated = generate_self_signed_cert_key(public_address, ip_addresses, dns_names);
    if (!cert_file.empty()) {
        write_cert_key_pair(generated, cert_file, key_file);
        logger->info("Generated self-signed cert ({}, {})", tls_cert_file, tls_private_key_file);
        return;
    }
    optional_generated_cert_ = std::move(generated);
    logger->info("Generated self-signed cert in-memory");
}

void SecureServingOptions::apply_to(std::optional<SecureServingInfo>& serving, RestConfig& loopback_client_config) const {
    auto logger = get_logger();
    if (bind_port <= 0) {
        logger->info("Secure serving is disabled (--secure-port={})", bind_port);
        return;
    }

    SecureServingInfo info{};
    info.bind_address = bind_address;
    info.port = bind_port;
    info.http2_max_streams_per_connection = http2_max_streams_per_connection;
    info.permit_port_sharing = permit_port_sharing;

    if (!tls_cert_file.empty() && !tls_private_key_file.empty()) {
        info.serving_cert = load_cert_key_pair(tls_cert_file, tls_private_key_file);
        info.serving_cert_origin = tls_cert_file;
    } else if (optional_generated_cert_.has_value()) {
        info.serving_cert = *optional_generated_cert_;
        info.serving_cert_origin = "generated";
    } else {
        throw std::runtime_error("no serving certificate available: set --tls-cert-file and --tls-private-key-file");
    }

    for (const std::string& suite : cipher_suites) {
        info.cipher_suites.push_back(openssl_cipher_name(suite));
    }
    if (!min_tls_version.empty()) {
        info.min_tls_version = openssl_tls_version(min_tls_version);
    }

    if (loopback) {
        CertKeyPair loopback_cert = generate_self_signed_cert_key(k_loopback_server_name, {}, {});

        RestConfig loopback_config{};
        loopback_config.host = "https://" + loopback_host_port(bind_address, bind_port);
        loopback_config.bearer_token = random_token(k_loopback_token_bytes);
        loopback_config.tls.server_name = k_loopback_server_name;
        loopback_config.tls.ca_data = loopback_cert.cert_pem;
        loopback_config.qps = k_loopback_qps;
        loopback_config.burst = k_loopback_burst;

        info.sni_certs.push_back(NamedCertKey{{k_loopback_server_name}, std::move(loopback_cert)});
        loopback_client_config = std::move(loopback_config);
    }

    logger->info("Serving securely on {} with certificate from {}", info.listen_address(), info.serving_cert_origin);
    serving = std::move(info);
}

const std::optional<CertKeyPair>& SecureServingOptions::generated_cert() const noexcept {
    return optional_generated_cert_;
}

}  // namespace metrics_adapter
