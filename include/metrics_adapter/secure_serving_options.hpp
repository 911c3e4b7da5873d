// === Secure Serving Options ==================================================
//
// Listener and TLS settings of the HTTPS front-end, plus the loopback client
// configuration the server uses to call itself. Also owns self-signed
// certificate defaulting so the server always has a serving identity.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "metrics_adapter/certificate.hpp"
#include "metrics_adapter/component_options.hpp"
#include "metrics_adapter/rest_config.hpp"
#include "metrics_adapter/server_config.hpp"

namespace metrics_adapter {

/** @brief SNI name of the loopback certificate and of the loopback client. */
inline constexpr char k_loopback_server_name[] = "apiserver-loopback-client";

class SecureServingOptions final : public ComponentOptions {
  public:
    SecureServingOptions() = default;

    [[nodiscard]] ValidationErrorList validate() const override;
    void add_flags(boost::program_options::options_description& flag_set) override;

    /**
     * @brief Ensure a serving certificate exists, generating a self-signed one
     *        for @p public_address when none is configured.
     *
     * Throws on generation or persistence failure.
     */
    void maybe_default_with_self_signed_certs(const std::string& public_address,
                                              const std::vector<std::string>& alternate_dns,
                                              const std::vector<std::string>& alternate_ips);

    /**
     * @brief Fill @p serving and, with loopback enabled, @p loopback_client_config.
     *
     * A disabled secure port (0) leaves both untouched.
     */
    void apply_to(std::optional<SecureServingInfo>& serving, RestConfig& loopback_client_config) const;

    /** @brief In-memory certificate produced by defaulting, if any. */
    [[nodiscard]] const std::optional<CertKeyPair>& generated_cert() const noexcept;

    std::string bind_address{"0.0.0.0"};
    int bind_port{443};
    bool required{true};                    /**< Reject turning the port off with 0. */
    std::string cert_directory{"apiserver.local.config/certificates"};
    std::string pair_name{"apiserver"};
    std::string tls_cert_file{};
    std::string tls_private_key_file{};
    std::vector<std::string> cipher_suites{}; /**< IANA suite names. */
    std::string min_tls_version{};            /**< VersionTLS10 .. VersionTLS13. */
    int http2_max_streams_per_connection{1000};
    bool permit_port_sharing{};
    bool loopback{true};

  private:
    std::optional<CertKeyPair> optional_generated_cert_;
};

/** @brief OpenSSL name of an IANA cipher suite name; throws std::invalid_argument when unknown. */
std::string openssl_cipher_name(const std::string& iana_name);

/** @brief OpenSSL protocol name ("TLSv1.2") of a VersionTLSxx flag value; throws when unknown. */
std::string openssl_tls_version(const std::string& flag_value);

}  // namespace metrics_adapter
