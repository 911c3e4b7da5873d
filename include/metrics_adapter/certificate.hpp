// === Certificates ============================================================
//
// OpenSSL-backed helpers for the serving identity: generating self-signed
// certificate/key pairs, loading PEM files, checking that a key belongs to a
// certificate, and producing random bearer tokens.

#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace metrics_adapter {

/**
 * @brief Raised when OpenSSL rejects an operation; the message carries the
 *        OpenSSL error queue.
 */
class CertificateError final : public std::runtime_error {
  public:
    explicit CertificateError(const std::string& message);
};

/** @brief PEM-encoded certificate plus its private key. */
struct CertKeyPair final {
    std::string cert_pem{};
    std::string key_pem{};
};

/** @brief Identity facts read back from a PEM certificate. */
struct CertificateSummary final {
    std::string common_name{};
    std::vector<std::string> dns_names{};
    std::vector<std::string> ip_addresses{};
    bool is_ca{};
};

/** @brief One or more PEM certificates trusted as a unit. */
struct CertificateBundle final {
    std::string origin{};              /**< File the bundle was read from. */
    std::string pem{};                 /**< Concatenated PEM blocks. */
    std::vector<std::string> subjects{}; /**< Subject common names, in file order. */
};

/**
 * @brief Generate a self-signed serving certificate valid for @p host plus the
 *        alternate names.
 *
 * @p host is placed in the IP SANs when it is an IP literal and in the DNS SANs
 * otherwise. Throws CertificateError when OpenSSL fails.
 */
CertKeyPair generate_self_signed_cert_key(const std::string& host,
                                          const std::vector<std::string>& alternate_ips,
                                          const std::vector<std::string>& alternate_dns);

/** @brief Parse the subject and SANs of the first certificate in @p cert_pem. */
CertificateSummary describe_certificate(const std::string& cert_pem);

/** @brief Throw CertificateError unless @p pair parses and the key matches the certificate. */
void verify_cert_key_pair(const CertKeyPair& pair);

/** @brief Read a certificate/key pair from disk and verify it. */
CertKeyPair load_cert_key_pair(const std::filesystem::path& cert_file, const std::filesystem::path& key_file);

/** @brief Read every certificate from a CA bundle file; an empty bundle is an error. */
CertificateBundle load_certificate_bundle(const std::filesystem::path& bundle_file);

/** @brief True when both files exist and can be opened for reading. */
bool can_read_cert_and_key(const std::filesystem::path& cert_file, const std::filesystem::path& key_file);

/** @brief Persist a pair, creating parent directories; the key is written with mode 0600. */
void write_cert_key_pair(const CertKeyPair& pair,
                         const std::filesystem::path& cert_file,
                         const std::filesystem::path& key_file);

/** @brief Hex-encoded cryptographically random token of @p byte_count bytes. */
std::string random_token(std::size_t byte_count);

}  // namespace metrics_adapter
