#include "metrics_adapter/certificate.hpp"

#include <arpa/inet.h>

#include <array>
#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>

#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

namespace {

constexpr long k_backdate_seconds{60 * 60};                /**< Tolerate modest clock skew between peers. */
constexpr long k_validity_seconds{365L * 24 * 60 * 60};    /**< One year, matching the usual serving cert lifetime. */
constexpr int k_serial_bits{128};

template <typename T, void (*fn)(T*)>
struct deleter {
    void operator()(T* ptr) { fn(ptr); }
};

template <typename T, void (*fn)(T*)>
using handle = std::unique_ptr<T, deleter<T, fn>>;

using BIO_ptr = handle<BIO, BIO_free_all>;
using BN_ptr = handle<BIGNUM, BN_free>;
using EVP_PKEY_ptr = handle<EVP_PKEY, EVP_PKEY_free>;
using X509_ptr = handle<X509, X509_free>;
using X509_EXTENSION_ptr = handle<X509_EXTENSION, X509_EXTENSION_free>;
using GENERAL_NAMES_ptr = handle<GENERAL_NAMES, GENERAL_NAMES_free>;

std::string build_ssl_error() {
    std::string text;
    std::array<char, 256> buffer{};
    while (const unsigned long code = ERR_get_error()) {
        ERR_error_string_n(code, buffer.data(), buffer.size());
        if (!text.empty()) {
            text += "; ";
        }
        text += buffer.data();
    }
    return text.empty() ? "unknown OpenSSL error" : text;
}

[[noreturn]] void throw_ssl_error(const std::string& context) {
    throw CertificateError(context + ": " + build_ssl_error());
}

BIO_ptr make_memory_bio(const std::string& contents) {
    BIO_ptr bio{BIO_new_mem_buf(contents.data(), static_cast<int>(contents.size()))};
    if (!bio) {
        throw_ssl_error("allocating memory BIO");
    }
    return bio;
}

std::string drain_bio(BIO* bio) {
    char* data = nullptr;
    const long length = BIO_get_mem_data(bio, &data);
    if (length <= 0 || data == nullptr) {
        return {};
    }
    return std::string{data, static_cast<std::size_t>(length)};
}

X509_ptr parse_certificate(const std::string& cert_pem) {
    BIO_ptr bio = make_memory_bio(cert_pem);
    X509_ptr certificate{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)};
    if (!certificate) {
        throw_ssl_error("parsing PEM certificate");
    }
    return certificate;
}

EVP_PKEY_ptr parse_private_key(const std::string& key_pem) {
    BIO_ptr bio = make_memory_bio(key_pem);
    EVP_PKEY_ptr key{PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)};
    if (!key) {
        throw_ssl_error("parsing PEM private key");
    }
    return key;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        throw CertificateError("unable to read " + path.string());
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    return contents.str();
}

void add_extension(X509* certificate, int nid, const std::string& value) {
    X509V3_CTX context;
    X509V3_set_ctx_nodb(&context);
    X509V3_set_ctx(&context, certificate, certificate, nullptr, nullptr, 0);
    X509_EXTENSION_ptr extension{X509V3_EXT_conf_nid(nullptr, &context, nid, value.c_str())};
    if (!extension) {
        throw_ssl_error(fmt::format("building extension {}", OBJ_nid2sn(nid)));
    }
    if (X509_add_ext(certificate, extension.get(), -1) != 1) {
        throw_ssl_error(fmt::format("adding extension {}", OBJ_nid2sn(nid)));
    }
}

std::string build_subject_alt_names(const std::string& host,
                                    const std::vector<std::string>& alternate_ips,
                                    const std::vector<std::string>& alternate_dns) {
    std::vector<std::string> entries;
    const auto push_unique = [&entries](std::string entry) {
        for (const std::string& existing : entries) {
            if (existing == entry) {
                return;
            }
        }
        entries.push_back(std::move(entry));
    };

    if (parse_ip(host).has_value()) {
        push_unique("IP:" + host);
    } else if (!host.empty()) {
        push_unique("DNS:" + host);
    }
    for (const std::string& address : alternate_ips) {
        if (!parse_ip(address).has_value()) {
            throw CertificateError("invalid alternate IP " + address);
        }
        push_unique("IP:" + address);
    }
    for (const std::string& name : alternate_dns) {
        push_unique("DNS:" + name);
    }
    return join_list(entries);
}

}  // namespace

CertificateError::CertificateError(const std::string& message)
    : std::runtime_error(message) {}

CertKeyPair generate_self_signed_cert_key(const std::string& host,
                                          const std::vector<std::string>& alternate_ips,
                                          const std::vector<std::string>& alternate_dns) {
    EVP_PKEY_ptr key{EVP_EC_gen("P-256")};
    if (!key) {
        throw_ssl_error("generating EC P-256 key");
    }

    X509_ptr certificate{X509_new()};
    if (!certificate) {
        throw_ssl_error("allocating certificate");
    }
    X509_set_version(certificate.get(), 2);

    BN_ptr serial{BN_new()};
    if (!serial || BN_rand(serial.get(), k_serial_bits - 1, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1
        || BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(certificate.get())) == nullptr) {
        throw_ssl_error("assigning certificate serial");
    }

    X509_gmtime_adj(X509_getm_notBefore(certificate.get()), -k_backdate_seconds);
    X509_gmtime_adj(X509_getm_notAfter(certificate.get()), k_validity_seconds);
    if (X509_set_pubkey(certificate.get(), key.get()) != 1) {
        throw_ssl_error("attaching public key");
    }

    const auto now_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string common_name = fmt::format("{}@{}", host, now_seconds);
    X509_NAME* subject = X509_get_subject_name(certificate.get());
    if (X509_NAME_add_entry_by_txt(subject, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0) != 1
        || X509_set_issuer_name(certificate.get(), subject) != 1) {
        throw_ssl_error("setting certificate subject");
    }

    add_extension(certificate.get(), NID_basic_constraints, "critical,CA:TRUE");
    add_extension(certificate.get(), NID_key_usage, "critical,digitalSignature,keyEncipherment,keyCertSign");
    add_extension(certificate.get(), NID_ext_key_usage, "serverAuth");
    add_extension(certificate.get(), NID_subject_key_identifier, "hash");
    const std::string subject_alt_names = build_subject_alt_names(host, alternate_ips, alternate_dns);
    if (!subject_alt_names.empty()) {
        add_extension(certificate.get(), NID_subject_alt_name, subject_alt_names);
    }

    if (X509_sign(certificate.get(), key.get(), EVP_sha256()) == 0) {
        throw_ssl_error("signing certificate");
    }

    BIO_ptr cert_bio{BIO_new(BIO_s_mem())};
    BIO_ptr key_bio{BIO_new(BIO_s_mem())};
    if (!cert_bio || !key_bio) {
        throw_ssl_error("allocating PEM buffers");
    }
    if (PEM_write_bio_X509(cert_bio.get(), certificate.get()) != 1) {
        throw_ssl_error("encoding certificate");
    }
    if (PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw_ssl_error("encoding private key");
    }

    return CertKeyPair{drain_bio(cert_bio.get()), drain_bio(key_bio.get())};
}

CertificateSummary describe_certificate(const std::string& cert_pem) {
    X509_ptr certificate = parse_certificate(cert_pem);
    CertificateSummary summary{};

    std::array<char, 256> common_name{};
    const int length = X509_NAME_get_text_by_NID(
        X509_get_subject_name(certificate.get()), NID_commonName, common_name.data(), static_cast<int>(common_name.size()));
    if (length > 0) {
        summary.common_name.assign(common_name.data(), static_cast<std::size_t>(length));
    }

    summary.is_ca = X509_check_ca(certificate.get()) != 0;

    GENERAL_NAMES_ptr names{static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(certificate.get(), NID_subject_alt_name, nullptr, nullptr))};
    if (!names) {
        return summary;
    }
    for (int index = 0; index < sk_GENERAL_NAME_num(names.get()); ++index) {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names.get(), index);
        if (name->type == GEN_DNS) {
            const auto* data = ASN1_STRING_get0_data(name->d.dNSName);
            summary.dns_names.emplace_back(reinterpret_cast<const char*>(data),
                                           static_cast<std::size_t>(ASN1_STRING_length(name->d.dNSName)));
        } else if (name->type == GEN_IPADD) {
            const int address_length = ASN1_STRING_length(name->d.iPAddress);
            const int family = address_length == 4 ? AF_INET : AF_INET6;
            std::array<char, INET6_ADDRSTRLEN> buffer{};
            if (inet_ntop(family, ASN1_STRING_get0_data(name->d.iPAddress), buffer.data(), buffer.size()) != nullptr) {
                summary.ip_addresses.emplace_back(buffer.data());
            }
        }
    }
    return summary;
}

void verify_cert_key_pair(const CertKeyPair& pair) {
    X509_ptr certificate = parse_certificate(pair.cert_pem);
    EVP_PKEY_ptr key = parse_private_key(pair.key_pem);
    if (X509_check_private_key(certificate.get(), key.get()) != 1) {
        throw_ssl_error("private key does not match certificate");
    }
}

CertKeyPair load_cert_key_pair(const std::filesystem::path& cert_file, const std::filesystem::path& key_file) {
    CertKeyPair pair{read_file(cert_file), read_file(key_file)};
    try {
        verify_cert_key_pair(pair);
    } catch (const CertificateError& exc) {
        throw CertificateError(fmt::format("loading {} and {}: {}", cert_file.string(), key_file.string(), exc.what()));
    }
    return pair;
}

CertificateBundle load_certificate_bundle(const std::filesystem::path& bundle_file) {
    CertificateBundle bundle{};
    bundle.origin = bundle_file.string();
    bundle.pem = read_file(bundle_file);

    BIO_ptr bio = make_memory_bio(bundle.pem);
    while (true) {
        X509_ptr certificate{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)};
        if (!certificate) {
            break;
        }
        std::array<char, 256> common_name{};
        const int length = X509_NAME_get_text_by_NID(
            X509_get_subject_name(certificate.get()), NID_commonName, common_name.data(), static_cast<int>(common_name.size()));
        bundle.subjects.emplace_back(common_name.data(), length > 0 ? static_cast<std::size_t>(length) : 0U);
    }
    // Reading past the last PEM block leaves a "no start line" error behind.
    ERR_clear_error();

    if (bundle.subjects.empty()) {
        throw CertificateError("no certificates found in " + bundle.origin);
    }
    return bundle;
}

bool can_read_cert_and_key(const std::filesystem::path& cert_file, const std::filesystem::path& key_file) {
    const std::ifstream cert_stream{cert_file};
    const std::ifstream key_stream{key_file};
    return cert_stream.good() && key_stream.good();
}

void write_cert_key_pair(const CertKeyPair& pair,
                         const std::filesystem::path& cert_file,
                         const std::filesystem::path& key_file) {
    for (const std::filesystem::path& target : {cert_file, key_file}) {
        if (!target.has_parent_path()) {
            continue;
        }
        std::error_code error_directory;
        std::filesystem::create_directories(target.parent_path(), error_directory);
        if (error_directory) {
            throw CertificateError("unable to create directory " + target.parent_path().string()
                                   + ": " + error_directory.message());
        }
    }

    std::ofstream cert_stream{cert_file, std::ios::binary | std::ios::trunc};
    cert_stream << pair.cert_pem;
    if (!cert_stream) {
        throw CertificateError("unable to write " + cert_file.string());
    }

    // The key is written only after the empty file is restricted to 0600.
    std::ofstream key_placeholder{key_file, std::ios::binary | std::ios::trunc};
    key_placeholder.close();
    if (!key_placeholder) {
        throw CertificateError("unable to create " + key_file.string());
    }
    std::error_code error_permissions;
    std::filesystem::permissions(key_file,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace,
                                 error_permissions);
    if (error_permissions) {
        throw CertificateError("unable to restrict permissions on " + key_file.string());
    }

    std::ofstream key_stream{key_file, std::ios::binary | std::ios::trunc};
    key_stream << pair.key_pem;
    key_stream.close();
    if (!key_stream) {
        throw CertificateError("unable to write " + key_file.string());
    }
}

std::string random_token(std::size_t byte_count) {
    std::vector<unsigned char> bytes(byte_count);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw_ssl_error("generating random token");
    }
    std::string token;
    token.reserve(byte_count * 2);
    for (const unsigned char byte : bytes) {
        token += fmt::format("{:02x}", byte);
    }
    return token;
}

}  // namespace metrics_adapter
