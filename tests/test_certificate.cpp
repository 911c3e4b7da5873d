#include <algorithm>
#include <filesystem>

#include <catch2/catch.hpp>

#include "metrics_adapter/certificate.hpp"
#include "temp_directory.hpp"

using namespace metrics_adapter;

namespace {
bool contains(const std::vector<std::string>& values, const std::string& needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}
}  // namespace

TEST_CASE("Self-signed certificates carry the requested names") {
    const CertKeyPair pair = generate_self_signed_cert_key("localhost", {"127.0.0.1"}, {"adapter.local"});
    REQUIRE(pair.cert_pem.find("BEGIN CERTIFICATE") != std::string::npos);
    REQUIRE(pair.key_pem.find("PRIVATE KEY") != std::string::npos);

    const CertificateSummary summary = describe_certificate(pair.cert_pem);
    REQUIRE(summary.common_name.rfind("localhost@", 0) == 0);
    REQUIRE(contains(summary.dns_names, "localhost"));
    REQUIRE(contains(summary.dns_names, "adapter.local"));
    REQUIRE(contains(summary.ip_addresses, "127.0.0.1"));
    REQUIRE(summary.is_ca);
    REQUIRE_NOTHROW(verify_cert_key_pair(pair));
}

TEST_CASE("An IP host is placed in the IP SANs") {
    const CertKeyPair pair = generate_self_signed_cert_key("10.0.0.7", {}, {});
    const CertificateSummary summary = describe_certificate(pair.cert_pem);
    REQUIRE(contains(summary.ip_addresses, "10.0.0.7"));
    REQUIRE_FALSE(contains(summary.dns_names, "10.0.0.7"));
}

TEST_CASE("A key from another pair is rejected") {
    const CertKeyPair first = generate_self_signed_cert_key("first", {}, {});
    const CertKeyPair second = generate_self_signed_cert_key("second", {}, {});
    REQUIRE_THROWS_AS(verify_cert_key_pair(CertKeyPair{first.cert_pem, second.key_pem}), CertificateError);
}

TEST_CASE("Written pairs load back and keep the key private") {
    test::TempDirectory directory;
    const auto cert_file = directory.path() / "nested" / "apiserver.crt";
    const auto key_file = directory.path() / "nested" / "apiserver.key";
    const CertKeyPair pair = generate_self_signed_cert_key("localhost", {}, {});

    write_cert_key_pair(pair, cert_file, key_file);
    REQUIRE(can_read_cert_and_key(cert_file, key_file));

    const CertKeyPair loaded = load_cert_key_pair(cert_file, key_file);
    REQUIRE(loaded.cert_pem == pair.cert_pem);

    const auto permissions = std::filesystem::status(key_file).permissions();
    REQUIRE((permissions & std::filesystem::perms::group_read) == std::filesystem::perms::none);
    REQUIRE((permissions & std::filesystem::perms::others_read) == std::filesystem::perms::none);
}

TEST_CASE("Rewriting an existing key file tightens its permissions") {
    test::TempDirectory directory;
    const auto cert_file = directory.path() / "apiserver.crt";
    const auto key_file = directory.write_file("apiserver.key", "stale key\n");
    std::filesystem::permissions(key_file,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write
                                     | std::filesystem::perms::group_read | std::filesystem::perms::others_read,
                                 std::filesystem::perm_options::replace);

    const CertKeyPair pair = generate_self_signed_cert_key("localhost", {}, {});
    write_cert_key_pair(pair, cert_file, key_file);

    REQUIRE(std::filesystem::status(key_file).permissions()
            == (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write));
    REQUIRE(test::read_file(key_file) == pair.key_pem);
}

TEST_CASE("Certificate bundles list every certificate") {
    test::TempDirectory directory;
    const CertKeyPair first = generate_self_signed_cert_key("ca-one", {}, {});
    const CertKeyPair second = generate_self_signed_cert_key("ca-two", {}, {});
    const auto bundle_file = directory.write_file("ca.crt", first.cert_pem + second.cert_pem);

    const CertificateBundle bundle = load_certificate_bundle(bundle_file);
    REQUIRE(bundle.subjects.size() == 2);
    REQUIRE(bundle.subjects[0].rfind("ca-one@", 0) == 0);
    REQUIRE(bundle.origin == bundle_file.string());
}

TEST_CASE("Bundles without certificates are errors") {
    test::TempDirectory directory;
    const auto empty_file = directory.write_file("empty.crt", "not a certificate\n");
    REQUIRE_THROWS_AS(load_certificate_bundle(empty_file), CertificateError);
    REQUIRE_THROWS(load_certificate_bundle(directory.path() / "missing.crt"));
}

TEST_CASE("random_token is hex encoded and unique") {
    const std::string token = random_token(16);
    REQUIRE(token.size() == 32);
    REQUIRE(token.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(token != random_token(16));
}
