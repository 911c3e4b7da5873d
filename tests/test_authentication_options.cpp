#include <stdexcept>

#include <catch2/catch.hpp>

#include "flag_parsing.hpp"
#include "logging_test_fixture.hpp"
#include "temp_directory.hpp"
#include "metrics_adapter/authentication_options.hpp"
#include "metrics_adapter/certificate.hpp"

using namespace metrics_adapter;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    metrics_adapter::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Default authentication options are valid") {
    const AuthenticationOptions options{};
    REQUIRE(options.validate().empty());
    REQUIRE(options.anonymous);
    REQUIRE(options.cache_ttl == std::chrono::seconds{10});
    REQUIRE(options.request_header.username_headers == std::vector<std::string>{"X-Remote-User"});
}

TEST_CASE("Whitespace-only request header entries are rejected") {
    AuthenticationOptions options{};
    options.request_header.group_headers = {"X-Remote-Group", "  "};
    options.request_header.allowed_names = {"\t"};
    options.webhook_retry_steps = 0;

    const ValidationErrorList errors = options.validate();
    REQUIRE(errors.size() == 3);
    REQUIRE(errors[0].flag == "requestheader-group-headers");
    REQUIRE(errors[1].flag == "requestheader-allowed-names");
}

TEST_CASE("Authentication flags bind to the options") {
    AuthenticationOptions options{};
    boost::program_options::options_description flag_set;
    options.add_flags(flag_set);

    test::parse_flags(flag_set, {"--authentication-token-webhook-cache-ttl=1m30s",
                                 "--anonymous-auth=false",
                                 "--requestheader-username-headers=X-Remote-User,X-Forwarded-User"});

    REQUIRE(options.cache_ttl == std::chrono::seconds{90});
    REQUIRE_FALSE(options.anonymous);
    REQUIRE(options.request_header.username_headers.size() == 2);
}

TEST_CASE("Malformed durations fail flag parsing") {
    AuthenticationOptions options{};
    boost::program_options::options_description flag_set;
    options.add_flags(flag_set);

    REQUIRE_THROWS_AS(test::parse_flags(flag_set, {"--authentication-token-webhook-cache-ttl=ten"}),
                      boost::program_options::error);
}

TEST_CASE("A client CA is attached to the serving configuration") {
    test::TempDirectory directory;
    const CertKeyPair ca = generate_self_signed_cert_key("client-ca", {}, {});
    const auto ca_file = directory.write_file("client-ca.crt", ca.cert_pem);
    const auto kubeconfig = directory.write_file("kubeconfig", "apiVersion: v1\nkind: Config\n");

    AuthenticationOptions options{};
    options.client_ca_file = ca_file.string();
    options.remote_kubeconfig_file = kubeconfig.string();

    SecureServingInfo serving{};
    AuthenticationInfo authentication{};
    options.apply_to(authentication, &serving, nullptr);

    REQUIRE(authentication.configured);
    REQUIRE(authentication.client_ca.has_value());
    REQUIRE(serving.client_ca.size() == 1);
    REQUIRE(serving.client_ca.front().origin == ca_file.string());
    REQUIRE(authentication.api_audiences.empty());
    REQUIRE(authentication.token_review.has_value());
    REQUIRE(authentication.token_review->source.kind == DelegateSourceKind::KubeconfigFile);
    REQUIRE(authentication.request_header.has_value());
    REQUIRE(authentication.request_header->discover_from_cluster);
}

TEST_CASE("Audiences come from the getter") {
    AuthenticationOptions options{};
    options.remote_kubeconfig_file_optional = true;
    options.skip_in_cluster_lookup = true;

    AuthenticationInfo authentication{};
    options.apply_to(authentication, nullptr, []() { return std::vector<std::string>{"metrics-adapter"}; });
    REQUIRE(authentication.api_audiences == std::vector<std::string>{"metrics-adapter"});
    REQUIRE_FALSE(authentication.request_header.has_value());
}

TEST_CASE("A request-header CA produces an explicit front-proxy config") {
    test::TempDirectory directory;
    const CertKeyPair ca = generate_self_signed_cert_key("front-proxy-ca", {}, {});
    const auto ca_file = directory.write_file("front-proxy-ca.crt", ca.cert_pem);

    AuthenticationOptions options{};
    options.remote_kubeconfig_file_optional = true;
    options.request_header.client_ca_file = ca_file.string();
    options.request_header.allowed_names = {"front-proxy-client"};

    SecureServingInfo serving{};
    AuthenticationInfo authentication{};
    options.apply_to(authentication, &serving, nullptr);

    REQUIRE(authentication.request_header.has_value());
    REQUIRE_FALSE(authentication.request_header->discover_from_cluster);
    REQUIRE(authentication.request_header->allowed_names == std::vector<std::string>{"front-proxy-client"});
    REQUIRE(serving.client_ca.size() == 1);
}

TEST_CASE("Missing client CA files fail authentication") {
    AuthenticationOptions options{};
    options.remote_kubeconfig_file_optional = true;
    options.client_ca_file = "/nonexistent/client-ca.crt";

    AuthenticationInfo authentication{};
    REQUIRE_THROWS(options.apply_to(authentication, nullptr, nullptr));
    REQUIRE_FALSE(authentication.configured);
}

TEST_CASE("An unreadable delegated kubeconfig fails authentication") {
    AuthenticationOptions options{};
    options.remote_kubeconfig_file = "/nonexistent/kubeconfig";

    AuthenticationInfo authentication{};
    REQUIRE_THROWS_WITH(options.apply_to(authentication, nullptr, nullptr),
                        Catch::Contains("failed to read delegated authentication kubeconfig"));
}
