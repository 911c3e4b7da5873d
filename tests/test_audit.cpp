#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <catch2/catch.hpp>

#include "metrics_adapter/audit_backend.hpp"

#include "logging_test_fixture.hpp"
#include "temp_directory.hpp"
#include "metrics_adapter/audit_options.hpp"
#include "metrics_adapter/audit_policy.hpp"

using namespace metrics_adapter;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    metrics_adapter::test::ensure_logger_initialized();
    return true;
}();

constexpr char k_policy_yaml[] = R"(apiVersion: audit.k8s.io/v1
kind: Policy
omitStages:
  - RequestReceived
rules:
  - level: None
    nonResourceURLs: ["/healthz*", "/readyz"]
  - level: RequestResponse
    userGroups: ["system:masters"]
    omitStages: ["ResponseStarted"]
  - level: Metadata
)";

constexpr char k_resource_policy_yaml[] = R"(apiVersion: audit.k8s.io/v1
kind: Policy
rules:
  - level: None
    resources:
      - group: ""
        resources: ["secrets", "configmaps"]
  - level: None
    namespaces: ["kube-system"]
    resources:
      - group: ""
        resources: ["pods/log"]
  - level: Request
    resources:
      - group: custom.metrics.k8s.io
  - level: Metadata
)";

RequestAttributes resource_request_for(const std::string& group,
                                       const std::string& resource,
                                       const std::string& namespace_name = "default",
                                       const std::string& subresource = "") {
    RequestAttributes attributes{};
    attributes.user = "alice";
    attributes.verb = "get";
    attributes.resource_request = true;
    attributes.api_group = group;
    attributes.resource = resource;
    attributes.subresource = subresource;
    attributes.namespace_name = namespace_name;
    return attributes;
}

AuditEvent sample_event() {
    AuditEvent event{};
    event.audit_id = "4d2e5c1a";
    event.level = AuditLevel::Metadata;
    event.stage = AuditStage::ResponseComplete;
    event.verb = "get";
    event.request_uri = "/apis/custom.metrics.k8s.io/v1beta2";
    event.user = "system:serviceaccount:monitoring:\"hpa\"";
    event.groups = {"system:serviceaccounts"};
    event.source_ips = {"10.0.0.12"};
    event.response_code = 200;
    event.request_received = SystemTimePoint{std::chrono::seconds{1'700'000'000}};
    event.stage_timestamp = event.request_received + std::chrono::milliseconds{15};
    return event;
}

RequestAttributes request_for(const std::string& path, std::vector<std::string> groups = {}) {
    RequestAttributes attributes{};
    attributes.user = "alice";
    attributes.groups = std::move(groups);
    attributes.verb = "get";
    attributes.path = path;
    return attributes;
}
}  // namespace

TEST_CASE("Audit policies pick the first matching rule") {
    const AuditPolicy policy = AuditPolicy::parse(k_policy_yaml);
    REQUIRE(policy.rules().size() == 3);

    REQUIRE(policy.evaluate(request_for("/healthz/ready")).level == AuditLevel::None);
    REQUIRE(policy.evaluate(request_for("/readyz")).level == AuditLevel::None);

    const AuditRuleEvaluation privileged = policy.evaluate(request_for("/apis", {"system:masters"}));
    REQUIRE(privileged.level == AuditLevel::RequestResponse);
    REQUIRE(privileged.omits(AuditStage::RequestReceived));
    REQUIRE(privileged.omits(AuditStage::ResponseStarted));

    const AuditRuleEvaluation fallback = policy.evaluate(request_for("/apis"));
    REQUIRE(fallback.level == AuditLevel::Metadata);
    REQUIRE_FALSE(fallback.omits(AuditStage::ResponseStarted));
}

TEST_CASE("Audit policies select by group, resource and namespace") {
    const AuditPolicy policy = AuditPolicy::parse(k_resource_policy_yaml);
    REQUIRE(policy.rules().size() == 4);
    REQUIRE(policy.rules()[0].resources.size() == 1);
    REQUIRE(policy.rules()[1].namespaces == std::vector<std::string>{"kube-system"});

    REQUIRE(policy.evaluate(resource_request_for("", "secrets")).level == AuditLevel::None);
    REQUIRE(policy.evaluate(resource_request_for("", "pods")).level == AuditLevel::Metadata);
    REQUIRE(policy.evaluate(resource_request_for("", "pods", "kube-system", "log")).level == AuditLevel::None);
    REQUIRE(policy.evaluate(resource_request_for("", "pods", "default", "log")).level == AuditLevel::Metadata);
    REQUIRE(policy.evaluate(resource_request_for("custom.metrics.k8s.io", "pods")).level == AuditLevel::Request);
    REQUIRE(policy.evaluate(resource_request_for("apps", "secrets")).level == AuditLevel::Metadata);

    // Resource selectors never match non-resource URLs.
    REQUIRE(policy.evaluate(request_for("/secrets")).level == AuditLevel::Metadata);
}

TEST_CASE("Audit resource patterns cover wildcards and subresources") {
    AuditPolicyRule rule{};
    rule.resources = {AuditGroupResources{"", {"deployments/*", "*/scale"}, {}}};

    REQUIRE(rule.matches(resource_request_for("", "deployments", "default", "status")));
    REQUIRE(rule.matches(resource_request_for("", "replicasets", "default", "scale")));
    REQUIRE_FALSE(rule.matches(resource_request_for("", "replicasets")));

    AuditPolicyRule named{};
    named.resources = {AuditGroupResources{"", {"configmaps"}, {"adapter-config"}}};
    RequestAttributes attributes = resource_request_for("", "configmaps");
    attributes.name = "adapter-config";
    REQUIRE(named.matches(attributes));
    attributes.name = "other";
    REQUIRE_FALSE(named.matches(attributes));
}

TEST_CASE("Unsupported audit rule fields are rejected") {
    REQUIRE_THROWS_WITH(AuditPolicy::parse("rules:\n  - level: None\n    resourceSelectors: [pods]\n"),
                        Catch::Contains("rules[0].resourceSelectors: unsupported field"));
    REQUIRE_THROWS_WITH(
        AuditPolicy::parse("rules:\n  - level: None\n    resources:\n      - group: \"\"\n        kinds: [Pod]\n"),
        Catch::Contains("rules[0].resources[0].kinds: unsupported field"));
    REQUIRE_THROWS_WITH(
        AuditPolicy::parse("rules:\n  - level: None\n    namespaces: [default]\n    nonResourceURLs: [/healthz]\n"),
        Catch::Contains("both regular resources and non-resource URLs"));
    REQUIRE_THROWS_WITH(
        AuditPolicy::parse("rules:\n  - level: None\n    resources:\n      - resources: [\"*\"]\n        resourceNames: [a]\n"),
        Catch::Contains("resourceNames"));
}

TEST_CASE("Malformed audit policies are rejected") {
    REQUIRE_THROWS_WITH(AuditPolicy::parse("kind: Policy\nrules: []\n"), Catch::Contains("at least one rule"));
    REQUIRE_THROWS_WITH(AuditPolicy::parse("kind: Pod\nrules:\n  - level: None\n"), Catch::Contains("kind must be Policy"));
    REQUIRE_THROWS_WITH(AuditPolicy::parse("rules:\n  - level: Everything\n"), Catch::Contains("rules[0].level"));
    REQUIRE_THROWS_WITH(AuditPolicy::parse("rules:\n  - level: None\n    omitStages: [Later]\n"),
                        Catch::Contains("omitStages"));
    REQUIRE_THROWS_AS(AuditPolicy::parse("rules: [unterminated"), std::runtime_error);
}

TEST_CASE("Audit validation checks format, mode and limits") {
    AuditOptions options{};
    REQUIRE(options.validate().empty());

    options.log_format = "xml";
    options.log_mode = "eventually";
    options.log_max_size_mb = 0;
    options.log_max_backups = -1;
    REQUIRE(options.validate().size() == 4);

    AuditOptions batch{};
    batch.log_mode = "batch";
    batch.batch_buffer_size = 0;
    REQUIRE(batch.validate().size() == 1);
}

TEST_CASE("Audit without a log path wires no backend") {
    test::TempDirectory directory;
    AuditOptions options{};
    options.policy_file = directory.write_file("policy.yaml", k_policy_yaml).string();

    ServerConfig server_config{};
    options.apply_to(server_config);
    REQUIRE(server_config.audit_policy != nullptr);
    REQUIRE(server_config.audit_backend == nullptr);
}

TEST_CASE("Audit log path without a policy wires no backend") {
    test::TempDirectory directory;
    AuditOptions options{};
    options.log_path = (directory.path() / "audit.log").string();

    ServerConfig server_config{};
    options.apply_to(server_config);
    REQUIRE(server_config.audit_policy == nullptr);
    REQUIRE(server_config.audit_backend == nullptr);
}

TEST_CASE("An unreadable audit policy fails audit application") {
    AuditOptions options{};
    options.policy_file = "/nonexistent/policy.yaml";

    ServerConfig server_config{};
    REQUIRE_THROWS_WITH(options.apply_to(server_config), Catch::Contains("failed to read audit policy file"));
}

TEST_CASE("The log backend writes one JSON line per event") {
    test::TempDirectory directory;
    const auto log_file = directory.path() / "audit" / "audit.log";
    AuditOptions options{};
    options.policy_file = directory.write_file("policy.yaml", k_policy_yaml).string();
    options.log_path = log_file.string();
    options.log_mode = "blocking-strict";

    ServerConfig server_config{};
    options.apply_to(server_config);
    REQUIRE(server_config.audit_backend != nullptr);
    REQUIRE(server_config.audit_backend->name() == "log");

    server_config.audit_backend->process_events({sample_event(), sample_event()});
    const std::string contents = test::read_file(log_file);

    REQUIRE(std::count(contents.begin(), contents.end(), '\n') == 2);
    REQUIRE_THAT(contents, Catch::Contains(R"("auditID":"4d2e5c1a")"));
    REQUIRE_THAT(contents, Catch::Contains(R"("username":"system:serviceaccount:monitoring:\"hpa\"")"));
    REQUIRE_THAT(contents, Catch::Contains(R"("requestReceivedTimestamp":"2023-11-14T22:13:20.000000Z")"));
    REQUIRE_THAT(contents, Catch::Contains(R"("stageTimestamp":"2023-11-14T22:13:20.015000Z")"));
}

TEST_CASE("Batch mode drains buffered events when the backend is released") {
    test::TempDirectory directory;
    const auto log_file = directory.path() / "audit.log";
    AuditOptions options{};
    options.policy_file = directory.write_file("policy.yaml", k_policy_yaml).string();
    options.log_path = log_file.string();
    options.log_mode = "batch";
    options.log_format = "legacy";
    options.batch_buffer_size = 16;

    ServerConfig server_config{};
    options.apply_to(server_config);
    for (int index = 0; index < 5; ++index) {
        server_config.audit_backend->process_events({sample_event()});
    }
    server_config.audit_backend.reset();

    const std::string contents = test::read_file(log_file);
    REQUIRE(std::count(contents.begin(), contents.end(), '\n') == 5);
    REQUIRE_THAT(contents, Catch::Contains(R"(AUDIT: id="4d2e5c1a" stage="ResponseComplete" ip="10.0.0.12" method="get")"));
    REQUIRE_THAT(contents, Catch::Contains(R"(response="200")"));
}

TEST_CASE("Legacy lines mark responses that are not known yet") {
    AuditEvent event = sample_event();
    event.stage = AuditStage::RequestReceived;
    event.response_code = 0;
    event.source_ips.clear();

    const std::string line = format_audit_event(event, AuditLogFormat::Legacy);
    REQUIRE_THAT(line, Catch::Contains(R"(ip="<unknown>")"));
    REQUIRE_THAT(line, Catch::Contains(R"(response="<deferred>")"));
    REQUIRE_THROWS_AS(parse_audit_log_format("yaml"), std::invalid_argument);
}
