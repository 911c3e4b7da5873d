// === Audit Policy ============================================================
//
// Rule-based selection of how much of each request is recorded. Policies are
// read from YAML files in the audit.k8s.io Policy format; the first matching
// rule decides the level.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "metrics_adapter/authorizer.hpp"

namespace metrics_adapter {

enum class AuditLevel {
    None,           /**< Do not record the event. */
    Metadata,       /**< Request metadata only. */
    Request,        /**< Metadata plus request body. */
    RequestResponse /**< Metadata plus request and response bodies. */
};

enum class AuditStage {
    RequestReceived,
    ResponseStarted,
    ResponseComplete,
    Panic
};

[[nodiscard]] std::string_view to_string(AuditLevel level) noexcept;
[[nodiscard]] std::string_view to_string(AuditStage stage) noexcept;
/** @brief Parse a level name; throws std::invalid_argument when unknown. */
AuditLevel parse_audit_level(std::string_view name);
/** @brief Parse a stage name; throws std::invalid_argument when unknown. */
AuditStage parse_audit_stage(std::string_view name);

// Resources of one API group selected by a rule. An empty resources list
// selects the whole group. Entries are "*", "pods", "pods/log", "pods/*" or
// "*/log".
struct AuditGroupResources final {
    std::string group{}; /**< "" is the core group. */
    std::vector<std::string> resources{};
    std::vector<std::string> resource_names{}; /**< Empty matches any name. */
};

/**
 * @brief One policy rule; empty selectors match everything.
 *
 * A rule with @c resources or @c namespaces only matches resource requests,
 * and one with @c non_resource_urls only matches non-resource requests. A
 * rule may not set both kinds.
 */
struct AuditPolicyRule final {
    AuditLevel level{AuditLevel::None};
    std::vector<std::string> users{};
    std::vector<std::string> user_groups{};
    std::vector<std::string> verbs{};
    std::vector<AuditGroupResources> resources{};
    std::vector<std::string> namespaces{};        /**< "" selects cluster-scoped resources. */
    std::vector<std::string> non_resource_urls{}; /**< Exact paths or "prefix*". */
    std::vector<AuditStage> omit_stages{};

    [[nodiscard]] bool matches(const RequestAttributes& attributes) const;
};

/** @brief Level and omitted stages chosen for one request. */
struct AuditRuleEvaluation final {
    AuditLevel level{AuditLevel::None};
    std::vector<AuditStage> omit_stages{};

    [[nodiscard]] bool omits(AuditStage stage) const;
};

class AuditPolicy final {
  public:
    AuditPolicy(std::vector<AuditPolicyRule> rules, std::vector<AuditStage> omit_stages);

    /** @brief Parse policy YAML; throws std::runtime_error describing the first problem. */
    static AuditPolicy parse(const std::string& yaml_text);
    /** @brief Read and parse a policy file. */
    static AuditPolicy load_file(const std::filesystem::path& policy_file);

    [[nodiscard]] const std::vector<AuditPolicyRule>& rules() const noexcept;
    /** @brief Evaluate the first matching rule; no match yields level None. */
    [[nodiscard]] AuditRuleEvaluation evaluate(const RequestAttributes& attributes) const;

  private:
    std::vector<AuditPolicyRule> list_rules_;
    std::vector<AuditStage> list_omit_stages_;
};

}  // namespace metrics_adapter
