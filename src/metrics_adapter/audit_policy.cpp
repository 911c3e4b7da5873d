#include "metrics_adapter/audit_policy.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace metrics_adapter {

namespace {

constexpr std::array<std::pair<AuditLevel, std::string_view>, 4> k_level_names{{
    {AuditLevel::None, "None"},
    {AuditLevel::Metadata, "Metadata"},
    {AuditLevel::Request, "Request"},
    {AuditLevel::RequestResponse, "RequestResponse"},
}};

constexpr std::array<std::pair<AuditStage, std::string_view>, 4> k_stage_names{{
    {AuditStage::RequestReceived, "RequestReceived"},
    {AuditStage::ResponseStarted, "ResponseStarted"},
    {AuditStage::ResponseComplete, "ResponseComplete"},
    {AuditStage::Panic, "Panic"},
}};

constexpr char k_policy_api_group[] = "audit.k8s.io/";

constexpr std::array<std::string_view, 8> k_rule_keys{
    "level", "users", "userGroups", "verbs", "resources", "namespaces", "nonResourceURLs", "omitStages",
};

constexpr std::array<std::string_view, 3> k_group_resource_keys{"group", "resources", "resourceNames"};

template <std::size_t N>
void reject_unknown_keys(const YAML::Node& node, const std::array<std::string_view, N>& known, const std::string& context) {
    for (const auto& entry : node) {
        const std::string key = entry.first.as<std::string>();
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            throw std::runtime_error(fmt::format("{}{}: unsupported field", context, key));
        }
    }
}

bool contains(const std::vector<std::string>& values, const std::string& needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

std::vector<std::string> read_string_list(const YAML::Node& node, const char* key, const std::string& context) {
    const YAML::Node list_node = node[key];
    if (!list_node) {
        return {};
    }
    if (!list_node.IsSequence()) {
        throw std::runtime_error(fmt::format("{}{}: expected a list", context, key));
    }
    return list_node.as<std::vector<std::string>>();
}

std::vector<AuditGroupResources> read_group_resources(const YAML::Node& node, const std::string& context) {
    const YAML::Node list_node = node["resources"];
    if (!list_node) {
        return {};
    }
    if (!list_node.IsSequence()) {
        throw std::runtime_error(context + "resources: expected a list");
    }
    std::vector<AuditGroupResources> selected;
    for (std::size_t index = 0; index < list_node.size(); ++index) {
        const YAML::Node entry = list_node[index];
        const std::string entry_context = fmt::format("{}resources[{}].", context, index);
        if (!entry.IsMap()) {
            throw std::runtime_error(fmt::format("{}resources[{}]: expected a mapping", context, index));
        }
        reject_unknown_keys(entry, k_group_resource_keys, entry_context);

        AuditGroupResources group_resources{};
        if (const YAML::Node group = entry["group"]; group && !group.IsNull()) {
            group_resources.group = group.as<std::string>();
        }
        group_resources.resources = read_string_list(entry, "resources", entry_context);
        group_resources.resource_names = read_string_list(entry, "resourceNames", entry_context);
        for (const std::string& resource : group_resources.resources) {
            if (resource.empty()) {
                throw std::runtime_error(entry_context + "resources: empty resource name");
            }
            if (resource == "*" || resource.find('/') != std::string::npos) {
                if (!group_resources.resource_names.empty()) {
                    throw std::runtime_error(
                        fmt::format("{}resourceNames: not allowed with wildcard or subresource \"{}\"", entry_context, resource));
                }
            }
        }
        selected.push_back(std::move(group_resources));
    }
    return selected;
}

bool matches_resource_pattern(const std::string& pattern, const RequestAttributes& attributes) {
    if (pattern == "*") {
        return true;
    }
    const std::string combined =
        attributes.subresource.empty() ? attributes.resource : attributes.resource + "/" + attributes.subresource;
    if (pattern == combined) {
        return true;
    }
    if (!attributes.subresource.empty() && pattern.rfind("*/", 0) == 0 && pattern.substr(2) == attributes.subresource) {
        return true;
    }
    return pattern.size() > 2 && pattern.compare(pattern.size() - 2, 2, "/*") == 0
        && pattern.compare(0, pattern.size() - 2, attributes.resource) == 0;
}

std::vector<AuditStage> read_stages(const YAML::Node& node, const std::string& context) {
    const YAML::Node stages_node = node["omitStages"];
    if (!stages_node) {
        return {};
    }
    if (!stages_node.IsSequence()) {
        throw std::runtime_error(context + "omitStages: expected a list");
    }
    std::vector<AuditStage> stages;
    for (const YAML::Node& stage_node : stages_node) {
        try {
            stages.push_back(parse_audit_stage(stage_node.as<std::string>()));
        } catch (const std::invalid_argument& exc) {
            throw std::runtime_error(context + "omitStages: " + exc.what());
        }
    }
    return stages;
}

}  // namespace

std::string_view to_string(AuditLevel level) noexcept {
    for (const auto& [candidate, name] : k_level_names) {
        if (candidate == level) {
            return name;
        }
    }
    return "Unknown";
}

std::string_view to_string(AuditStage stage) noexcept {
    for (const auto& [candidate, name] : k_stage_names) {
        if (candidate == stage) {
            return name;
        }
    }
    return "Unknown";
}

AuditLevel parse_audit_level(std::string_view name) {
    for (const auto& [level, candidate] : k_level_names) {
        if (candidate == name) {
            return level;
        }
    }
    throw std::invalid_argument(fmt::format("unknown audit level \"{}\"", name));
}

AuditStage parse_audit_stage(std::string_view name) {
    for (const auto& [stage, candidate] : k_stage_names) {
        if (candidate == name) {
            return stage;
        }
    }
    throw std::invalid_argument(fmt::format("unknown audit stage \"{}\"", name));
}

bool AuditPolicyRule::matches(const RequestAttributes& attributes) const {
    if (!users.empty() && !contains(users, attributes.user)) {
        return false;
    }
    if (!user_groups.empty()) {
        const bool group_matched = std::any_of(attributes.groups.begin(), attributes.groups.end(),
                                               [this](const std::string& group) { return contains(user_groups, group); });
        if (!group_matched) {
            return false;
        }
    }
    if (!verbs.empty() && !contains(verbs, attributes.verb)) {
        return false;
    }
    if (!namespaces.empty() || !resources.empty()) {
        if (!attributes.resource_request) {
            return false;
        }
        if (!namespaces.empty() && !contains(namespaces, attributes.namespace_name)) {
            return false;
        }
        if (resources.empty()) {
            return true;
        }
        return std::any_of(resources.begin(), resources.end(), [&attributes](const AuditGroupResources& selected) {
            if (selected.group != attributes.api_group) {
                return false;
            }
            if (selected.resources.empty()) {
                return true;
            }
            if (!selected.resource_names.empty() && !contains(selected.resource_names, attributes.name)) {
                return false;
            }
            return std::any_of(selected.resources.begin(), selected.resources.end(), [&attributes](const std::string& pattern) {
                return matches_resource_pattern(pattern, attributes);
            });
        });
    }
    if (non_resource_urls.empty()) {
        return true;
    }
    if (attributes.resource_request) {
        return false;
    }
    return std::any_of(non_resource_urls.begin(), non_resource_urls.end(), [&attributes](const std::string& pattern) {
        if (!pattern.empty() && pattern.back() == '*') {
            return attributes.path.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0;
        }
        return attributes.path == pattern;
    });
}

bool AuditRuleEvaluation::omits(AuditStage stage) const {
    return std::find(omit_stages.begin(), omit_stages.end(), stage) != omit_stages.end();
}

AuditPolicy::AuditPolicy(std::vector<AuditPolicyRule> rules, std::vector<AuditStage> omit_stages)
    : list_rules_(std::move(rules)),
      list_omit_stages_(std::move(omit_stages)) {}

AuditPolicy AuditPolicy::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& exc) {
        throw std::runtime_error(std::string{"invalid audit policy YAML: "} + exc.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("audit policy must be a YAML mapping");
    }

    if (const YAML::Node kind = root["kind"]; kind && kind.as<std::string>() != "Policy") {
        throw std::runtime_error("audit policy kind must be Policy, got " + kind.as<std::string>());
    }
    if (const YAML::Node api_version = root["apiVersion"];
        api_version && api_version.as<std::string>().rfind(k_policy_api_group, 0) != 0) {
        throw std::runtime_error("unsupported audit policy apiVersion " + api_version.as<std::string>());
    }

    std::vector<AuditStage> policy_omit_stages = read_stages(root, "");

    const YAML::Node rules_node = root["rules"];
    if (!rules_node || !rules_node.IsSequence() || rules_node.size() == 0) {
        throw std::runtime_error("audit policy must contain at least one rule");
    }

    std::vector<AuditPolicyRule> rules;
    rules.reserve(rules_node.size());
    for (std::size_t index = 0; index < rules_node.size(); ++index) {
        const YAML::Node rule_node = rules_node[index];
        if (!rule_node.IsMap()) {
            throw std::runtime_error(fmt::format("rules[{}]: expected a mapping", index));
        }
        const std::string context = fmt::format("rules[{}].", index);
        reject_unknown_keys(rule_node, k_rule_keys, context);
        const YAML::Node level_node = rule_node["level"];
        if (!level_node) {
            throw std::runtime_error(context + "level: required");
        }

        AuditPolicyRule rule{};
        try {
            rule.level = parse_audit_level(level_node.as<std::string>());
        } catch (const std::invalid_argument& exc) {
            throw std::runtime_error(fmt::format("rules[{}].level: {}", index, exc.what()));
        }
        rule.users = read_string_list(rule_node, "users", context);
        rule.user_groups = read_string_list(rule_node, "userGroups", context);
        rule.verbs = read_string_list(rule_node, "verbs", context);
        rule.resources = read_group_resources(rule_node, context);
        rule.namespaces = read_string_list(rule_node, "namespaces", context);
        rule.non_resource_urls = read_string_list(rule_node, "nonResourceURLs", context);
        if (!rule.non_resource_urls.empty() && (!rule.resources.empty() || !rule.namespaces.empty())) {
            throw std::runtime_error(context + "nonResourceURLs: rules cannot apply to both regular resources and non-resource URLs");
        }
        for (const std::string& url : rule.non_resource_urls) {
            const std::size_t star = url.find('*');
            if (star != std::string::npos && star != url.size() - 1) {
                throw std::runtime_error(fmt::format("rules[{}].nonResourceURLs: only trailing * allowed in \"{}\"", index, url));
            }
        }
        rule.omit_stages = read_stages(rule_node, context);
        rules.push_back(std::move(rule));
    }

    return AuditPolicy{std::move(rules), std::move(policy_omit_stages)};
}

AuditPolicy AuditPolicy::load_file(const std::filesystem::path& policy_file) {
    std::ifstream stream{policy_file};
    if (!stream) {
        throw std::runtime_error("failed to read audit policy file " + policy_file.string());
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    try {
        return parse(contents.str());
    } catch (const std::runtime_error& exc) {
        throw std::runtime_error("loading audit policy file " + policy_file.string() + ": " + exc.what());
    }
}

const std::vector<AuditPolicyRule>& AuditPolicy::rules() const noexcept {
    return list_rules_;
}

AuditRuleEvaluation AuditPolicy::evaluate(const RequestAttributes& attributes) const {
    for (const AuditPolicyRule& rule : list_rules_) {
        if (!rule.matches(attributes)) {
            continue;
        }
        AuditRuleEvaluation evaluation{rule.level, list_omit_stages_};
        for (const AuditStage stage : rule.omit_stages) {
            if (!evaluation.omits(stage)) {
                evaluation.omit_stages.push_back(stage);
            }
        }
        return evaluation;
    }
    return AuditRuleEvaluation{AuditLevel::None, list_omit_stages_};
}

}  // namespace metrics_adapter
