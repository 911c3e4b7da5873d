#include "metrics_adapter/authorizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace metrics_adapter {

LocalAuthorizer::LocalAuthorizer(std::vector<std::string> always_allow_groups, const std::vector<std::string>& always_allow_paths)
    : list_groups_(std::move(always_allow_groups)) {
    for (const std::string& path : always_allow_paths) {
        const std::size_t star = path.find('*');
        if (star == std::string::npos) {
            list_exact_paths_.push_back(path);
            continue;
        }
        if (star != path.size() - 1) {
            throw std::invalid_argument("only trailing * allowed in \"" + path + "\"");
        }
        list_prefix_paths_.push_back(path.substr(0, star));
    }
}

AuthorizationResult LocalAuthorizer::authorize(const RequestAttributes& attributes) const {
    for (const std::string& group : attributes.groups) {
        if (std::find(list_groups_.begin(), list_groups_.end(), group) != list_groups_.end()) {
            return AuthorizationResult{Decision::Allow, "member of privileged group " + group};
        }
    }

    if (attributes.resource_request) {
        return AuthorizationResult{Decision::NoOpinion, ""};
    }
    if (std::find(list_exact_paths_.begin(), list_exact_paths_.end(), attributes.path) != list_exact_paths_.end()) {
        return AuthorizationResult{Decision::Allow, "path " + attributes.path + " is always allowed"};
    }
    for (const std::string& prefix : list_prefix_paths_) {
        if (attributes.path.compare(0, prefix.size(), prefix) == 0) {
            return AuthorizationResult{Decision::Allow, "path " + attributes.path + " matches " + prefix + "*"};
        }
    }
    return AuthorizationResult{Decision::NoOpinion, ""};
}

const std::vector<std::string>& LocalAuthorizer::always_allow_groups() const noexcept {
    return list_groups_;
}

const std::vector<std::string>& LocalAuthorizer::exact_paths() const noexcept {
    return list_exact_paths_;
}

const std::vector<std::string>& LocalAuthorizer::prefix_paths() const noexcept {
    return list_prefix_paths_;
}

}  // namespace metrics_adapter
