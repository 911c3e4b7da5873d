#include "metrics_adapter/authorization_options.hpp"

#include <memory>
#include <optional>

#include "metrics_adapter/authorizer.hpp"
#include "metrics_adapter/delegated_kubeconfig.hpp"
#include "metrics_adapter/logging.hpp"

namespace metrics_adapter {

namespace po = boost::program_options;

ValidationErrorList AuthorizationOptions::validate() const {
    ValidationErrorList errors;
    if (webhook_retry_steps <= 0) {
        errors.push_back({"", "number of webhook retry attempts must be greater than 0"});
    }
    if (allow_cache_ttl.count() < 0) {
        errors.push_back({"authorization-webhook-cache-authorized-ttl", "must not be negative"});
    }
    if (deny_cache_ttl.count() < 0) {
        errors.push_back({"authorization-webhook-cache-unauthorized-ttl", "must not be negative"});
    }
    return errors;
}

void AuthorizationOptions::add_flags(po::options_description& flag_set) {
    flag_set.add_options()
        ("authorization-kubeconfig", po::value<std::string>(&remote_kubeconfig_file)->default_value(remote_kubeconfig_file),
         "kubeconfig file pointing at the 'core' kubernetes server with enough rights to create subjectaccessreviews.")
        ("authorization-kubeconfig-optional", switch_value(remote_kubeconfig_file_optional),
         "If true, a missing authorization kubeconfig leaves only the local allow lists in place.")
        ("authorization-webhook-cache-authorized-ttl", duration_value(allow_cache_ttl),
         "The duration to cache 'authorized' responses from the webhook authorizer.")
        ("authorization-webhook-cache-unauthorized-ttl", duration_value(deny_cache_ttl),
         "The duration to cache 'unauthorized' responses from the webhook authorizer.")
        ("authorization-always-allow-paths", list_value(always_allow_paths),
         "A list of HTTP paths to skip during authorization, i.e. these are authorized without contacting the "
         "'core' kubernetes server.")
        ("authorization-always-allow-groups", list_value(always_allow_groups),
         "A list of groups whose members are authorized without contacting the 'core' kubernetes server.");
}

void AuthorizationOptions::apply_to(AuthorizationInfo& authorization) const {
    auto logger = get_logger();

    AuthorizationInfo info{};
    info.local_authorizer = std::make_shared<const LocalAuthorizer>(always_allow_groups, always_allow_paths);

    const std::optional<DelegateSource> delegate_source =
        resolve_delegated_kubeconfig(remote_kubeconfig_file, remote_kubeconfig_file_optional, "authorization");
    if (delegate_source.has_value()) {
        SubjectAccessReviewConfig review{};
        review.source = *delegate_source;
        review.allow_cache_ttl = allow_cache_ttl;
        review.deny_cache_ttl = deny_cache_ttl;
        review.client_timeout = client_timeout;
        review.retry_steps = webhook_retry_steps;
        info.subject_access_review = std::move(review);
    } else {
        logger->warn("No authorization-kubeconfig provided, so SubjectAccessReview of authorization tokens won't work");
    }

    info.configured = true;
    authorization = std::move(info);
}

}  // namespace metrics_adapter
