#include "metrics_adapter/server_config.hpp"

#include <fmt/format.h>

namespace metrics_adapter {

std::string SecureServingInfo::listen_address() const {
    if (bind_address.find(':') != std::string::npos) {
        return fmt::format("[{}]:{}", bind_address, port);
    }
    return fmt::format("{}:{}", bind_address, port);
}

void SecureServingInfo::add_client_ca(const CertificateBundle& bundle) {
    for (const CertificateBundle& existing : client_ca) {
        if (existing.pem == bundle.pem) {
            return;
        }
    }
    client_ca.push_back(bundle);
}

AuthorizationResult AuthorizationInfo::authorize(const RequestAttributes& attributes) const {
    if (local_authorizer) {
        AuthorizationResult result = local_authorizer->authorize(attributes);
        if (result.decision != Decision::NoOpinion) {
            return result;
        }
    }
    if (subject_access_review.has_value()) {
        return AuthorizationResult{Decision::NoOpinion, "deferred to SubjectAccessReview at " + subject_access_review->source.location};
    }
    return AuthorizationResult{Decision::NoOpinion, "no remote authorizer configured"};
}

}  // namespace metrics_adapter
