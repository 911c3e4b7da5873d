#include "metrics_adapter/apply_error.hpp"

namespace metrics_adapter {

std::string_view to_string(ApplyStage stage) noexcept {
    switch (stage) {
        case ApplyStage::CertificateGeneration:
            return "certificate-generation";
        case ApplyStage::SecureServing:
            return "secure-serving";
        case ApplyStage::Authentication:
            return "authentication";
        case ApplyStage::Authorization:
            return "authorization";
        case ApplyStage::Audit:
            return "audit";
        case ApplyStage::ClientConstruction:
            return "client-construction";
        case ApplyStage::Features:
            return "features";
    }
    return "unknown";
}

ApplyError::ApplyError(ApplyStage stage, const std::string& message)
    : std::runtime_error(message),
      stage_(stage) {}

ApplyStage ApplyError::stage() const noexcept {
    return stage_;
}

}  // namespace metrics_adapter
