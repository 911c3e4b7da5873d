// === Apply Errors ============================================================
//
// Failure raised by the options pipeline, tagged with the step that failed so
// callers can tell configuration problems from cluster connectivity problems.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace metrics_adapter {

enum class ApplyStage {
    CertificateGeneration,
    SecureServing,
    Authentication,
    Authorization,
    Audit,
    ClientConstruction,
    Features
};

[[nodiscard]] std::string_view to_string(ApplyStage stage) noexcept;

class ApplyError final : public std::runtime_error {
  public:
    ApplyError(ApplyStage stage, const std::string& message);

    [[nodiscard]] ApplyStage stage() const noexcept;

  private:
    ApplyStage stage_;
};

}  // namespace metrics_adapter
