// === Audit Options ===========================================================
//
// Audit policy and log backend settings. The policy decides what is recorded;
// the backend decides where it goes.

#pragma once

#include <string>

#include "metrics_adapter/audit_backend.hpp"
#include "metrics_adapter/component_options.hpp"
#include "metrics_adapter/server_config.hpp"

namespace metrics_adapter {

/** @brief "-" selects standard output as the audit log destination. */
inline constexpr char k_audit_log_stdout[] = "-";

class AuditOptions final : public ComponentOptions {
  public:
    AuditOptions() = default;

    [[nodiscard]] ValidationErrorList validate() const override;
    void add_flags(boost::program_options::options_description& flag_set) override;

    /**
     * @brief Load the policy and wire the log backend into @p server_config.
     *
     * Throws when the policy file cannot be read or parsed, or when the log
     * sink cannot be opened.
     */
    void apply_to(ServerConfig& server_config) const;

    std::string policy_file{};
    std::string log_path{};
    std::string log_format{"json"};
    std::string log_mode{"blocking"}; /**< batch, blocking or blocking-strict. */
    int log_max_size_mb{100};
    int log_max_backups{};
    int batch_buffer_size{10000};

  private:
    [[nodiscard]] AuditBackendPtr make_log_backend() const;
};

}  // namespace metrics_adapter
