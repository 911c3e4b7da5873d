// === Audit Backend ===========================================================
//
// Sinks for audit events. The log backend renders events as JSON lines or as
// legacy single-line text and writes them through a dedicated spdlog logger,
// so rotation and asynchronous batching come from spdlog's sinks.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/logger.h>

#include "metrics_adapter/audit_policy.hpp"
#include "metrics_adapter/types.hpp"

namespace metrics_adapter {

enum class AuditLogFormat {
    Json,  /**< One JSON object per line. */
    Legacy /**< One key="value" text line. */
};

/** @brief Parse "json" or "legacy"; throws std::invalid_argument otherwise. */
AuditLogFormat parse_audit_log_format(const std::string& name);

/** @brief Single audit record for one stage of one request. */
struct AuditEvent final {
    std::string audit_id{};
    AuditLevel level{AuditLevel::Metadata};
    AuditStage stage{AuditStage::ResponseComplete};
    std::string verb{};
    std::string request_uri{};
    std::string user{};
    std::vector<std::string> groups{};
    std::vector<std::string> source_ips{};
    int response_code{};
    SystemTimePoint request_received{};
    SystemTimePoint stage_timestamp{};
};

/** @brief Render @p event in the chosen format, without a trailing newline. */
std::string format_audit_event(const AuditEvent& event, AuditLogFormat format);

/** @brief Destination for audit events. */
class AuditBackend {
  public:
    virtual ~AuditBackend() = default;

    virtual void process_events(const std::vector<AuditEvent>& events) = 0;
    virtual void flush() = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

using AuditBackendPtr = std::shared_ptr<AuditBackend>;

/** @brief Audit backend writing formatted events through an spdlog logger. */
class LogAuditBackend final : public AuditBackend {
  public:
    /**
     * @param writer Logger whose sinks receive one line per event.
     * @param format Line format.
     * @param flush_each_event Flush after every batch (blocking-strict mode).
     * @param thread_pool Pool backing @p writer when it is asynchronous.
     */
    LogAuditBackend(std::shared_ptr<spdlog::logger> writer,
                    AuditLogFormat format,
                    bool flush_each_event,
                    std::shared_ptr<spdlog::details::thread_pool> thread_pool = nullptr);
    ~LogAuditBackend() override;

    void process_events(const std::vector<AuditEvent>& events) override;
    void flush() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] AuditLogFormat format() const noexcept;

  private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::logger> writer_;
    AuditLogFormat format_;
    bool flag_flush_each_event_;
};

}  // namespace metrics_adapter
