#include "metrics_adapter/audit_backend.hpp"

#include <chrono>
#include <ctime>
#include <stdexcept>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace metrics_adapter {

namespace {

std::string json_string_list(const std::vector<std::string>& values) {
    std::string rendered{"["};
    for (std::size_t index = 0; index < values.size(); ++index) {
        if (index > 0) {
            rendered.push_back(',');
        }
        rendered += "\"" + escape_json(values[index]) + "\"";
    }
    rendered.push_back(']');
    return rendered;
}

/**
 * @brief RFC 3339 UTC timestamp with microsecond precision.
 */
std::string format_timestamp(SystemTimePoint time_point) {
    const auto since_epoch = time_point.time_since_epoch();
    const auto whole_seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - whole_seconds).count();
    const std::time_t seconds = static_cast<std::time_t>(whole_seconds.count());
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}Z", fmt::gmtime(seconds), micros);
}

std::string format_json(const AuditEvent& event) {
    return fmt::format(
        R"({{"kind":"Event","apiVersion":"audit.k8s.io/v1","level":"{}","auditID":"{}","stage":"{}",)"
        R"("requestURI":"{}","verb":"{}","user":{{"username":"{}","groups":{}}},"sourceIPs":{},)"
        R"("responseStatus":{{"code":{}}},"requestReceivedTimestamp":"{}","stageTimestamp":"{}"}})",
        to_string(event.level),
        escape_json(event.audit_id),
        to_string(event.stage),
        escape_json(event.request_uri),
        escape_json(event.verb),
        escape_json(event.user),
        json_string_list(event.groups),
        json_string_list(event.source_ips),
        event.response_code,
        format_timestamp(event.request_received),
        format_timestamp(event.stage_timestamp)
    );
}

std::string format_legacy(const AuditEvent& event) {
    std::string groups;
    for (const std::string& group : event.groups) {
        if (!groups.empty()) {
            groups.push_back(',');
        }
        groups += "\\\"" + group + "\\\"";
    }
    const std::string source_ip = event.source_ips.empty() ? std::string{"<unknown>"} : event.source_ips.front();
    return fmt::format(
        R"({} AUDIT: id="{}" stage="{}" ip="{}" method="{}" user="{}" groups="{}" uri="{}" response="{}")",
        format_timestamp(event.stage_timestamp),
        event.audit_id,
        to_string(event.stage),
        source_ip,
        event.verb,
        event.user,
        groups,
        event.request_uri,
        event.response_code == 0 ? std::string{"<deferred>"} : std::to_string(event.response_code)
    );
}

}  // namespace

AuditLogFormat parse_audit_log_format(const std::string& name) {
    if (name == "json") {
        return AuditLogFormat::Json;
    }
    if (name == "legacy") {
        return AuditLogFormat::Legacy;
    }
    throw std::invalid_argument("invalid audit log format " + name + ", allowed formats are \"json,legacy\"");
}

std::string format_audit_event(const AuditEvent& event, AuditLogFormat format) {
    return format == AuditLogFormat::Json ? format_json(event) : format_legacy(event);
}

LogAuditBackend::LogAuditBackend(std::shared_ptr<spdlog::logger> writer,
                                 AuditLogFormat format,
                                 bool flush_each_event,
                                 std::shared_ptr<spdlog::details::thread_pool> thread_pool)
    : thread_pool_(std::move(thread_pool)),
      writer_(std::move(writer)),
      format_(format),
      flag_flush_each_event_(flush_each_event) {
    if (!writer_) {
        throw std::invalid_argument("LogAuditBackend requires a writer");
    }
}

LogAuditBackend::~LogAuditBackend() {
    writer_->flush();
}

void LogAuditBackend::process_events(const std::vector<AuditEvent>& events) {
    for (const AuditEvent& event : events) {
        writer_->info(format_audit_event(event, format_));
    }
    if (flag_flush_each_event_) {
        writer_->flush();
    }
}

void LogAuditBackend::flush() {
    writer_->flush();
}

std::string LogAuditBackend::name() const {
    return "log";
}

AuditLogFormat LogAuditBackend::format() const noexcept {
    return format_;
}

}  // namespace metrics_adapter
