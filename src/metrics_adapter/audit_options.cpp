#include "metrics_adapter/audit_options.hpp"

#include <array>
#include <memory>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "metrics_adapter/audit_policy.hpp"
#include "metrics_adapter/logging.hpp"

namespace metrics_adapter {

namespace po = boost::program_options;

namespace {

constexpr std::string_view k_mode_batch{"batch"};
constexpr std::string_view k_mode_blocking{"blocking"};
constexpr std::string_view k_mode_blocking_strict{"blocking-strict"};
constexpr std::array<std::string_view, 3> k_modes{k_mode_batch, k_mode_blocking, k_mode_blocking_strict};
constexpr std::size_t k_bytes_per_megabyte{1024 * 1024};
constexpr std::size_t k_batch_worker_threads{1};

bool is_known_mode(const std::string& mode) {
    for (const std::string_view candidate : k_modes) {
        if (candidate == mode) {
            return true;
        }
    }
    return false;
}

}  // namespace

ValidationErrorList AuditOptions::validate() const {
    ValidationErrorList errors;

    try {
        static_cast<void>(parse_audit_log_format(log_format));
    } catch (const std::invalid_argument& exc) {
        errors.push_back({"audit-log-format", exc.what()});
    }
    if (!is_known_mode(log_mode)) {
        errors.push_back({"audit-log-mode", fmt::format(
            "invalid audit log mode {}, allowed modes are \"batch,blocking,blocking-strict\"", log_mode)});
    }
    if (log_max_size_mb <= 0) {
        errors.push_back({"audit-log-maxsize", fmt::format("{} must be greater than 0", log_max_size_mb)});
    }
    if (log_max_backups < 0) {
        errors.push_back({"audit-log-maxbackup", fmt::format("{} must not be negative", log_max_backups)});
    }
    if (log_mode == k_mode_batch && batch_buffer_size <= 0) {
        errors.push_back({"audit-log-batch-buffer-size", fmt::format("{} must be greater than 0", batch_buffer_size)});
    }

    return errors;
}

void AuditOptions::add_flags(po::options_description& flag_set) {
    flag_set.add_options()
        ("audit-policy-file", po::value<std::string>(&policy_file)->default_value(policy_file),
         "Path to the file that defines the audit policy configuration.")
        ("audit-log-path", po::value<std::string>(&log_path)->default_value(log_path),
         "If set, all requests coming to the server will be logged to this file. '-' means standard out.")
        ("audit-log-format", po::value<std::string>(&log_format)->default_value(log_format),
         "Format of saved audits. \"legacy\" indicates 1-line text format for each event. "
         "\"json\" indicates structured json format.")
        ("audit-log-mode", po::value<std::string>(&log_mode)->default_value(log_mode),
         "Strategy for sending audit events. Blocking indicates sending events should block server responses. "
         "Batch causes the backend to buffer and write events asynchronously. "
         "Known modes are batch,blocking,blocking-strict.")
        ("audit-log-maxsize", po::value<int>(&log_max_size_mb)->default_value(log_max_size_mb),
         "The maximum size in megabytes of the audit log file before it gets rotated.")
        ("audit-log-maxbackup", po::value<int>(&log_max_backups)->default_value(log_max_backups),
         "The maximum number of old audit log files to retain. With 0 the file is truncated on rotation.")
        ("audit-log-batch-buffer-size", po::value<int>(&batch_buffer_size)->default_value(batch_buffer_size),
         "The size of the buffer to store events before batching and writing. Only used in batch mode.");
}

void AuditOptions::apply_to(ServerConfig& server_config) const {
    auto logger = get_logger();

    if (!policy_file.empty()) {
        server_config.audit_policy = std::make_shared<AuditPolicy>(AuditPolicy::load_file(policy_file));
        logger->info("Loaded audit policy with {} rule(s) from {}", server_config.audit_policy->rules().size(), policy_file);
    }

    if (log_path.empty()) {
        return;
    }
    if (policy_file.empty()) {
        logger->info("No audit policy file provided, no events will be recorded for log backend");
        return;
    }

    server_config.audit_backend = make_log_backend();
    logger->info("Audit log backend writing {} events to {} in {} mode", log_format, log_path, log_mode);
}

AuditBackendPtr AuditOptions::make_log_backend() const {
    spdlog::sink_ptr sink;
    if (log_path == k_audit_log_stdout) {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path,
            static_cast<std::size_t>(log_max_size_mb) * k_bytes_per_megabyte,
            static_cast<std::size_t>(log_max_backups)
        );
    }

    std::shared_ptr<spdlog::details::thread_pool> thread_pool;
    std::shared_ptr<spdlog::logger> writer;
    if (log_mode == k_mode_batch) {
        thread_pool = std::make_shared<spdlog::details::thread_pool>(
            static_cast<std::size_t>(batch_buffer_size), k_batch_worker_threads);
        writer = std::make_shared<spdlog::async_logger>(
            "audit", sink, thread_pool, spdlog::async_overflow_policy::block);
    } else {
        writer = std::make_shared<spdlog::logger>("audit", sink);
    }
    writer->set_pattern("%v");
    writer->set_level(spdlog::level::info);

    return std::make_shared<LogAuditBackend>(
        writer, parse_audit_log_format(log_format), log_mode == k_mode_blocking_strict, thread_pool);
}

}  // namespace metrics_adapter
