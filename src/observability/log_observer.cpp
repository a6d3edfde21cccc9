#include "hostgate/observability/log_observer.hpp"

#include "hostgate/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace hostgate::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogLevel parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug" || normalized == "trace") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AccessDeniedEvent>) {
          log_line(LogLevel::Warn, "access.denied component=" + evt.component +
                                       " target=" + evt.target + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, OperationEvent>) {
          log_line(LogLevel::Info, "operation component=" + evt.component +
                                       " op=" + evt.operation + " target=" + evt.target +
                                       " duration_ms=" + std::to_string(evt.duration.count()) +
                                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, BlockedPathsImportedEvent>) {
          log_line(LogLevel::Info, "blocked_paths.import source=" + evt.source +
                                       " count=" + std::to_string(evt.count));
        } else if constexpr (std::is_same_v<T, ToolSyncEvent>) {
          log_line(LogLevel::Info, "tools.sync tool=" + evt.tool + " action=" + evt.action);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, OutputBytesMetric>) {
          log_line(LogLevel::Debug, "metric.output_bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace hostgate::observability
