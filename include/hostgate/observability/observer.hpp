#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hostgate::observability {

/// A policy predicate refused an operation. `reason` carries the matching rule.
struct AccessDeniedEvent {
  std::string component;
  std::string target;
  std::string reason;
};

/// A gated operation reached its executor (container runtime, host process).
struct OperationEvent {
  std::string component;
  std::string operation;
  std::string target;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct BlockedPathsImportedEvent {
  std::string source;
  std::size_t count = 0;
};

struct ToolSyncEvent {
  std::string tool;
  std::string action;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<AccessDeniedEvent, OperationEvent, BlockedPathsImportedEvent,
                                   ToolSyncEvent, WarningEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct OutputBytesMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, OutputBytesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hostgate::observability
