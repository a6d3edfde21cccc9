#include "hostgate/observability/global.hpp"

#include <mutex>

namespace hostgate::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_access_denied(const std::string &component, const std::string &target,
                          const std::string &reason) {
  record_event(AccessDeniedEvent{.component = component, .target = target, .reason = reason});
}

void record_operation(const std::string &component, const std::string &operation,
                      const std::string &target, const std::chrono::milliseconds duration,
                      const bool success) {
  record_event(OperationEvent{.component = component,
                              .operation = operation,
                              .target = target,
                              .duration = duration,
                              .success = success});
  record_metric(RequestLatencyMetric{.latency = duration});
}

void record_blocked_paths_imported(const std::string &source, const std::size_t count) {
  record_event(BlockedPathsImportedEvent{.source = source, .count = count});
}

void record_tool_sync(const std::string &tool, const std::string &action) {
  record_event(ToolSyncEvent{.tool = tool, .action = action});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace hostgate::observability
