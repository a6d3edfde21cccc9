#pragma once

#include "hostgate/observability/observer.hpp"

#include <memory>

namespace hostgate::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_access_denied(const std::string &component, const std::string &target,
                          const std::string &reason);
void record_operation(const std::string &component, const std::string &operation,
                      const std::string &target, std::chrono::milliseconds duration,
                      bool success);
void record_blocked_paths_imported(const std::string &source, std::size_t count);
void record_tool_sync(const std::string &tool, const std::string &action);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace hostgate::observability
