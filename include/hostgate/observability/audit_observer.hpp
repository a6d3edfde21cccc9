#pragma once

#include "hostgate/common/result.hpp"
#include "hostgate/observability/observer.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

namespace hostgate::observability {

/// Appends one JSON object per event to an audit trail: denials, operations,
/// imports and tool approvals. Metrics are not audited.
class AuditObserver final : public IObserver {
public:
  explicit AuditObserver(std::ostream &out);

  [[nodiscard]] static common::Result<std::unique_ptr<AuditObserver>>
  open(const std::filesystem::path &path);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "audit"; }

private:
  explicit AuditObserver(std::unique_ptr<std::ofstream> file);

  std::unique_ptr<std::ofstream> file_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace hostgate::observability
