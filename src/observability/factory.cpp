#include "hostgate/observability/factory.hpp"

#include "hostgate/common/fs.hpp"
#include "hostgate/config/config.hpp"
#include "hostgate/observability/audit_observer.hpp"
#include "hostgate/observability/composite.hpp"
#include "hostgate/observability/log_observer.hpp"

#include <sstream>

namespace hostgate::observability {

namespace {

std::filesystem::path audit_path(const config::Config &config) {
  if (!config.observability.audit_file.empty()) {
    return config.observability.audit_file;
  }
  if (auto dir = config::config_dir(); dir.ok()) {
    return dir.value() / "audit.log";
  }
  return "hostgate-audit.log";
}

std::unique_ptr<IObserver> create_single(const std::string &backend, const config::Config &config,
                                         const LogLevel level) {
  if (backend == "noop" || backend == "none") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "audit") {
    auto audit = AuditObserver::open(audit_path(config));
    if (audit.ok()) {
      return std::move(audit.value());
    }
    auto fallback = std::make_unique<LogObserver>(level);
    fallback->record_event(WarningEvent{.component = "observability", .message = audit.error()});
    return fallback;
  }
  return std::make_unique<LogObserver>(level);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const LogLevel level = parse_log_level(config.observability.log_level);
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (!p.empty()) {
        multi->add(create_single(p, config, level));
      }
    }
    return multi;
  }

  return create_single(backend, config, level);
}

} // namespace hostgate::observability
