#include "hostgate/observability/audit_observer.hpp"

#include "hostgate/common/json_util.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace hostgate::observability {

namespace {

std::string utc_timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string field(const char *key, const std::string &value) {
  return std::string(",\"") + key + "\":\"" + common::json_escape(value) + "\"";
}

} // namespace

AuditObserver::AuditObserver(std::ostream &out) : out_(&out) {}

AuditObserver::AuditObserver(std::unique_ptr<std::ofstream> file)
    : file_(std::move(file)), out_(file_.get()) {}

common::Result<std::unique_ptr<AuditObserver>>
AuditObserver::open(const std::filesystem::path &path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  auto file = std::make_unique<std::ofstream>(path, std::ios::app);
  if (!file->is_open()) {
    return common::Result<std::unique_ptr<AuditObserver>>::failure(
        "unable to open audit log: " + path.string());
  }
  return common::Result<std::unique_ptr<AuditObserver>>::success(
      std::unique_ptr<AuditObserver>(new AuditObserver(std::move(file))));
}

void AuditObserver::record_event(const ObserverEvent &event) {
  std::string line = "{\"time\":\"" + utc_timestamp() + "\"";
  std::visit(
      [&line](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, AccessDeniedEvent>) {
          line += field("event_type", "access_denied") + field("component", evt.component) +
                  field("target", evt.target) + field("result", "denied") +
                  field("reason", evt.reason);
        } else if constexpr (std::is_same_v<T, OperationEvent>) {
          line += field("event_type", "operation") + field("component", evt.component) +
                  field("operation", evt.operation) + field("target", evt.target) +
                  field("result", evt.success ? "success" : "error") +
                  ",\"duration_ms\":" + std::to_string(evt.duration.count());
        } else if constexpr (std::is_same_v<T, BlockedPathsImportedEvent>) {
          line += field("event_type", "blocked_paths_imported") + field("source", evt.source) +
                  ",\"count\":" + std::to_string(evt.count);
        } else if constexpr (std::is_same_v<T, ToolSyncEvent>) {
          line += field("event_type", "tool_sync") + field("tool", evt.tool) +
                  field("action", evt.action);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          line += field("event_type", "warning") + field("component", evt.component) +
                  field("message", evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          line += field("event_type", "error") + field("component", evt.component) +
                  field("message", evt.message);
        }
      },
      event);
  line += "}\n";

  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << line;
}

void AuditObserver::record_metric(const ObserverMetric &) {}

void AuditObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace hostgate::observability
