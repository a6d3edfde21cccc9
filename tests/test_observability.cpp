#include "test_framework.hpp"

#include "hostgate/observability/audit_observer.hpp"
#include "hostgate/observability/composite.hpp"
#include "hostgate/observability/factory.hpp"
#include "hostgate/observability/global.hpp"
#include "hostgate/observability/log_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <sstream>

namespace {

class FlushCounter final : public hostgate::observability::IObserver {
public:
  explicit FlushCounter(std::shared_ptr<int> flushes) : flushes_(std::move(flushes)) {}

  void record_event(const hostgate::observability::ObserverEvent &) override {}
  void record_metric(const hostgate::observability::ObserverMetric &) override {}
  void flush() override { ++*flushes_; }
  [[nodiscard]] std::string_view name() const override { return "flush_counter"; }

private:
  std::shared_ptr<int> flushes_;
};

} // namespace

void register_observability_tests(std::vector<hostgate::tests::TestCase> &tests) {
  using hostgate::tests::require;
  namespace obs = hostgate::observability;

  tests.push_back({"log_observer_filters_below_min_level", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(obs::LogLevel::Warn, out);
                     observer.record_event(obs::OperationEvent{.component = "container",
                                                               .operation = "logs",
                                                               .target = "web",
                                                               .success = true});
                     observer.record_event(obs::AccessDeniedEvent{
                         .component = "container", .target = "exec web", .reason = "nope"});
                     const std::string text = out.str();
                     require(text.find("op=logs") == std::string::npos, "info suppressed");
                     require(text.find("[WARN] access.denied") != std::string::npos,
                             "denial logged");
                     require(text.find("reason=nope") != std::string::npos, "reason included");
                   }});

  tests.push_back({"log_level_parsing_accepts_aliases", [] {
                     require(obs::parse_log_level("WARNING") == obs::LogLevel::Warn, "warning");
                     require(obs::parse_log_level("trace") == obs::LogLevel::Debug, "trace");
                     require(obs::parse_log_level("bogus") == obs::LogLevel::Info, "fallback");
                   }});

  tests.push_back({"audit_observer_writes_json_lines", [] {
                     std::ostringstream out;
                     obs::AuditObserver audit(out);
                     audit.record_event(obs::AccessDeniedEvent{
                         .component = "host_command", .target = "rm -rf /", .reason = "deny \"x\""});
                     audit.record_event(obs::ToolSyncEvent{.tool = "foo.sh", .action = "copied"});
                     audit.record_metric(obs::OutputBytesMetric{.bytes = 10});

                     std::istringstream lines(out.str());
                     std::string first;
                     std::string second;
                     std::string third;
                     require(static_cast<bool>(std::getline(lines, first)), "first line");
                     require(static_cast<bool>(std::getline(lines, second)), "second line");
                     require(!std::getline(lines, third), "metrics are not audited");
                     require(first.front() == '{' && first.back() == '}', "json object");
                     require(first.find("\"event_type\":\"access_denied\"") != std::string::npos,
                             "event type");
                     require(first.find("deny \\\"x\\\"") != std::string::npos, "escaped reason");
                     require(second.find("\"tool\":\"foo.sh\"") != std::string::npos, "tool name");
                   }});

  tests.push_back({"audit_observer_opens_file_under_missing_dirs", [] {
                     hostgate::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "logs" / "audit.log";
                     auto audit = obs::AuditObserver::open(path);
                     require(audit.ok(), audit.error());
                     audit.value()->record_event(
                         obs::WarningEvent{.component = "config", .message = "hello"});
                     audit.value()->flush();
                     require(std::filesystem::file_size(path) > 0, "audit file written");
                   }});

  tests.push_back({"observer_factory_builds_requested_backends", [] {
                     auto config = hostgate::testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "noop backend");

                     config.observability.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");

                     hostgate::testing::TempWorkspace workspace;
                     config.observability.audit_file = (workspace.path() / "a.log").string();
                     config.observability.backend = "log, audit";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list builds multi");
                     require(static_cast<obs::MultiObserver *>(multi.get())->size() == 2,
                             "both sinks added");
                   }});

  tests.push_back({"multi_observer_flushes_sinks_after_denial", [] {
                     auto flushes = std::make_shared<int>(0);
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<FlushCounter>(flushes));
                     multi.add(std::make_unique<FlushCounter>(flushes));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null sink ignored");

                     multi.record_event(obs::WarningEvent{.component = "c", .message = "m"});
                     require(*flushes == 0, "ordinary events are buffered");
                     multi.record_event(
                         obs::AccessDeniedEvent{.component = "c", .target = "t", .reason = "r"});
                     require(*flushes == 2, "every sink flushed on denial");
                   }});

  tests.push_back({"global_helpers_route_to_installed_observer", [] {
                     hostgate::testing::ObserverCapture capture;
                     obs::record_access_denied("container", "logs db", "container not allowed");
                     obs::record_blocked_paths_imported("compose.yml", 3);
                     obs::record_operation("host_command", "exec", "git",
                                           std::chrono::milliseconds(4), true);

                     const auto denied = capture.events_of<obs::AccessDeniedEvent>();
                     require(denied.size() == 1 && denied.front().target == "logs db",
                             "access denied captured");
                     const auto imported = capture.events_of<obs::BlockedPathsImportedEvent>();
                     require(imported.size() == 1 && imported.front().count == 3,
                             "import captured");
                     require(capture.events_of<obs::OperationEvent>().size() == 1,
                             "operation captured");
                   }});
}
