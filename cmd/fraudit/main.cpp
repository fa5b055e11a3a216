#include <spdlog/fmt/fmt.h>

#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/detection/orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/work/cancellation.hpp"

using fraudit::detection::RunSummary;
using fraudit::observability::StringField;

static fraudit::work::CancellationToken g_cancel;

void HandleSignal(int) {
  g_cancel.Cancel();
}

static void Usage() {
  std::cerr << "Usage: fraudit --config <config.yaml> [--rule <name>]\n"
            << "Rules: contract-splitting, vendor-clustering, network-analysis, employee-vendor,\n"
            << "       related-party, debarment (sam-exclusions), fiscal-year-rush, ghost-vendors\n";
}

static void PrintSummary(const RunSummary& summary) {
  std::cout << fmt::format("{:<20} {:<9} {:>7} {:>9}  {}\n", "RULE", "STATUS", "ALERTS", "SECONDS", "DETAIL");
  for (const auto& task : summary.tasks) {
    std::cout << fmt::format("{:<20} {:<9} {:>7} {:>9.2f}  {}\n", task.rule_name, fraudit::detection::ToString(task.status),
                             task.alert_count, task.Seconds(), task.error);
  }
  std::cout << fmt::format("\n{} alerts, {} succeeded, {} failed, {} cancelled\n", summary.total_alerts, summary.succeeded,
                           summary.failed, summary.cancelled);
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string rule;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--rule" && i + 1 < argc) {
      rule = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      Usage();
      return 0;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fraudit::config::ConfigLoader::LoadFromYaml(config_path);

    fraudit::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = fraudit::factory::BuildRuntime(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Run detection
    // ------------------------------------------------------------
    auto summary = rule.empty() ? runtime.orchestrator->RunAll(&g_cancel) : runtime.orchestrator->RunRule(rule);

    PrintSummary(summary);
    fraudit::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FRAUDIT_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    fraudit::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
