#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/calendar/business_calendar.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduling/cron_expression.hpp"
#include "internal/util/time.hpp"

using namespace fleet;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fleetctl validate <config.yaml>\n"
            << "  fleetctl cron <expression> [count] [utc_offset_minutes]\n"
            << "  fleetctl aliases\n"
            << "  fleetctl calendar <us|uk|24x7> <year>\n"
            << "  fleetctl upcoming <config.yaml> [limit]\n"
            << "  fleetctl dependencies <config.yaml>\n";
}

static std::optional<calendar::BusinessCalendar> PresetCalendar(const std::string& name) {
  if (name == "us") return calendar::BusinessCalendar::CreateUsCalendar();
  if (name == "uk") return calendar::BusinessCalendar::CreateUkCalendar();
  if (name == "24x7") return calendar::BusinessCalendar::Create24x7Calendar();
  return std::nullopt;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  std::string cmd = argv[1];

  try {
    // command output goes to stdout; keep runtime logs out of it
    const char* env_level = std::getenv("FLEET_LOG_LEVEL");
    observability::SetLogLevel(env_level && *env_level ? env_level : "warn");

    // ------------------------------------------------------------

    if (cmd == "validate") {
      if (argc < 3) return 1;

      auto config = config::ConfigLoader::LoadFromYaml(argv[2]);
      auto app    = factory::Build(config);

      const auto deps = app.scheduler->ValidateDependencyGraph();
      if (!deps.valid) {
        std::cerr << "dependency cycle:";
        for (const auto& id : deps.cycle) std::cerr << " " << id;
        std::cerr << "\n";
        return 2;
      }

      std::cout << "robots=" << config.robots_size() << "\n";
      std::cout << "calendars=" << config.calendars_size() << "\n";
      std::cout << "schedules=" << app.scheduler->GetAllSchedules().size() << "\n";
      std::cout << "ok\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cron") {
      if (argc < 3) return 1;

      const auto expr   = scheduling::CronExpression::Parse(argv[2]);
      const int  count  = argc >= 4 ? std::atoi(argv[3]) : 5;
      const auto offset = std::chrono::minutes{argc >= 5 ? std::atoi(argv[4]) : 0};

      std::cout << "canonical=" << expr.canonical() << "\n";
      std::cout << "description=" << expr.Describe() << "\n";

      auto cursor = util::Now();
      for (int i = 0; i < count; ++i) {
        auto next = expr.NextAfter(cursor, offset);
        if (!next) break;
        std::cout << util::FormatTimestamp(*next, offset) << "\n";
        cursor = *next;
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "aliases") {
      for (const auto& alias : scheduling::CronExpression::Aliases()) {
        std::cout << alias.name << "\t" << alias.expression << "\t" << alias.description << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "calendar") {
      if (argc < 4) return 1;

      auto cal = PresetCalendar(argv[2]);
      if (!cal) {
        std::cerr << "unknown calendar preset: " << argv[2] << "\n";
        return 1;
      }
      for (const auto& [date, name] : cal->GetHolidaysForYear(std::atoi(argv[3]))) {
        std::cout << util::FormatDate(date) << "\t" << name << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "upcoming") {
      if (argc < 3) return 1;

      auto         config = config::ConfigLoader::LoadFromYaml(argv[2]);
      auto         app    = factory::Build(config);
      const size_t limit  = argc >= 4 ? static_cast<size_t>(std::atoi(argv[3])) : 20;

      for (const auto& run : app.scheduler->GetUpcomingRuns(limit)) {
        std::cout << util::FormatTimestamp(run.next_run) << "\t" << run.schedule_id << "\t" << run.workflow_id << "\t"
                  << scheduling::ToString(run.type) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "dependencies") {
      if (argc < 3) return 1;

      auto config = config::ConfigLoader::LoadFromYaml(argv[2]);
      auto app    = factory::Build(config);

      for (const auto& [dependency, dependents] : app.scheduler->GetDependencyGraph()) {
        std::cout << dependency << " ->";
        for (const auto& id : dependents) std::cout << " " << id;
        std::cout << "\n";
      }
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
