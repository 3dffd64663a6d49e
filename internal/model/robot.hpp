#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fleet::model {

enum class RobotStatus : std::uint8_t {
  kOnline      = 0,
  kBusy        = 1,
  kOffline     = 2,
  kMaintenance = 3,
  kError       = 4,
};

constexpr std::string_view ToString(RobotStatus status) {
  switch (status) {
    case RobotStatus::kOnline:
      return "online";
    case RobotStatus::kBusy:
      return "busy";
    case RobotStatus::kOffline:
      return "offline";
    case RobotStatus::kMaintenance:
      return "maintenance";
    case RobotStatus::kError:
    default:
      return "error";
  }
}

RobotStatus ParseRobotStatus(std::string_view value);

enum class CapabilityType : std::uint8_t {
  kBrowser       = 0,
  kDesktop       = 1,
  kOffice        = 2,
  kDatabase      = 3,
  kOcr           = 4,
  kAiMl          = 5,
  kHighMemory    = 6,
  kHighCpu       = 7,
  kGpu           = 8,
  kSecureEnclave = 9,
  kCustom        = 10,
};

std::string_view ToString(CapabilityType type);

// Case-insensitive; unknown names map to kCustom.
CapabilityType ParseCapabilityType(std::string_view value);

/*
  A capability offered by a robot, or demanded by a job.

  For a requirement, version_constraint may carry ">=1.2", ">1", "<=3",
  "<3" or a bare version (exact match). No constraint matches any version.
*/
struct RobotCapability {
  CapabilityType             type{CapabilityType::kCustom};
  std::string                name;
  std::string                version;
  std::optional<std::string> version_constraint;

  // "type:name", used in error messages and logs.
  std::string Label() const;
};

// Version comparison with optional operator prefix. Falls back to string
// equality when either side is not a dotted integer version.
bool SatisfiesVersion(const std::string& have, const std::string& constraint);

bool Matches(const RobotCapability& offered, const RobotCapability& required);

struct CapabilityDescriptor {
  std::string name;
  std::string version;
};

// bool: present under the key's name. string: version. double: numeric
// resource such as memory_total_gb or cpu_count.
using CapabilityValue = std::variant<bool, double, std::string, CapabilityDescriptor>;
using CapabilityMap   = std::map<std::string, CapabilityValue>;

constexpr std::string_view kMemoryTotalGb = "memory_total_gb";
constexpr std::string_view kCpuCount      = "cpu_count";

/*
  Snapshot of one worker at decision time. Supplied fresh on every call
  and never mutated by the engines.
*/
struct RobotInfo {
  std::string              id;
  std::string              name;
  RobotStatus              status{RobotStatus::kOnline};
  double                   cpu_percent{0.0};
  double                   memory_percent{0.0};
  int                      current_jobs{0};
  int                      max_concurrent_jobs{1};
  std::vector<std::string> tags;
  std::string              environment{"default"};
  CapabilityMap            capabilities;
  std::string              network_zone;

  bool IsAvailable() const {
    return status == RobotStatus::kOnline && current_jobs < max_concurrent_jobs;
  }

  // Job slot utilisation in percent; 100 when the robot accepts no jobs.
  double Utilization() const;

  bool HasTag(const std::string& tag) const;

  std::vector<RobotCapability> Capabilities() const;

  // Numeric entry of the capabilities map, 0 when absent.
  double NumericResource(std::string_view key) const;
};

/*
  Typed adapter seam for fleet-metrics sources. Implementations expose the
  live values; Snapshot() freezes them into a RobotInfo.
*/
class RobotPresence {
 public:
  virtual ~RobotPresence() = default;

  virtual std::string   Id() const              = 0;
  virtual std::string   Name() const            = 0;
  virtual RobotStatus   Status() const          = 0;
  virtual double        CpuPercent() const      = 0;
  virtual double        MemoryPercent() const   = 0;
  virtual int           CurrentJobs() const     = 0;
  virtual int           MaxConcurrentJobs() const = 0;
  virtual std::vector<std::string> Tags() const = 0;
  virtual std::string   Environment() const     = 0;
  virtual CapabilityMap Capabilities() const    = 0;
  virtual std::string   NetworkZone() const     = 0;
};

RobotInfo Snapshot(const RobotPresence& presence);

} // namespace fleet::model
