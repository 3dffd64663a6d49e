#include "robot.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <sstream>

namespace fleet::model {
namespace {

struct CapabilityName {
  CapabilityType   type;
  std::string_view name;
};

constexpr std::array<CapabilityName, 11> kCapabilityNames = {{
    {CapabilityType::kBrowser, "browser"},
    {CapabilityType::kDesktop, "desktop"},
    {CapabilityType::kOffice, "office"},
    {CapabilityType::kDatabase, "database"},
    {CapabilityType::kOcr, "ocr"},
    {CapabilityType::kAiMl, "ai_ml"},
    {CapabilityType::kHighMemory, "high_memory"},
    {CapabilityType::kHighCpu, "high_cpu"},
    {CapabilityType::kGpu, "gpu"},
    {CapabilityType::kSecureEnclave, "secure_enclave"},
    {CapabilityType::kCustom, "custom"},
}};

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<std::vector<long>> ParseVersion(const std::string& version) {
  if (version.empty()) return std::nullopt;

  std::vector<long>  parts;
  std::istringstream in(version);
  std::string        part;
  while (std::getline(in, part, '.')) {
    if (part.empty() || !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
      return std::nullopt;
    }
    long value = 0;
    const auto [end, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc() || end != part.data() + part.size()) return std::nullopt;
    parts.push_back(value);
  }
  return parts;
}

// -1, 0, 1; shorter versions are padded with zeros.
int CompareVersions(std::vector<long> a, std::vector<long> b) {
  const auto width = std::max(a.size(), b.size());
  a.resize(width, 0);
  b.resize(width, 0);
  for (size_t i = 0; i < width; ++i) {
    if (a[i] < b[i]) return -1;
    if (a[i] > b[i]) return 1;
  }
  return 0;
}

} // namespace

RobotStatus ParseRobotStatus(std::string_view value) {
  const auto lower = ToLower(value);
  if (lower == "online") return RobotStatus::kOnline;
  if (lower == "busy") return RobotStatus::kBusy;
  if (lower == "offline") return RobotStatus::kOffline;
  if (lower == "maintenance") return RobotStatus::kMaintenance;
  return RobotStatus::kError;
}

std::string_view ToString(CapabilityType type) {
  for (const auto& entry : kCapabilityNames) {
    if (entry.type == type) return entry.name;
  }
  return "custom";
}

CapabilityType ParseCapabilityType(std::string_view value) {
  const auto lower = ToLower(value);
  for (const auto& entry : kCapabilityNames) {
    if (entry.name == lower) return entry.type;
  }
  return CapabilityType::kCustom;
}

std::string RobotCapability::Label() const {
  return std::string(ToString(type)) + ":" + name;
}

bool SatisfiesVersion(const std::string& have, const std::string& constraint) {
  std::string op;
  std::string wanted = constraint;
  for (std::string_view prefix : {">=", "<=", ">", "<"}) {
    if (constraint.rfind(prefix, 0) == 0) {
      op     = prefix;
      wanted = constraint.substr(prefix.size());
      break;
    }
  }
  wanted.erase(0, wanted.find_first_not_of(' '));

  const auto have_parts   = ParseVersion(have);
  const auto wanted_parts = ParseVersion(wanted);
  if (!have_parts || !wanted_parts) {
    return have == wanted;
  }

  const int cmp = CompareVersions(*have_parts, *wanted_parts);
  if (op == ">=") return cmp >= 0;
  if (op == ">") return cmp > 0;
  if (op == "<=") return cmp <= 0;
  if (op == "<") return cmp < 0;
  return cmp == 0;
}

bool Matches(const RobotCapability& offered, const RobotCapability& required) {
  if (offered.type != required.type) return false;
  if (ToLower(offered.name) != ToLower(required.name)) return false;
  if (!required.version_constraint || required.version_constraint->empty()) return true;
  // an unversioned capability satisfies any constraint
  if (offered.version.empty()) return true;
  return SatisfiesVersion(offered.version, *required.version_constraint);
}

double RobotInfo::Utilization() const {
  if (max_concurrent_jobs <= 0) return 100.0;
  return static_cast<double>(current_jobs) / static_cast<double>(max_concurrent_jobs) * 100.0;
}

bool RobotInfo::HasTag(const std::string& tag) const {
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::vector<RobotCapability> RobotInfo::Capabilities() const {
  std::vector<RobotCapability> out;
  for (const auto& [key, value] : capabilities) {
    RobotCapability cap;
    cap.type = ParseCapabilityType(key);

    if (const auto* descriptor = std::get_if<CapabilityDescriptor>(&value)) {
      cap.name    = descriptor->name.empty() ? key : descriptor->name;
      cap.version = descriptor->version;
    } else if (const auto* flag = std::get_if<bool>(&value)) {
      if (!*flag) continue;
      cap.name = key;
    } else if (const auto* version = std::get_if<std::string>(&value)) {
      cap.name    = key;
      cap.version = *version;
    } else {
      // numeric resources are not capabilities
      continue;
    }
    out.push_back(std::move(cap));
  }
  return out;
}

double RobotInfo::NumericResource(std::string_view key) const {
  auto it = capabilities.find(std::string(key));
  if (it == capabilities.end()) return 0.0;
  if (const auto* number = std::get_if<double>(&it->second)) return *number;
  return 0.0;
}

RobotInfo Snapshot(const RobotPresence& presence) {
  RobotInfo info;
  info.id                  = presence.Id();
  info.name                = presence.Name();
  info.status              = presence.Status();
  info.cpu_percent         = presence.CpuPercent();
  info.memory_percent      = presence.MemoryPercent();
  info.current_jobs        = presence.CurrentJobs();
  info.max_concurrent_jobs = presence.MaxConcurrentJobs();
  info.tags                = presence.Tags();
  info.environment         = presence.Environment();
  info.capabilities        = presence.Capabilities();
  info.network_zone        = presence.NetworkZone();
  return info;
}

} // namespace fleet::model
