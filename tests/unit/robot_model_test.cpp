#include "internal/model/robot.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using fleet::model::CapabilityDescriptor;
using fleet::model::CapabilityType;
using fleet::model::RobotCapability;
using fleet::model::RobotInfo;
using fleet::model::RobotStatus;

void TestVersionConstraints() {
  using fleet::model::SatisfiesVersion;

  assert(SatisfiesVersion("1.10", ">=1.2"));
  assert(!SatisfiesVersion("1.1", ">=1.2"));
  assert(SatisfiesVersion("2.0", ">1.9.9"));
  assert(SatisfiesVersion("1.9", "<2"));
  assert(!SatisfiesVersion("2.0.0", "<2"));
  assert(SatisfiesVersion("3", "<=3.0"));

  // bare version is an exact match, shorter side padded with zeros
  assert(SatisfiesVersion("1.2.0", "1.2"));
  assert(!SatisfiesVersion("1.2.1", "1.2"));

  // non-numeric versions fall back to string equality
  assert(SatisfiesVersion("latest", "latest"));
  assert(!SatisfiesVersion("latest", ">=1.0"));

  // a component too wide for long is not numeric
  assert(!SatisfiesVersion("99999999999999999999999.1", ">=1.0"));
  assert(SatisfiesVersion("99999999999999999999999.1", "99999999999999999999999.1"));
}

void TestCapabilityMapExpansion() {
  RobotInfo robot;
  robot.capabilities["browser"]         = CapabilityDescriptor{"chrome", "120.0"};
  robot.capabilities["ocr"]             = true;
  robot.capabilities["gpu"]             = false;
  robot.capabilities["office"]          = std::string("2019");
  robot.capabilities["memory_total_gb"] = 32.0;

  const auto caps = robot.Capabilities();
  assert(caps.size() == 3);

  bool saw_chrome = false;
  bool saw_ocr    = false;
  bool saw_office = false;
  for (const auto& cap : caps) {
    if (cap.type == CapabilityType::kBrowser) {
      saw_chrome = cap.name == "chrome" && cap.version == "120.0";
    } else if (cap.type == CapabilityType::kOcr) {
      saw_ocr = cap.name == "ocr";
    } else if (cap.type == CapabilityType::kOffice) {
      saw_office = cap.version == "2019";
    }
  }
  assert(saw_chrome && saw_ocr && saw_office);

  assert(robot.NumericResource(fleet::model::kMemoryTotalGb) == 32.0);
  assert(robot.NumericResource(fleet::model::kCpuCount) == 0.0);
  assert(robot.NumericResource("ocr") == 0.0);
}

void TestCapabilityMatching() {
  RobotCapability offered{CapabilityType::kBrowser, "Chrome", "120.0", std::nullopt};

  RobotCapability required{CapabilityType::kBrowser, "chrome", "", ">=100"};
  assert(fleet::model::Matches(offered, required));

  required.version_constraint = ">=121";
  assert(!fleet::model::Matches(offered, required));

  required.version_constraint.reset();
  assert(fleet::model::Matches(offered, required));

  required.type = CapabilityType::kDesktop;
  assert(!fleet::model::Matches(offered, required));

  assert(required.Label() == "desktop:chrome");

  // no advertised version: the constraint is not checked
  RobotCapability unversioned{CapabilityType::kDesktop, "excel", "", std::nullopt};
  RobotCapability wants_excel{CapabilityType::kDesktop, "excel", "", ">=1.0"};
  assert(fleet::model::Matches(unversioned, wants_excel));
}

void TestAvailabilityAndUtilization() {
  RobotInfo robot;
  robot.max_concurrent_jobs = 4;
  robot.current_jobs        = 1;
  assert(robot.IsAvailable());
  assert(robot.Utilization() == 25.0);

  robot.current_jobs = 4;
  assert(!robot.IsAvailable());

  robot.current_jobs = 0;
  robot.status       = RobotStatus::kMaintenance;
  assert(!robot.IsAvailable());

  robot.max_concurrent_jobs = 0;
  assert(robot.Utilization() == 100.0);
}

void TestStatusAndTypeParsing() {
  assert(fleet::model::ParseRobotStatus("ONLINE") == RobotStatus::kOnline);
  assert(fleet::model::ParseRobotStatus("busy") == RobotStatus::kBusy);
  assert(fleet::model::ParseRobotStatus("bogus") == RobotStatus::kError);

  assert(fleet::model::ParseCapabilityType("AI_ML") == CapabilityType::kAiMl);
  assert(fleet::model::ParseCapabilityType("sap") == CapabilityType::kCustom);
  assert(fleet::model::ToString(CapabilityType::kSecureEnclave) == "secure_enclave");
}

} // namespace

int main() {
  TestVersionConstraints();
  TestCapabilityMapExpansion();
  TestCapabilityMatching();
  TestAvailabilityAndUtilization();
  TestStatusAndTypeParsing();

  std::cout << "fleet_unit_robot_model: pass\n";
  return 0;
}
